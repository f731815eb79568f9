#include <servherd/app/log_reader.h>
#include <servherd/common/time_parser.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <thread>

namespace servherd::app {

namespace fs = std::filesystem;

Result<std::vector<std::string>> readLogLines(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::IOError, "Cannot open log file " + path.string()};
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::optional<std::chrono::system_clock::time_point> parseLogTimestamp(const std::string& line) {
    auto pos = line.find(": ");
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return common::TimeParser::parseISO8601(line.substr(0, pos));
}

std::vector<std::string> filterLogsByTime(const std::vector<std::string>& lines,
                                          std::chrono::system_clock::time_point since) {
    std::vector<std::string> out;
    std::copy_if(lines.begin(), lines.end(), std::back_inserter(out), [&](const auto& line) {
        auto ts = parseLogTimestamp(line);
        return !ts || *ts >= since;
    });
    return out;
}

std::vector<std::string> selectLines(const std::vector<std::string>& lines,
                                     std::optional<std::size_t> head, std::size_t tail) {
    if (head) {
        auto n = std::min(*head, lines.size());
        return {lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(n)};
    }
    auto n = std::min(tail, lines.size());
    return {lines.end() - static_cast<std::ptrdiff_t>(n), lines.end()};
}

void followLog(const fs::path& path, std::stop_token token,
               const std::function<void(const std::string&)>& onLine,
               std::chrono::milliseconds pollInterval) {
    std::error_code ec;
    std::uintmax_t position = fs::exists(path, ec) ? fs::file_size(path, ec) : 0;
    if (ec) {
        position = 0;
    }
    std::string partial;

    while (!token.stop_requested()) {
        std::this_thread::sleep_for(pollInterval);
        if (token.stop_requested()) {
            break;
        }

        auto size = fs::file_size(path, ec);
        if (ec) {
            // Not created yet, or rotated away
            continue;
        }
        if (size < position) {
            spdlog::debug("{} was truncated, following from the start", path.string());
            position = 0;
            partial.clear();
        }
        if (size == position) {
            continue;
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            continue;
        }
        in.seekg(static_cast<std::streamoff>(position));
        std::string chunk(static_cast<std::size_t>(size - position), '\0');
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        chunk.resize(static_cast<std::size_t>(in.gcount()));
        position += chunk.size();

        partial += chunk;
        std::size_t start = 0;
        for (auto nl = partial.find('\n'); nl != std::string::npos;
             nl = partial.find('\n', start)) {
            std::string line = partial.substr(start, nl - start);
            start = nl + 1;
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                onLine(line);
            }
        }
        partial.erase(0, start);
    }
}

} // namespace servherd::app
