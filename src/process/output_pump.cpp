#include <servherd/config/config_helpers.h>
#include <servherd/process/output_pump.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace servherd::process {

namespace {

void writeAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        auto n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            spdlog::debug("Output write failed on fd {}: {}", fd, std::strerror(errno));
            return;
        }
        off += static_cast<size_t>(n);
    }
}

} // namespace

OutputPump::OutputPump(Options options) : options_(std::move(options)) {
    logFd_ = ::open(options_.logPath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (logFd_ < 0) {
        spdlog::warn("Failed to open log file {}: {}", options_.logPath.string(),
                     std::strerror(errno));
    }
    thread_ = std::jthread([this](std::stop_token tok) { run(tok); });
}

OutputPump::~OutputPump() {
    stop();
    if (options_.readFd >= 0) {
        ::close(options_.readFd);
    }
    if (logFd_ >= 0) {
        ::close(logFd_);
    }
}

void OutputPump::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void OutputPump::emitLine(const std::string& line) {
    if (logFd_ >= 0) {
        writeAll(logFd_, config::iso_timestamp_now() + ": " + line + "\n");
    }
    if (options_.forwardFd) {
        writeAll(*options_.forwardFd, "[" + options_.prefix + "] " + line + "\n");
    }
}

void OutputPump::run(std::stop_token token) {
    std::array<char, 4096> buffer{};
    std::string pending;

    auto drainLines = [&]() {
        size_t pos = 0;
        while ((pos = pending.find('\n')) != std::string::npos) {
            auto line = pending.substr(0, pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            emitLine(line);
            pending.erase(0, pos + 1);
        }
    };

    bool stopping = false;
    while (true) {
        if (token.stop_requested()) {
            stopping = true;
        }
        pollfd pfd{options_.readFd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, stopping ? 0 : 100);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            spdlog::debug("poll on output pipe failed: {}", std::strerror(errno));
            break;
        }
        if (rc == 0) {
            if (stopping)
                break;
            continue;
        }
        auto n = ::read(options_.readFd, buffer.data(), buffer.size());
        if (n > 0) {
            pending.append(buffer.data(), static_cast<size_t>(n));
            drainLines();
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        // EOF: every writer closed the pipe
        break;
    }
    if (!pending.empty()) {
        emitLine(pending);
    }
}

} // namespace servherd::process
