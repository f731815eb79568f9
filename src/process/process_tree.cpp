#include <servherd/process/process_tree.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace servherd::process {

namespace fs = std::filesystem;

namespace {

// Fields of /proc/<pid>/stat after the parenthesised comm, starting at "state"
std::optional<std::vector<std::string>> readStatFields(pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    auto close = line.rfind(')');
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream rest(line.substr(close + 1));
    std::vector<std::string> fields;
    std::string tok;
    while (rest >> tok) {
        fields.push_back(tok);
    }
    return fields;
}

std::multimap<pid_t, pid_t> snapshotParentMap() {
    std::multimap<pid_t, pid_t> children;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                             [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        const auto pid = static_cast<pid_t>(std::stol(name));
        auto fields = readStatFields(pid);
        if (!fields || fields->size() < 2) {
            continue;
        }
        children.emplace(static_cast<pid_t>(std::stol((*fields)[1])), pid);
    }
    if (ec) {
        spdlog::warn("Failed to scan /proc: {}", ec.message());
    }
    return children;
}

void signalOne(pid_t pid, int signal, const char* role) {
    if (::kill(pid, signal) == 0) {
        spdlog::debug("Sent signal {} to {} process {}", signal, role, pid);
        return;
    }
    if (errno != ESRCH) {
        spdlog::warn("Failed to signal {} process {}: {}", role, pid, std::strerror(errno));
    }
}

} // namespace

std::vector<pid_t> listDescendants(pid_t root) {
    const auto children = snapshotParentMap();
    std::vector<pid_t> out;
    std::deque<pid_t> queue{root};
    while (!queue.empty()) {
        const auto parent = queue.front();
        queue.pop_front();
        auto [lo, hi] = children.equal_range(parent);
        for (auto it = lo; it != hi; ++it) {
            out.push_back(it->second);
            queue.push_back(it->second);
        }
    }
    return out;
}

void killProcessTree(pid_t root, int signal) {
    if (root <= 0) {
        spdlog::warn("Refusing to signal invalid pid {}", root);
        return;
    }
    auto descendants = listDescendants(root);
    for (auto it = descendants.rbegin(); it != descendants.rend(); ++it) {
        signalOne(*it, signal, "child");
    }
    signalOne(root, signal, "main");
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == -1 && errno == ESRCH) {
        return false;
    }
    // Zombies still accept signal 0
    auto fields = readStatFields(pid);
    return !(fields && !fields->empty() && (*fields)[0] == "Z");
}

bool waitUntilGone(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isProcessAlive(pid)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return !isProcessAlive(pid);
}

bool terminateProcessTree(pid_t root, std::chrono::milliseconds grace, const ExitWaiter& waiter) {
    killProcessTree(root, SIGTERM);
    if (waiter(grace)) {
        return true;
    }
    spdlog::warn("Process {} did not exit gracefully, sending SIGKILL", root);
    killProcessTree(root, SIGKILL);
    (void)waiter(std::chrono::seconds{1});
    return false;
}

std::optional<ProcessStats> readProcessStats(pid_t pid) {
    auto fields = readStatFields(pid);
    // utime=11, stime=12, starttime=19, rss=21 relative to "state"
    if (!fields || fields->size() < 22) {
        return std::nullopt;
    }
    const double hz = static_cast<double>(::sysconf(_SC_CLK_TCK));
    const double pageSize = static_cast<double>(::sysconf(_SC_PAGESIZE));

    double uptime = 0.0;
    {
        std::ifstream in("/proc/uptime");
        if (!(in >> uptime)) {
            return std::nullopt;
        }
    }

    ProcessStats stats;
    try {
        const double busy = (std::stod((*fields)[11]) + std::stod((*fields)[12])) / hz;
        const double started = std::stod((*fields)[19]) / hz;
        const double elapsed = uptime - started;
        if (elapsed > 0) {
            stats.cpuPercent = 100.0 * busy / elapsed;
        }
        stats.memoryBytes = static_cast<std::uint64_t>(std::stod((*fields)[21]) * pageSize);
    } catch (const std::exception& e) {
        spdlog::debug("Unparseable /proc/{}/stat: {}", pid, e.what());
        return std::nullopt;
    }
    return stats;
}

} // namespace servherd::process
