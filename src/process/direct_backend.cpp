#include <servherd/config/config_helpers.h>
#include <servherd/process/direct_backend.h>
#include <servherd/process/output_pump.h>
#include <servherd/process/process_tree.h>
#include <servherd/process/spawn.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace servherd::process {

namespace fs = std::filesystem;

namespace {

std::atomic<DirectBackend*> gTerminateTarget{nullptr};

std::int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string fileStamp() {
    auto stamp = config::iso_timestamp_now();
    std::replace(stamp.begin(), stamp.end(), ':', '-');
    std::replace(stamp.begin(), stamp.end(), '.', '-');
    return stamp;
}

bool truncateLog(const std::optional<fs::path>& path) {
    if (!path) {
        return true;
    }
    std::error_code ec;
    if (!fs::exists(*path, ec)) {
        return true;
    }
    fs::resize_file(*path, 0, ec);
    if (ec) {
        spdlog::warn("Failed to truncate {}: {}", path->string(), ec.message());
        return false;
    }
    return true;
}

} // namespace

struct DirectBackend::Child {
    StartSpec spec;
    pid_t pid{-1};
    std::int64_t startedAtMs{0};
    int restartCount{0};
    bool exited{true};
    bool stoppedByRequest{false};
    std::optional<int> exitCode;
    std::optional<fs::path> outLog;
    std::optional<fs::path> errLog;
    std::unique_ptr<OutputPump> outPump;
    std::unique_ptr<OutputPump> errPump;
};

DirectBackend::DirectBackend() : DirectBackend(Options{config::get_direct_log_dir()}) {}

DirectBackend::DirectBackend(Options options) : options_(std::move(options)) {
    if (options_.logDir.empty()) {
        options_.logDir = config::get_direct_log_dir();
    }
}

DirectBackend::~DirectBackend() {
    shutdown();
    if (signalThread_.joinable()) {
        signalThread_.request_stop();
        signalThread_.join();
    }
    DirectBackend* self = this;
    gTerminateTarget.compare_exchange_strong(self, nullptr);
}

Result<void> DirectBackend::connect() {
    return Result<void>();
}

void DirectBackend::disconnect() {}

void DirectBackend::installSignalHandling() {
    std::call_once(handlersOnce_, [this]() {
        if (!options_.handleSignals) {
            return;
        }
        // Blocked here so the dedicated thread (and threads started later) receive them
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
        ::signal(SIGPIPE, SIG_IGN);

        gTerminateTarget.store(this);
        std::set_terminate([]() noexcept {
            spdlog::critical("std::terminate called, cleaning up direct children");
            if (auto* target = gTerminateTarget.load()) {
                target->shutdown();
            }
            std::_Exit(1);
        });

        signalThread_ = std::jthread([this](std::stop_token tok) { signalLoop(tok); });
        spdlog::debug("Cleanup handlers registered for direct process management");
    });
}

void DirectBackend::signalLoop(std::stop_token token) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    const timespec tick{0, 200 * 1000 * 1000};

    while (!token.stop_requested()) {
        int sig = ::sigtimedwait(&set, nullptr, &tick);
        if (sig < 0) {
            continue;
        }
        spdlog::info("Received signal {}, cleaning up {} direct process(es)", sig, count());
        shutdown();
        spdlog::default_logger()->flush();
        std::_Exit(128 + sig);
    }
}

Result<void> DirectBackend::launch(Child& child) {
    std::error_code ec;
    fs::create_directories(options_.logDir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to create log directory " +
                                             options_.logDir.string() + ": " + ec.message()};
    }

    auto spawned = spawnChild(child.spec, options_.newSession);
    if (!spawned) {
        return spawned.error();
    }

    const auto base =
        options_.timestampedLogs ? child.spec.name + "-" + fileStamp() : child.spec.name;
    child.outLog = options_.logDir / (base + "-out.log");
    child.errLog = options_.logDir / (base + "-err.log");
    child.pid = spawned->pid;
    child.startedAtMs = nowMs();
    child.exited = false;
    child.stoppedByRequest = false;
    child.exitCode.reset();

    OutputPump::Options out{spawned->stdoutFd, *child.outLog, std::nullopt, child.spec.name};
    OutputPump::Options err{spawned->stderrFd, *child.errLog, std::nullopt, child.spec.name};
    if (options_.forwardOutput) {
        out.forwardFd = STDOUT_FILENO;
        err.forwardFd = STDERR_FILENO;
    }
    child.outPump = std::make_unique<OutputPump>(std::move(out));
    child.errPump = std::make_unique<OutputPump>(std::move(err));

    spdlog::info("Started {} (pid={}, cwd={})", child.spec.name, child.pid, child.spec.cwd);
    return Result<void>();
}

void DirectBackend::reap(Child& child) {
    if (child.exited || child.pid <= 0) {
        return;
    }
    int status = 0;
    pid_t r = ::waitpid(child.pid, &status, WNOHANG);
    if (r == child.pid) {
        child.exited = true;
        child.exitCode = exitCodeFromStatus(status);
        spdlog::info("Process {} exited with code {}", child.spec.name, *child.exitCode);
    } else if (r < 0 && errno == ECHILD) {
        child.exited = true;
    }
}

void DirectBackend::terminate(Child& child) {
    reap(child);
    if (!child.exited) {
        spdlog::info("Killing process tree of {} (pid={})", child.spec.name, child.pid);
        terminateProcessTree(child.pid, options_.grace, [&](std::chrono::milliseconds timeout) {
            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                reap(child);
                if (child.exited)
                    return true;
                std::this_thread::sleep_for(std::chrono::milliseconds{10});
            }
            reap(child);
            return child.exited;
        });
    }
    child.outPump.reset();
    child.errPump.reset();
}

Result<void> DirectBackend::start(const StartSpec& spec) {
    if (shutDown_.load()) {
        return Error{ErrorCode::InvalidState, "Direct backend is shutting down"};
    }
    installSignalHandling();

    std::lock_guard lock(mutex_);
    auto& slot = children_[spec.name];
    if (slot) {
        terminate(*slot);
    } else {
        slot = std::make_unique<Child>();
    }
    slot->spec = spec;
    if (auto r = launch(*slot); !r) {
        children_.erase(spec.name);
        return r;
    }
    return Result<void>();
}

Result<void> DirectBackend::stop(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(name);
    if (it == children_.end()) {
        return Error{ErrorCode::ProcessNotFound, "Process " + name + " not found"};
    }
    it->second->stoppedByRequest = true;
    terminate(*it->second);
    return Result<void>();
}

Result<void> DirectBackend::remove(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(name);
    if (it == children_.end()) {
        return Error{ErrorCode::ProcessNotFound, "Process " + name + " not found"};
    }
    it->second->stoppedByRequest = true;
    terminate(*it->second);
    children_.erase(it);
    return Result<void>();
}

Result<void> DirectBackend::restart(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(name);
    if (it == children_.end()) {
        return Error{ErrorCode::ProcessNotFound, "Process " + name + " not found"};
    }
    auto& child = *it->second;
    terminate(child);
    if (auto r = launch(child); !r) {
        return r;
    }
    ++child.restartCount;
    return Result<void>();
}

ProcessDescription DirectBackend::describeLocked(Child& child) {
    reap(child);
    ProcessDescription d;
    d.name = child.spec.name;
    d.restartCount = child.restartCount;
    d.uptimeStartMs = child.startedAtMs;
    if (child.outLog)
        d.outLogPath = child.outLog->string();
    if (child.errLog)
        d.errLogPath = child.errLog->string();

    if (!child.exited) {
        d.status = ServerStatus::Online;
        d.pid = static_cast<int>(child.pid);
        if (auto stats = readProcessStats(child.pid)) {
            d.cpu = stats->cpuPercent;
            d.memory = stats->memoryBytes;
        }
    } else if (child.stoppedByRequest || child.exitCode.value_or(0) == 0) {
        d.status = ServerStatus::Stopped;
    } else {
        d.status = ServerStatus::Errored;
    }
    return d;
}

Result<std::optional<ProcessDescription>> DirectBackend::describe(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(name);
    if (it == children_.end()) {
        return std::optional<ProcessDescription>{};
    }
    return std::optional<ProcessDescription>{describeLocked(*it->second)};
}

Result<void> DirectBackend::flush(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(name);
    if (it == children_.end()) {
        return Error{ErrorCode::ProcessNotFound, "Process " + name + " not found"};
    }
    if (!truncateLog(it->second->outLog) || !truncateLog(it->second->errLog)) {
        return Error{ErrorCode::IOError, "Failed to flush logs for " + name};
    }
    spdlog::info("Logs flushed for {}", name);
    return Result<void>();
}

Result<void> DirectBackend::flushAll() {
    std::lock_guard lock(mutex_);
    bool ok = true;
    for (auto& [name, child] : children_) {
        ok = truncateLog(child->outLog) && ok;
        ok = truncateLog(child->errLog) && ok;
    }
    if (!ok) {
        return Error{ErrorCode::IOError, "Failed to flush some direct process logs"};
    }
    return Result<void>();
}

Result<std::vector<ProcessDescription>> DirectBackend::list() {
    std::lock_guard lock(mutex_);
    std::vector<ProcessDescription> out;
    out.reserve(children_.size());
    for (auto& [name, child] : children_) {
        out.push_back(describeLocked(*child));
    }
    return out;
}

void DirectBackend::shutdown() {
    std::call_once(shutdownOnce_, [this]() {
        shutDown_.store(true);
        std::lock_guard lock(mutex_);

        // TERM every tree first so the grace periods overlap
        std::vector<Child*> running;
        for (auto& [name, child] : children_) {
            reap(*child);
            if (!child->exited) {
                child->stoppedByRequest = true;
                killProcessTree(child->pid, SIGTERM);
                running.push_back(child.get());
            }
        }
        if (!running.empty()) {
            spdlog::info("Stopping {} direct process(es)", running.size());
        }

        const auto deadline = std::chrono::steady_clock::now() + options_.grace;
        while (std::chrono::steady_clock::now() < deadline) {
            bool anyAlive = false;
            for (auto* child : running) {
                reap(*child);
                anyAlive = anyAlive || !child->exited;
            }
            if (!anyAlive)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
        for (auto* child : running) {
            reap(*child);
            if (!child->exited) {
                spdlog::warn("{} did not exit gracefully, sending SIGKILL", child->spec.name);
                killProcessTree(child->pid, SIGKILL);
                (void)waitUntilGone(child->pid, std::chrono::seconds{1});
                reap(*child);
            }
        }
        for (auto& [name, child] : children_) {
            child->outPump.reset();
            child->errPump.reset();
        }
    });
}

void DirectBackend::waitForChildren(std::stop_token token) {
    while (!token.stop_requested()) {
        {
            std::lock_guard lock(mutex_);
            bool anyAlive = false;
            for (auto& [name, child] : children_) {
                reap(*child);
                anyAlive = anyAlive || !child->exited;
            }
            if (!anyAlive) {
                return;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }
}

std::size_t DirectBackend::count() const {
    std::lock_guard lock(mutex_);
    return children_.size();
}

bool DirectBackend::has(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return children_.count(name) > 0;
}

} // namespace servherd::process
