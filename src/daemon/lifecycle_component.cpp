#include <servherd/daemon/daemon.h>
#include <servherd/daemon/lifecycle_component.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

namespace servherd::daemon {

std::atomic<LifecycleComponent*> LifecycleComponent::instance_{nullptr};

LifecycleComponent::LifecycleComponent(ServherdDaemon* daemon, std::filesystem::path pidFile)
    : daemon_(daemon), pidFile_(std::move(pidFile)) {}

LifecycleComponent::~LifecycleComponent() {
    shutdown();
}

Result<void> LifecycleComponent::initialize() {
    if (isAnotherInstanceRunning()) {
        return Error{ErrorCode::InvalidState,
                     "Another daemon instance is already running, check PID file: " +
                         pidFile_.string()};
    }

    if (auto result = createPidFile(); !result) {
        return result;
    }

    setupSignalHandlers();
    return Result<void>();
}

void LifecycleComponent::shutdown() {
    cleanupSignalHandlers();
    if (pidFileFd_ != -1) {
        if (auto r = removePidFile(); !r) {
            spdlog::warn("{}", r.error().message);
        }
        ::close(pidFileFd_);
        pidFileFd_ = -1;
    }
}

bool LifecycleComponent::isAnotherInstanceRunning() const {
    std::error_code ec;
    if (!std::filesystem::exists(pidFile_, ec)) {
        return false;
    }

    int fd = ::open(pidFile_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return false;
    }

    // Try to get an advisory lock without blocking.
    // If we can't get it, another process is holding it.
    if (::flock(fd, LOCK_SH | LOCK_NB) == -1 && errno == EWOULDBLOCK) {
        ::close(fd);
        return true;
    }
    ::flock(fd, LOCK_UN);
    ::close(fd);

    pid_t pid = 0;
    if (readPidFromFile(pid) && pid != ::getpid()) {
        if (::kill(pid, 0) == 0) {
            return true;
        }
        if (errno == EPERM) {
            spdlog::warn("PID {} appears to be running but is owned by another user (EPERM)."
                         " Leaving PID file in place.",
                         pid);
            return true;
        }
    }

    spdlog::warn("Found stale PID file for a non-existent process. Removing it.");
    if (auto r = removePidFile(); !r) {
        spdlog::warn("{}", r.error().message);
    }
    return false;
}

Result<void> LifecycleComponent::createPidFile() {
    std::error_code ec;
    std::filesystem::create_directories(pidFile_.parent_path(), ec);

    pidFileFd_ = ::open(pidFile_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (pidFileFd_ == -1) {
        return Error{ErrorCode::IOError,
                     "Failed to open PID file: " + std::string(std::strerror(errno))};
    }

    if (::flock(pidFileFd_, LOCK_EX | LOCK_NB) == -1) {
        ::close(pidFileFd_);
        pidFileFd_ = -1;
        return Error{ErrorCode::InvalidState, "Daemon already running (PID file is locked)."};
    }

    std::string pid_str = std::to_string(::getpid());
    if (::ftruncate(pidFileFd_, 0) != 0 ||
        ::write(pidFileFd_, pid_str.c_str(), pid_str.length()) !=
            static_cast<ssize_t>(pid_str.length())) {
        int e = errno;
        ::close(pidFileFd_);
        pidFileFd_ = -1;
        return Error{ErrorCode::IOError, "Failed to write to PID file: " +
                                             std::string(std::strerror(e))};
    }
    return Result<void>();
}

Result<void> LifecycleComponent::removePidFile() const {
    std::error_code ec;
    if (std::filesystem::exists(pidFile_, ec)) {
        if (!std::filesystem::remove(pidFile_, ec)) {
            return Error{ErrorCode::IOError, "Failed to remove PID file: " + ec.message()};
        }
    }
    return Result<void>();
}

void LifecycleComponent::setupSignalHandlers() {
    instance_.store(this);
    std::signal(SIGTERM, &LifecycleComponent::signalHandler);
    std::signal(SIGINT, &LifecycleComponent::signalHandler);
    // The daemon has no terminal to lose; SIGHUP is treated as a stop request too
    std::signal(SIGHUP, &LifecycleComponent::signalHandler);
}

void LifecycleComponent::cleanupSignalHandlers() {
    LifecycleComponent* self = this;
    if (instance_.compare_exchange_strong(self, nullptr)) {
        std::signal(SIGTERM, SIG_DFL);
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGHUP, SIG_DFL);
    }
}

void LifecycleComponent::signalHandler(int) {
    if (auto* self = instance_.load(); self && self->daemon_) {
        self->daemon_->requestStop();
    }
}

bool LifecycleComponent::readPidFromFile(pid_t& outPid) const {
    outPid = 0;
    int fd = ::open(pidFile_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return false;
    }
    char pid_buf[32] = {0};
    ssize_t n = ::read(fd, pid_buf, sizeof(pid_buf) - 1);
    ::close(fd);
    if (n <= 0) {
        return false;
    }
    outPid = static_cast<pid_t>(std::atoi(pid_buf));
    return outPid > 0;
}

} // namespace servherd::daemon
