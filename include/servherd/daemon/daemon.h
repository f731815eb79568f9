#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <servherd/core/types.h>

namespace servherd::process {
class DirectBackend;
}

namespace servherd::daemon {

class LifecycleComponent;
class RequestDispatcher;
class UnixIpcServer;

struct DaemonConfig {
    std::filesystem::path socketPath; ///< empty: <home>/daemon.sock
    std::filesystem::path pidFile;    ///< empty: <home>/daemon.pid
    std::filesystem::path logFile;    ///< empty: <home>/logs/daemon.log
    std::filesystem::path processLogDir;
    std::chrono::milliseconds stopGrace{std::chrono::seconds{5}};
    std::string logLevel{"info"};
};

/**
 * @brief servherd-daemon: supervises server processes on behalf of CLI invocations
 *
 * Children are started in their own session and outlive the CLI that asked for them.
 * Their output is appended to <handle>-out.log and <handle>-err.log in the process log
 * directory. Stopping the daemon stops every supervised tree.
 */
class ServherdDaemon {
public:
    explicit ServherdDaemon(DaemonConfig config);
    ~ServherdDaemon();

    Result<void> start();
    Result<void> stop();

    void requestStop() { stopRequested_.store(true); }
    bool isStopRequested() const { return stopRequested_.load(); }
    bool isRunning() const { return running_.load(); }

    const DaemonConfig& config() const { return config_; }

private:
    DaemonConfig config_;
    std::unique_ptr<LifecycleComponent> lifecycle_;
    std::unique_ptr<process::DirectBackend> supervisor_;
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::unique_ptr<UnixIpcServer> ipcServer_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
};

} // namespace servherd::daemon
