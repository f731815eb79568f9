#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include <servherd/process/process_backend.h>

namespace servherd::process {

/**
 * @brief Runs servers as children of the current process
 *
 * Used in CI and other disposable runs: children die with the invocation. Output goes to
 * per-run log files under the direct log directory and is echoed to the parent's
 * stdout/stderr prefixed with the process name.
 *
 * The backend owns the table of live children. shutdown() sweeps every tracked process
 * tree exactly once, whichever of SIGINT/SIGTERM/SIGHUP, std::terminate or destruction
 * gets there first.
 */
class DirectBackend final : public IProcessBackend {
public:
    struct Options {
        std::filesystem::path logDir;
        std::chrono::milliseconds grace{std::chrono::seconds{5}};
        bool forwardOutput{true};
        bool handleSignals{true};
        /// Children get their own session so they survive the caller's terminal
        bool newSession{false};
        /// Per-run "<name>-<stamp>-out.log" files; otherwise a stable "<name>-out.log" appended to
        bool timestampedLogs{true};
    };

    DirectBackend();
    explicit DirectBackend(Options options);
    ~DirectBackend() override;

    DirectBackend(const DirectBackend&) = delete;
    DirectBackend& operator=(const DirectBackend&) = delete;

    Result<void> connect() override;
    void disconnect() override;

    Result<void> start(const StartSpec& spec) override;
    Result<void> stop(const std::string& name) override;
    Result<void> remove(const std::string& name) override;
    Result<void> restart(const std::string& name) override;
    Result<std::optional<ProcessDescription>> describe(const std::string& name) override;
    Result<void> flush(const std::string& name) override;
    Result<void> flushAll() override;
    Result<std::vector<ProcessDescription>> list() override;

    std::string_view backendName() const override { return "direct"; }

    /// Kills every tracked process tree; later calls are no-ops
    void shutdown();
    bool isShutDown() const { return shutDown_.load(); }

    /// Blocks until no tracked child is running or `token` is signalled
    void waitForChildren(std::stop_token token);

    std::size_t count() const;
    bool has(const std::string& name) const;

private:
    struct Child;

    Result<void> launch(Child& child);
    void reap(Child& child);
    void terminate(Child& child);
    ProcessDescription describeLocked(Child& child);
    void installSignalHandling();
    void signalLoop(std::stop_token token);

    Options options_;
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Child>> children_;

    std::once_flag handlersOnce_;
    std::once_flag shutdownOnce_;
    std::atomic<bool> shutDown_{false};
    std::jthread signalThread_;
};

} // namespace servherd::process
