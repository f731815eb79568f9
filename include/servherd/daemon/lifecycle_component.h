#pragma once

#include <atomic>
#include <filesystem>

#include <sys/types.h>

#include <servherd/core/types.h>

namespace servherd::daemon {

class ServherdDaemon;

/**
 * @class LifecycleComponent
 * @brief Manages the daemon's OS-level lifecycle, including PID file and signal handling.
 *
 * The PID file stays flock()ed for the life of the daemon; a second instance fails to take
 * the lock and refuses to start. A PID file naming a dead process is removed as stale.
 */
class LifecycleComponent {
public:
    LifecycleComponent(ServherdDaemon* daemon, std::filesystem::path pidFile);
    ~LifecycleComponent();

    Result<void> initialize();
    void shutdown();

private:
    void setupSignalHandlers();
    void cleanupSignalHandlers();
    static void signalHandler(int signal);

    Result<void> createPidFile();
    Result<void> removePidFile() const;
    bool isAnotherInstanceRunning() const;
    bool readPidFromFile(pid_t& outPid) const;

    ServherdDaemon* daemon_;
    std::filesystem::path pidFile_;
    int pidFileFd_ = -1;

    static std::atomic<LifecycleComponent*> instance_;
};

} // namespace servherd::daemon
