#include <servherd/config/config_helpers.h>
#include <servherd/daemon/daemon.h>
#include <servherd/daemon/lifecycle_component.h>
#include <servherd/daemon/request_dispatcher.h>
#include <servherd/daemon/unix_ipc_server.h>
#include <servherd/process/direct_backend.h>

#include <spdlog/spdlog.h>

namespace servherd::daemon {

ServherdDaemon::ServherdDaemon(DaemonConfig config) : config_(std::move(config)) {
    if (config_.socketPath.empty()) {
        config_.socketPath = config::get_daemon_socket_path();
    }
    if (config_.pidFile.empty()) {
        config_.pidFile = config::get_daemon_pid_path();
    }
    if (config_.logFile.empty()) {
        config_.logFile = config::get_log_dir() / "daemon.log";
    }
    if (config_.processLogDir.empty()) {
        config_.processLogDir = config::get_log_dir();
    }
}

ServherdDaemon::~ServherdDaemon() {
    if (running_.load()) {
        if (auto r = stop(); !r) {
            spdlog::warn("Daemon stop during destruction failed: {}", r.error().message);
        }
    }
}

Result<void> ServherdDaemon::start() {
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "Daemon already running"};
    }
    spdlog::info("Starting servherd daemon (pid file {}, socket {})", config_.pidFile.string(),
                 config_.socketPath.string());

    lifecycle_ = std::make_unique<LifecycleComponent>(this, config_.pidFile);
    if (auto r = lifecycle_->initialize(); !r) {
        lifecycle_.reset();
        return r;
    }

    process::DirectBackend::Options opts;
    opts.logDir = config_.processLogDir;
    opts.grace = config_.stopGrace;
    opts.forwardOutput = false;
    opts.handleSignals = false;
    opts.newSession = true;
    opts.timestampedLogs = false;
    supervisor_ = std::make_unique<process::DirectBackend>(std::move(opts));

    dispatcher_ = std::make_unique<RequestDispatcher>(*supervisor_, [this](bool stopChildren) {
        if (!stopChildren) {
            spdlog::info("Supervised processes are stopped with the daemon regardless");
        }
        requestStop();
    });

    UnixIpcServer::Config ipcCfg;
    ipcCfg.socketPath = config_.socketPath;
    ipcServer_ = std::make_unique<UnixIpcServer>(ipcCfg, dispatcher_.get());
    if (auto r = ipcServer_->start(); !r) {
        ipcServer_.reset();
        dispatcher_.reset();
        supervisor_.reset();
        lifecycle_->shutdown();
        lifecycle_.reset();
        return r;
    }

    running_.store(true);
    spdlog::info("servherd daemon ready");
    return Result<void>();
}

Result<void> ServherdDaemon::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Daemon not running"};
    }
    spdlog::info("Stopping servherd daemon");

    if (ipcServer_) {
        if (auto r = ipcServer_->stop(); !r) {
            spdlog::warn("IPC server stop: {}", r.error().message);
        }
        ipcServer_.reset();
    }
    dispatcher_.reset();
    if (supervisor_) {
        supervisor_->shutdown();
        supervisor_.reset();
    }
    if (lifecycle_) {
        lifecycle_->shutdown();
        lifecycle_.reset();
    }
    spdlog::info("servherd daemon stopped");
    return Result<void>();
}

} // namespace servherd::daemon
