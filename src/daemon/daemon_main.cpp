#include <servherd/config/config_helpers.h>
#include <servherd/daemon/daemon.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include <execinfo.h>
#include <fcntl.h>
#include <unistd.h>

#ifndef SERVHERD_VERSION_STRING
#define SERVHERD_VERSION_STRING "0.0.0"
#endif

namespace {

constexpr std::size_t kLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

void onFatalSignal(int signo) {
    spdlog::critical("servherd-daemon received fatal signal {}", signo);
    void* frames[64];
    const int n = backtrace(frames, 64);
    if (char** syms = backtrace_symbols(frames, n)) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("  #{} {}", i, syms[i]);
        }
        std::free(syms);
    }
    spdlog::default_logger()->flush();
    std::_Exit(128 + signo);
}

void installFatalHandlers() {
    std::signal(SIGSEGV, onFatalSignal);
    std::signal(SIGABRT, onFatalSignal);
    std::signal(SIGPIPE, SIG_IGN);
    std::set_terminate([]() noexcept {
        spdlog::critical("std::terminate called");
        spdlog::default_logger()->flush();
        std::_Exit(1);
    });
}

bool useRotatingLog(const std::filesystem::path& logFile) {
    std::error_code ec;
    std::filesystem::create_directories(logFile.parent_path(), ec);
    if (ec) {
        std::cerr << "Failed to create log directory " << logFile.parent_path() << ": "
                  << ec.message() << std::endl;
        return false;
    }
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), kLogFileBytes, kLogFileCount);
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("servherd-daemon", sink));
        spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Logging to the console instead of " << logFile << ": " << e.what()
                  << std::endl;
    }
    return true;
}

// Detaches from the launching terminal; the parent prints the child pid and exits
bool detach() {
    const pid_t pid = ::fork();
    if (pid < 0) {
        std::cerr << "Failed to fork servherd-daemon" << std::endl;
        return false;
    }
    if (pid > 0) {
        std::cout << "servherd-daemon started with pid " << pid << std::endl;
        std::_Exit(0);
    }
    if (::setsid() < 0 || ::chdir("/") < 0) {
        spdlog::error("Failed to detach servherd-daemon from its terminal");
        return false;
    }
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
        ::dup2(devnull, STDERR_FILENO);
        if (devnull > STDERR_FILENO) {
            ::close(devnull);
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    installFatalHandlers();

    CLI::App app{"servherd-daemon - supervises development servers for the servherd CLI"};
    app.set_version_flag("--version", SERVHERD_VERSION_STRING);

    servherd::daemon::DaemonConfig config;
    int graceSeconds = 5;
    bool foreground = false;
    app.add_option("--socket", config.socketPath, "Unix domain socket path");
    app.add_option("--pid-file", config.pidFile, "PID file path");
    app.add_option("--log-file", config.logFile, "Daemon log file");
    app.add_option("--process-log-dir", config.processLogDir,
                   "Directory for supervised process output");
    app.add_option("--stop-grace", graceSeconds,
                   "Seconds between SIGTERM and SIGKILL when stopping a process")
        ->default_val(5)
        ->check(CLI::Range(0, 600));
    app.add_option("--log-level", config.logLevel, "trace, debug, info, warn, error or off")
        ->default_val("info");
    app.add_flag("-f,--foreground", foreground, "Stay attached to the terminal");

    CLI11_PARSE(app, argc, argv);

    config.stopGrace = std::chrono::seconds{graceSeconds};
    if (const char* envLevel = std::getenv("SERVHERD_LOG_LEVEL"); envLevel && *envLevel) {
        config.logLevel = envLevel;
    }
    if (config.logFile.empty()) {
        config.logFile = servherd::config::get_log_dir() / "daemon.log";
    }

    if (!useRotatingLog(config.logFile)) {
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    if (!foreground && !detach()) {
        return 1;
    }

    try {
        servherd::daemon::ServherdDaemon daemon(config);
        if (auto started = daemon.start(); !started) {
            spdlog::error("servherd-daemon failed to start: {}", started.error().message);
            return 1;
        }

        // Runs until SIGTERM/SIGINT or a shutdown request over IPC
        while (daemon.isRunning() && !daemon.isStopRequested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (auto stopped = daemon.stop(); !stopped) {
            spdlog::warn("servherd-daemon stop: {}", stopped.error().message);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("servherd-daemon error: {}", e.what());
        return 1;
    }
}
