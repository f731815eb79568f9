#include <spdlog/spdlog.h>
#include <csignal>
#include <ctime>
#include <iostream>
#include <pthread.h>
#include <stop_token>
#include <thread>
#include <servherd/app/log_reader.h>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class LogsCommand : public ICommand {
public:
    std::string getName() const override { return "logs"; }

    std::string getDescription() const override { return "Show or flush server logs"; }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("logs", getDescription());
        cmd->add_option("name", name_, "Server name");
        cmd->add_option("-n,--lines", lines_, "Number of lines from the end")->default_val(50);
        cmd->add_option("--head", head_, "Number of lines from the start");
        cmd->add_option("--since", since_, "Only lines since a duration (1h, 30m) or ISO date");
        cmd->add_flag("-e,--error", error_, "Show the error log");
        cmd->add_flag("-f,--follow", follow_, "Keep printing new lines until interrupted");
        cmd->add_flag("--flush", flush_, "Truncate the logs");
        cmd->add_flag("-a,--all", all_, "With --flush, truncate the logs of every server");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (flush_) {
            return executeFlush();
        }
        if (name_.empty()) {
            return Error{ErrorCode::InvalidArgument, "Provide a server name"};
        }
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }

        app::LogsOptions opts;
        opts.name = name_;
        opts.lines = lines_;
        if (head_ > 0)
            opts.head = head_;
        if (!since_.empty())
            opts.since = since_;
        opts.error = error_;

        auto service = cli_->makeService();
        auto logs = service.logs(opts);
        if (!logs) {
            return logs.error();
        }
        const auto& l = logs.value();

        if (cli_->getJsonOutput() && !follow_) {
            nlohmann::json data{{"name", l.name},
                                {"status", statusToString(l.status)},
                                {"lines", l.lines},
                                {"requested", l.requested}};
            if (l.notice)
                data["notice"] = *l.notice;
            if (l.outLogPath)
                data["outLogPath"] = *l.outLogPath;
            if (l.errLogPath)
                data["errLogPath"] = *l.errLogPath;
            printJsonSuccess(data);
            return Result<void>();
        }

        if (l.notice) {
            std::cout << *l.notice << "\n";
        }
        for (const auto& line : l.lines) {
            std::cout << line << "\n";
        }

        if (follow_) {
            const auto& path = error_ ? l.errLogPath : l.outLogPath;
            if (!path) {
                return Error{ErrorCode::ProcessNotFound,
                             "No log file to follow for server \"" + name_ + "\""};
            }
            followUntilInterrupted(*path);
        }
        return Result<void>();
    }

private:
    Result<void> executeFlush() {
        if (name_.empty() && !all_) {
            return Error{ErrorCode::InvalidArgument, "Provide a server name or --all with --flush"};
        }
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto flushed = service.flush(all_ ? std::nullopt : std::optional<std::string>{name_});
        if (!flushed) {
            return flushed.error();
        }
        if (cli_->getJsonOutput()) {
            printJsonSuccess({{"message", flushed.value()}});
        } else {
            std::cout << "[OK] " << flushed.value() << "\n";
        }
        return Result<void>();
    }

    void followUntilInterrupted(const std::string& path) {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        ::pthread_sigmask(SIG_BLOCK, &set, nullptr);

        std::stop_source stop;
        std::jthread waiter([&set, &stop](std::stop_token token) {
            const timespec tick{0, 200 * 1000 * 1000};
            while (!token.stop_requested()) {
                if (::sigtimedwait(&set, nullptr, &tick) > 0) {
                    stop.request_stop();
                    return;
                }
            }
        });

        spdlog::debug("Following {}", path);
        app::followLog(path, stop.get_token(),
                       [](const std::string& line) { std::cout << line << std::endl; });
    }

    ServherdCLI* cli_ = nullptr;
    std::string name_;
    std::size_t lines_ = 50;
    std::size_t head_ = 0;
    std::string since_;
    bool error_ = false;
    bool follow_ = false;
    bool flush_ = false;
    bool all_ = false;
};

std::unique_ptr<ICommand> createLogsCommand() {
    return std::make_unique<LogsCommand>();
}

} // namespace servherd::cli
