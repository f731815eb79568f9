#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <stop_token>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/servherd_cli.h>
#include <servherd/template/template_engine.h>

namespace servherd::cli {

class StartCommand : public ICommand {
public:
    std::string getName() const override { return "start"; }

    std::string getDescription() const override {
        return "Start a development server, or reuse the one already running";
    }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("start", getDescription());
        cmd->add_option("command", commandParts_,
                        "Command to run; use -- before commands with their own flags")
            ->required();
        cmd->add_option("-n,--name", name_, "Server name (generated when omitted)");
        portOpt_ = cmd->add_option("-p,--port", port_,
                                   "Port to use instead of the deterministic one");
        cmd->add_option("--protocol", protocol_, "Protocol for {{url}}")
            ->check(CLI::IsMember({"http", "https"}));
        cmd->add_option("-t,--tag", tags_, "Tag for grouping (repeatable)");
        cmd->add_option("-d,--description", description_, "Free-form description");
        cmd->add_option("-e,--env", envStrings_,
                        "Environment variable KEY=VALUE; values may use {{port}} etc.");
        cmd->add_option("--cwd", cwd_, "Working directory (defaults to the current directory)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }

        app::StartOptions opts;
        for (const auto& part : commandParts_) {
            if (!opts.command.empty())
                opts.command += ' ';
            opts.command += part;
        }
        std::error_code ec;
        opts.cwd = cwd_.empty() ? std::filesystem::current_path(ec).string()
                                : std::filesystem::absolute(cwd_, ec).string();
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot resolve working directory: " + ec.message()};
        }
        if (!name_.empty())
            opts.name = name_;
        if (portOpt_ && portOpt_->count() > 0)
            opts.port = port_;
        if (!protocol_.empty())
            opts.protocol = protocolFromString(protocol_);
        opts.tags = tags_;
        if (!description_.empty())
            opts.description = description_;
        if (!envStrings_.empty()) {
            auto env = templates::parseEnvStrings(envStrings_);
            if (!env) {
                return env.error();
            }
            opts.env = env.value();
        }

        spdlog::debug("start: command='{}' cwd={}", opts.command, opts.cwd);
        auto service = cli_->makeService();
        auto result = service.start(opts);
        if (!result) {
            return result.error();
        }
        const auto& r = result.value();

        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(r));
        } else {
            render(r);
        }

        if (auto* direct = cli_->getDirectBackend(); direct && direct->count() > 0) {
            if (!cli_->getJsonOutput()) {
                std::cout << "Running in CI mode; press Ctrl+C to stop\n";
            }
            direct->waitForChildren(std::stop_token{});
        }
        return Result<void>();
    }

private:
    void render(const app::StartResult& r) const {
        const auto& e = r.entry;
        switch (r.action) {
            case app::StartAction::Started:
                std::cout << "[OK] Started " << e.name << " at " << e.url() << "\n";
                break;
            case app::StartAction::Existing:
                std::cout << "[OK] " << e.name << " is already running at " << e.url() << "\n";
                break;
            case app::StartAction::Restarted:
                std::cout << "[OK] Restarted " << e.name << " at " << e.url();
                if (r.envChanged)
                    std::cout << " (environment changed)";
                else if (r.commandChanged)
                    std::cout << " (command changed)";
                std::cout << "\n";
                break;
            case app::StartAction::Refreshed:
                std::cout << "[OK] Refreshed " << e.name << " at " << e.url()
                          << " (config changed)\n";
                for (const auto& d : r.driftDetails)
                    std::cout << "     " << d << "\n";
                break;
        }
        if (r.portReassigned && r.originalPort) {
            std::cout << "     port " << *r.originalPort << " was unavailable, using " << e.port
                      << "\n";
        }
        if (r.userDeclinedRefresh || (r.configDrift && r.action != app::StartAction::Refreshed)) {
            std::cout << "     config drift detected; run \"servherd refresh " << e.name
                      << "\" to apply it\n";
        }
        if (cli_->getVerbose()) {
            std::cout << "     command: " << e.resolvedCommand << "\n     cwd: " << e.cwd << "\n";
        }
    }

    ServherdCLI* cli_ = nullptr;
    std::vector<std::string> commandParts_;
    std::string name_;
    int port_ = 0;
    CLI::Option* portOpt_ = nullptr;
    std::string protocol_;
    std::vector<std::string> tags_;
    std::string description_;
    std::vector<std::string> envStrings_;
    std::string cwd_;
};

std::unique_ptr<ICommand> createStartCommand() {
    return std::make_unique<StartCommand>();
}

} // namespace servherd::cli
