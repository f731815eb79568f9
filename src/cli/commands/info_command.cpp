#include <fmt/format.h>
#include <fmt/ranges.h>
#include <chrono>
#include <iostream>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/servherd_cli.h>
#include <servherd/common/time_parser.h>

namespace servherd::cli {

class InfoCommand : public ICommand {
public:
    std::string getName() const override { return "info"; }

    std::string getDescription() const override {
        return "Show registry details and live process state of a server";
    }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("info", getDescription());
        cmd->add_option("name", name_, "Server name")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto info = service.info(name_);
        if (!info) {
            return info.error();
        }
        const auto& i = info.value();

        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(i));
            return Result<void>();
        }

        const auto& e = i.entry;
        auto row = [](const char* label, const std::string& value) {
            std::cout << fmt::format("{:<12} {}\n", label, value);
        };
        row("Name:", e.name);
        row("Status:", statusToString(i.status));
        row("URL:", e.url());
        row("Command:", e.command);
        if (e.resolvedCommand != e.command)
            row("Resolved:", e.resolvedCommand);
        row("CWD:", e.cwd);
        if (!e.tags.empty())
            row("Tags:", fmt::format("{}", fmt::join(e.tags, ", ")));
        if (e.description)
            row("Description:", *e.description);
        row("Created:", e.createdAt);
        for (const auto& [key, value] : e.env)
            row("Env:", key + "=" + value);

        if (const auto& p = i.process) {
            if (p->pid)
                row("PID:", std::to_string(*p->pid));
            if (p->uptimeStartMs && i.status == ServerStatus::Online) {
                auto nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();
                row("Uptime:", common::TimeParser::formatUptime(
                                   std::chrono::milliseconds{nowMs - *p->uptimeStartMs}));
            }
            row("Restarts:", std::to_string(p->restartCount));
            if (p->cpu)
                row("CPU:", fmt::format("{:.1f}%", *p->cpu));
            if (p->memory)
                row("Memory:", formatBytes(*p->memory));
            if (p->outLogPath)
                row("Out log:", *p->outLogPath);
            if (p->errLogPath)
                row("Error log:", *p->errLogPath);
        }
        if (i.hasDrift)
            row("Drift:", "config changed since start; run \"servherd refresh " + e.name + "\"");
        return Result<void>();
    }

private:
    ServherdCLI* cli_ = nullptr;
    std::string name_;
};

std::unique_ptr<ICommand> createInfoCommand() {
    return std::make_unique<InfoCommand>();
}

} // namespace servherd::cli
