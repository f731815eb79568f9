#include <iostream>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/selector_options.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class RestartCommand : public ICommand {
public:
    std::string getName() const override { return "restart"; }

    std::string getDescription() const override {
        return "Restart servers, applying config changes when refreshOnChange allows it";
    }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("restart", getDescription());
        addSelectorOptions(cmd, selector_);

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto results = service.restart(selector_.toSelector());
        if (!results) {
            return results.error();
        }

        bool ok = true;
        for (const auto& r : results.value())
            ok = ok && r.success;

        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(results.value()));
        } else {
            printBatchResults(results.value(), "Restarted");
            for (const auto& r : results.value()) {
                if (r.configRefreshed && r.driftDetails) {
                    std::cout << "     " << r.name << " picked up config changes:\n"
                              << *r.driftDetails << "\n";
                }
            }
        }
        if (!ok) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

private:
    ServherdCLI* cli_ = nullptr;
    SelectorArgs selector_;
};

std::unique_ptr<ICommand> createRestartCommand() {
    return std::make_unique<RestartCommand>();
}

} // namespace servherd::cli
