#include <iostream>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/selector_options.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class RefreshCommand : public ICommand {
public:
    std::string getName() const override { return "refresh"; }

    std::string getDescription() const override {
        return "Re-render and restart servers whose config has drifted";
    }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("refresh", getDescription());
        addSelectorOptions(cmd, selector_);
        cmd->add_flag("--dry-run", dryRun_, "Show what would be refreshed");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto results = service.refresh(selector_.toSelector(), dryRun_);
        if (!results) {
            return results.error();
        }

        bool ok = true;
        for (const auto& r : results.value())
            ok = ok && r.success;

        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(results.value()));
        } else {
            printBatchResults(results.value(), "Refreshed");
            if (dryRun_) {
                for (const auto& r : results.value()) {
                    if (r.driftDetails)
                        std::cout << *r.driftDetails << "\n";
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
    bool dryRun_ = false;
};

std::unique_ptr<ICommand> createRefreshCommand() {
    return std::make_unique<RefreshCommand>();
}

} // namespace servherd::cli
