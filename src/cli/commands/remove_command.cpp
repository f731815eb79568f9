#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/selector_options.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class RemoveCommand : public ICommand {
public:
    std::string getName() const override { return "remove"; }

    std::string getDescription() const override {
        return "Stop servers and remove them from the registry";
    }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("remove", getDescription());
        cmd->alias("rm");
        addSelectorOptions(cmd, selector_);
        cmd->add_flag("-f,--force", force_, "Skip confirmation prompt");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto results = service.remove(selector_.toSelector(), force_);
        if (!results) {
            return results.error();
        }

        bool ok = true;
        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(results.value()));
            for (const auto& r : results.value())
                ok = ok && (r.success || r.cancelled);
        } else {
            ok = printBatchResults(results.value(), "Removed");
        }
        if (!ok) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

private:
    ServherdCLI* cli_ = nullptr;
    SelectorArgs selector_;
    bool force_ = false;
};

std::unique_ptr<ICommand> createRemoveCommand() {
    return std::make_unique<RemoveCommand>();
}

} // namespace servherd::cli
