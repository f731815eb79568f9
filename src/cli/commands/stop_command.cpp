#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/selector_options.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class StopCommand : public ICommand {
public:
    std::string getName() const override { return "stop"; }

    std::string getDescription() const override { return "Stop servers"; }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("stop", getDescription());
        addSelectorOptions(cmd, selector_);
        cmd->add_flag("-f,--force", force_, "Kill and forget the process instead of stopping it");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        auto service = cli_->makeService();
        auto results = service.stop(selector_.toSelector(), force_);
        if (!results) {
            return results.error();
        }

        bool ok = true;
        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(results.value()));
            for (const auto& r : results.value())
                ok = ok && r.success;
        } else {
            ok = printBatchResults(results.value(), "Stopped");
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

std::unique_ptr<ICommand> createStopCommand() {
    return std::make_unique<StopCommand>();
}

} // namespace servherd::cli
