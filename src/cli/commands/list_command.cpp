#include <fmt/format.h>
#include <iostream>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/servherd_cli.h>

namespace servherd::cli {

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override { return "List registered servers"; }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->alias("ls");
        cmd->add_flag("--running", running_, "Only servers that are online");
        cmd->add_flag("--stopped", stopped_, "Only servers that are not online");
        cmd->add_option("-t,--tag", tag_, "Only servers with this tag");
        cmd->add_option("--cwd", cwd_, "Only servers registered in this directory");
        cmd->add_option("--cmd", cmdGlob_, "Only servers whose command matches this glob");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }

        app::ListOptions opts;
        opts.running = running_;
        opts.stopped = stopped_;
        if (!tag_.empty())
            opts.filter.tag = tag_;
        if (!cwd_.empty())
            opts.filter.cwd = cwd_;
        if (!cmdGlob_.empty())
            opts.filter.cmdGlob = cmdGlob_;

        auto service = cli_->makeService();
        auto items = service.list(opts);
        if (!items) {
            return items.error();
        }

        if (cli_->getJsonOutput()) {
            auto arr = nlohmann::json::array();
            for (const auto& item : items.value())
                arr.push_back(toJson(item));
            printJsonSuccess(arr);
            return Result<void>();
        }

        if (items.value().empty()) {
            std::cout << "No servers registered.\n";
            return Result<void>();
        }

        bool anyDrift = false;
        std::cout << fmt::format("{:<24} {:<8} {:>5}  {:<32} {}\n", "NAME", "STATUS", "PORT",
                                 "URL", "CWD");
        for (const auto& item : items.value()) {
            const auto& e = item.entry;
            std::string name = item.hasDrift ? e.name + " *" : e.name;
            anyDrift = anyDrift || item.hasDrift;
            std::cout << fmt::format("{:<24} {:<8} {:>5}  {:<32} {}\n", name,
                                     statusToString(item.status), e.port, e.url(), e.cwd);
        }
        if (anyDrift) {
            std::cout << "\n* config drift; run \"servherd refresh\" to apply changes\n";
        }
        return Result<void>();
    }

private:
    ServherdCLI* cli_ = nullptr;
    bool running_ = false;
    bool stopped_ = false;
    std::string tag_;
    std::string cwd_;
    std::string cmdGlob_;
};

std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace servherd::cli
