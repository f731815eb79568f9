#include <spdlog/spdlog.h>
#include <iostream>
#include <servherd/cli/command.h>
#include <servherd/cli/command_registry.h>
#include <servherd/cli/output.h>
#include <servherd/cli/servherd_cli.h>
#include <servherd/config/global_config.h>

namespace servherd::cli {

namespace {

constexpr const char* kShownKeys[] = {"hostname", "protocol",  "portRange.min",
                                      "portRange.max", "tempDir", "httpsCert",
                                      "httpsKey", "refreshOnChange"};

// Key recorded in a server's usedConfigKeys for a settable config key
std::string driftKeyFor(const std::string& key) {
    if (key.rfind("portRange", 0) == 0) {
        return "portRange";
    }
    return key;
}

} // namespace

class ConfigCommand : public ICommand {
public:
    std::string getName() const override { return "config"; }

    std::string getDescription() const override { return "Show and edit servherd settings"; }

    void registerCommand(CLI::App& app, ServherdCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("config", getDescription());
        auto* group = cmd->add_option_group("action");
        group->add_flag("--show", show_, "Show the effective configuration (default)");
        group->add_option("--get", getKey_, "Print one value");
        group->add_option("--set", setKey_, "Set one value (with --value)");
        group->add_option("--add", addName_, "Add a custom template variable (with --value)");
        group->add_option("--remove", removeName_, "Remove a custom template variable");
        group->add_flag("--list-vars", listVars_, "List custom template variables");
        group->add_flag("--reset", reset_, "Restore the default configuration");
        group->add_option("--refresh", refreshName_, "Refresh one server with drift");
        group->add_flag("--refresh-all", refreshAll_, "Refresh every server with drift");
        group->require_option(0, 1);

        cmd->add_option("--value", value_, "Value for --set or --add");
        cmd->add_flag("-f,--force", force_, "Skip confirmation prompt");
        cmd->add_flag("--dry-run", dryRun_, "With --refresh, only show what would change");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (auto r = cli_->ensureConfigLoaded(); !r) {
            return r;
        }
        if (!getKey_.empty())
            return executeGet();
        if (!setKey_.empty())
            return executeSet();
        if (!addName_.empty())
            return executeAdd();
        if (!removeName_.empty())
            return executeRemove();
        if (listVars_)
            return executeListVars();
        if (reset_)
            return executeReset();
        if (!refreshName_.empty() || refreshAll_)
            return executeRefresh();
        return executeShow();
    }

private:
    Result<void> executeShow() {
        auto& svc = cli_->getConfigService();
        if (cli_->getJsonOutput()) {
            auto data = config::toJson(cli_->getConfig());
            data["configPath"] = svc.configPath().string();
            if (svc.loadedProjectPath())
                data["projectConfigPath"] = svc.loadedProjectPath()->string();
            printJsonSuccess(data);
            return Result<void>();
        }
        for (const char* key : kShownKeys) {
            auto value = svc.get(key);
            if (value && !value.value().empty())
                std::cout << key << ": " << value.value() << "\n";
        }
        for (const auto& [name, value] : cli_->getConfig().variables)
            std::cout << "variables." << name << ": " << value << "\n";
        std::cout << "\nConfig file: " << svc.configPath().string() << "\n";
        if (svc.loadedProjectPath())
            std::cout << "Project config: " << svc.loadedProjectPath()->string() << "\n";
        return Result<void>();
    }

    Result<void> executeGet() {
        auto value = cli_->getConfigService().get(getKey_);
        if (!value) {
            return value.error();
        }
        if (cli_->getJsonOutput()) {
            printJsonSuccess({{"key", getKey_}, {"value", value.value()}});
        } else {
            std::cout << value.value() << "\n";
        }
        return Result<void>();
    }

    Result<void> executeSet() {
        if (value_.empty()) {
            return Error{ErrorCode::InvalidArgument, "--set requires --value"};
        }
        if (auto r = cli_->getConfigService().set(setKey_, value_); !r) {
            return r;
        }
        spdlog::info("Set {} = {}", setKey_, value_);
        return afterChange(setKey_, driftKeyFor(setKey_));
    }

    Result<void> executeAdd() {
        if (value_.empty()) {
            return Error{ErrorCode::InvalidArgument, "--add requires --value"};
        }
        if (auto r = cli_->getConfigService().addVariable(addName_, value_); !r) {
            return r;
        }
        return afterChange("variables." + addName_, "variables." + addName_);
    }

    Result<void> executeRemove() {
        if (auto r = cli_->getConfigService().removeVariable(removeName_); !r) {
            return r;
        }
        if (cli_->getJsonOutput()) {
            printJsonSuccess({{"removed", removeName_}});
        } else {
            std::cout << "[OK] Removed variable " << removeName_ << "\n";
        }
        return Result<void>();
    }

    Result<void> executeListVars() {
        const auto& vars = cli_->getConfig().variables;
        if (cli_->getJsonOutput()) {
            printJsonSuccess(nlohmann::json(vars));
            return Result<void>();
        }
        if (vars.empty()) {
            std::cout << "No custom variables defined.\n";
        }
        for (const auto& [name, value] : vars)
            std::cout << name << " = " << value << "   (use as {{" << name << "}})\n";
        return Result<void>();
    }

    Result<void> executeReset() {
        if (!force_) {
            if (cli_->isCiMode()) {
                return Error{ErrorCode::InvalidState,
                             "Reset requires --force flag in CI mode to prevent hanging on "
                             "confirmation prompt"};
            }
            if (!cli_->confirm("Reset configuration to defaults?")) {
                std::cout << "Reset cancelled.\n";
                return Result<void>();
            }
        }
        auto& svc = cli_->getConfigService();
        if (auto r = svc.save(config::ConfigService::getDefaults()); !r) {
            return r;
        }
        if (cli_->getJsonOutput()) {
            printJsonSuccess(config::toJson(config::ConfigService::getDefaults()));
        } else {
            std::cout << "[OK] Configuration reset to defaults\n";
        }
        return Result<void>();
    }

    Result<void> executeRefresh() {
        if (auto r = cli_->ensureServicesReady(); !r) {
            return r;
        }
        app::Selector selector;
        if (refreshAll_)
            selector.all = true;
        else
            selector.name = refreshName_;

        auto service = cli_->makeService();
        auto results = service.refresh(selector, dryRun_);
        if (!results) {
            return results.error();
        }
        if (cli_->getJsonOutput()) {
            printJsonSuccess(toJson(results.value()));
        } else if (!printBatchResults(results.value(), "Refreshed")) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

    // Prints the new value, then applies refreshOnChange to servers depending on it
    Result<void> afterChange(const std::string& key, const std::string& driftKey) {
        if (auto r = cli_->reloadConfig(); !r) {
            return r;
        }
        auto value = cli_->getConfigService().get(key);
        const std::string shown = value ? value.value() : value_;

        std::optional<app::ConfigRefreshOutcome> outcome;
        if (auto ready = cli_->ensureServicesReady(); ready) {
            auto service = cli_->makeService();
            outcome = service.handleConfigChange(driftKey);
        } else {
            spdlog::debug("Skipping refresh of affected servers: {}", ready.error().message);
        }

        if (cli_->getJsonOutput()) {
            nlohmann::json data{{"key", key}, {"value", shown}};
            if (outcome) {
                data["refreshed"] = outcome->refreshed;
                if (outcome->message)
                    data["message"] = *outcome->message;
                if (!outcome->results.empty())
                    data["results"] = toJson(outcome->results);
            }
            printJsonSuccess(data);
            return Result<void>();
        }

        std::cout << "[OK] " << key << " = " << shown << "\n";
        if (outcome && outcome->message) {
            std::cout << *outcome->message << "\n";
        }
        if (outcome && !printBatchResults(outcome->results, "Refreshed")) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

    ServherdCLI* cli_ = nullptr;
    bool show_ = false;
    std::string getKey_;
    std::string setKey_;
    std::string addName_;
    std::string removeName_;
    bool listVars_ = false;
    bool reset_ = false;
    std::string refreshName_;
    bool refreshAll_ = false;
    std::string value_;
    bool force_ = false;
    bool dryRun_ = false;
};

std::unique_ptr<ICommand> createConfigCommand() {
    return std::make_unique<ConfigCommand>();
}

} // namespace servherd::cli
