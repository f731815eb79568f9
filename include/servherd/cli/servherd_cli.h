#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <CLI/CLI.hpp>
#include <servherd/app/server_service.h>
#include <servherd/cli/command.h>
#include <servherd/config/config_service.h>
#include <servherd/process/direct_backend.h>
#include <servherd/process/process_backend.h>
#include <servherd/registry/registry_service.h>

namespace servherd::cli {

/**
 * Main CLI application class
 *
 * Configuration, registry and process backend are created lazily, so `config` works without
 * a daemon and `--help` touches nothing on disk.
 */
class ServherdCLI {
public:
    ServherdCLI();
    ~ServherdCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * CI mode from --ci/--no-ci and the environment; resolved after parsing
     */
    bool isCiMode() const { return ciMode_; }

    /**
     * Loads the configuration (skipping config files in CI mode)
     */
    Result<void> ensureConfigLoaded();

    /**
     * Loads configuration and registry and connects the process backend
     */
    Result<void> ensureServicesReady();

    /**
     * Re-reads configuration after it was changed on disk
     */
    Result<void> reloadConfig();

    config::ConfigService& getConfigService() { return *configService_; }
    const config::GlobalConfig& getConfig() const { return config_; }
    registry::RegistryService& getRegistry() { return *registry_; }
    process::IProcessBackend& getBackend() { return *backend_; }

    /**
     * The direct backend when running in CI mode, nullptr otherwise
     */
    process::DirectBackend* getDirectBackend() { return directBackend_; }

    /**
     * Service bound to the current configuration; requires ensureServicesReady()
     */
    app::ServerService makeService();

    /**
     * Asks a yes/no question on the terminal; the prompt goes to stderr in JSON mode
     */
    bool confirm(const std::string& question) const;

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    /**
     * Non-zero exit status for partially failed batch operations
     */
    void setExitCode(int code) { exitCode_ = code; }

private:
    void applyLogLevel();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_{nullptr};

    std::unique_ptr<config::ConfigService> configService_;
    config::GlobalConfig config_;
    bool configLoaded_{false};
    std::unique_ptr<registry::RegistryService> registry_;
    std::unique_ptr<process::IProcessBackend> backend_;
    process::DirectBackend* directBackend_{nullptr};

    bool verbose_ = false;
    bool jsonOutput_ = false;
    bool ciFlag_ = false;
    bool noCiFlag_ = false;
    bool ciMode_ = false;
    int exitCode_ = 0;
};

} // namespace servherd::cli
