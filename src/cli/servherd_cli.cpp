#include <servherd/cli/command_registry.h>
#include <servherd/cli/error_hints.h>
#include <servherd/cli/output.h>
#include <servherd/cli/prompt_util.h>
#include <servherd/cli/servherd_cli.h>
#include <servherd/config/ci_detector.h>
#include <servherd/config/config_helpers.h>
#include <servherd/process/daemon_backend.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifndef SERVHERD_VERSION_STRING
#define SERVHERD_VERSION_STRING "0.0.0"
#endif

namespace servherd::cli {

namespace fs = std::filesystem;

ServherdCLI::ServherdCLI() {
    app_ = std::make_unique<CLI::App>("servherd - development server fleet manager", "servherd");
    app_->set_version_flag("--version", SERVHERD_VERSION_STRING);
    app_->require_subcommand(1);

    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
    app_->add_flag("--ci", ciFlag_, "Force CI mode (direct child processes, no config files)");
    app_->add_flag("--no-ci", noCiFlag_, "Disable CI detection");

    CommandRegistry::registerAllCommands(this);
}

ServherdCLI::~ServherdCLI() = default;

void ServherdCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void ServherdCLI::applyLogLevel() {
    // Precedence: env SERVHERD_LOG_LEVEL > --verbose > warn
    if (const char* envLvl = std::getenv("SERVHERD_LOG_LEVEL"); envLvl && *envLvl) {
        std::string v;
        for (const char* p = envLvl; *p; ++p)
            v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
        auto lvl = spdlog::level::from_str(v);
        if (lvl != spdlog::level::off || v == "off") {
            spdlog::set_level(lvl);
            return;
        }
    }
    spdlog::set_level(verbose_ ? spdlog::level::debug : spdlog::level::warn);
}

int ServherdCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    applyLogLevel();
    ciMode_ = config::CIDetector::isCI({ciFlag_, noCiFlag_});
    if (ciMode_) {
        spdlog::debug("CI mode active ({})", config::CIDetector::ciName().value_or("forced"));
    }

    if (!pendingCommand_) {
        return 0;
    }

    const std::string commandName = pendingCommand_->getName();
    Result<void> result;
    try {
        result = pendingCommand_->execute();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (!result) {
        if (jsonOutput_) {
            printJsonError(result.error());
        } else {
            std::cerr << "[FAIL] "
                      << formatErrorWithHint(result.error().code, result.error().message,
                                             commandName)
                      << "\n";
        }
        return 1;
    }
    return exitCode_;
}

Result<void> ServherdCLI::ensureConfigLoaded() {
    if (configLoaded_) {
        return Result<void>();
    }
    configService_ = std::make_unique<config::ConfigService>(config::get_config_path());
    config::ConfigService::LoadOptions opts;
    opts.ciMode = ciMode_;
    std::error_code ec;
    opts.searchFrom = fs::current_path(ec);
    if (ec) {
        opts.searchFrom.reset();
    }
    auto loaded = configService_->load(opts);
    if (!loaded) {
        return loaded.error();
    }
    config_ = loaded.value();
    configLoaded_ = true;
    return Result<void>();
}

Result<void> ServherdCLI::reloadConfig() {
    configLoaded_ = false;
    return ensureConfigLoaded();
}

Result<void> ServherdCLI::ensureServicesReady() {
    if (auto c = ensureConfigLoaded(); !c) {
        return c;
    }
    if (!registry_) {
        registry_ = std::make_unique<registry::RegistryService>(config::get_registry_path());
        if (auto r = registry_->load(); !r) {
            registry_.reset();
            return r;
        }
    }
    if (!backend_) {
        if (ciMode_) {
            process::DirectBackend::Options opts;
            opts.logDir = config::get_direct_log_dir();
            auto direct = std::make_unique<process::DirectBackend>(opts);
            directBackend_ = direct.get();
            backend_ = std::move(direct);
        } else {
            daemon::ClientConfig cc;
            cc.socketPath = config::get_daemon_socket_path();
            backend_ = std::make_unique<process::DaemonBackend>(cc);
        }
        if (auto r = backend_->connect(); !r) {
            backend_.reset();
            directBackend_ = nullptr;
            return r;
        }
        spdlog::debug("Using {} process backend", backend_->backendName());
    }
    return Result<void>();
}

bool ServherdCLI::confirm(const std::string& question) const {
    return prompt_yes_no(question + " (y/N): ", YesNoOptions{},
                         jsonOutput_ ? std::cerr : std::cout);
}

app::ServerService ServherdCLI::makeService() {
    app::ServerService::Options opts;
    opts.ciMode = ciMode_;
    opts.confirm = [this](const std::string& question) { return confirm(question); };
    return app::ServerService(config_, *registry_, *backend_, opts);
}

} // namespace servherd::cli
