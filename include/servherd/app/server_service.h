#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <servherd/config/global_config.h>
#include <servherd/core/types.h>
#include <servherd/drift/config_drift.h>
#include <servherd/port/port_allocator.h>
#include <servherd/process/process_backend.h>
#include <servherd/registry/registry_service.h>
#include <servherd/template/template_engine.h>

namespace servherd::app {

struct StartOptions {
    std::string command;
    std::string cwd;
    std::optional<std::string> name;
    std::optional<int> port;
    std::optional<Protocol> protocol;
    std::vector<std::string> tags;
    std::optional<std::string> description;
    /// Unrendered values; placeholders are resolved against the assigned port
    std::optional<EnvMap> env;
};

enum class StartAction { Started, Existing, Restarted, Refreshed };

constexpr const char* startActionToString(StartAction a) {
    switch (a) {
        case StartAction::Started: return "started";
        case StartAction::Existing: return "existing";
        case StartAction::Restarted: return "restarted";
        case StartAction::Refreshed: return "refreshed";
    }
    return "started";
}

struct StartResult {
    StartAction action{StartAction::Started};
    registry::ServerEntry entry;
    ServerStatus status{ServerStatus::Online};
    bool envChanged{false};
    bool commandChanged{false};
    bool portReassigned{false};
    std::optional<int> originalPort;
    bool configDrift{false};
    std::vector<std::string> driftDetails;
    bool userDeclinedRefresh{false};
};

/// Target of a batch operation; exactly one of the three must be set
struct Selector {
    std::optional<std::string> name;
    bool all{false};
    std::optional<std::string> tag;

    bool empty() const { return !name && !all && !tag; }
};

struct BatchResult {
    std::string name;
    bool success{false};
    std::optional<ServerStatus> status;
    std::optional<std::string> message;
    bool skipped{false};
    bool cancelled{false};
    bool configRefreshed{false};
    std::optional<std::string> driftDetails;
    bool portReassigned{false};
    std::optional<int> originalPort;
    std::optional<int> newPort;
};

struct InfoResult {
    registry::ServerEntry entry;
    ServerStatus status{ServerStatus::Unknown};
    std::optional<process::ProcessDescription> process;
    bool hasDrift{false};
};

struct ListOptions {
    bool running{false};
    bool stopped{false};
    registry::ServerFilter filter;
};

struct ListItem {
    registry::ServerEntry entry;
    ServerStatus status{ServerStatus::Unknown};
    bool hasDrift{false};
};

struct LogsOptions {
    std::string name;
    std::size_t lines{50};
    std::optional<std::size_t> head;
    std::optional<std::string> since;
    bool error{false};
};

struct LogsResult {
    std::string name;
    ServerStatus status{ServerStatus::Unknown};
    std::vector<std::string> lines;
    /// Set when no lines could be read, e.g. "(log file does not exist)"
    std::optional<std::string> notice;
    std::size_t requested{0};
    std::optional<std::string> outLogPath;
    std::optional<std::string> errLogPath;
};

struct ConfigRefreshOutcome {
    bool refreshed{false};
    std::optional<std::string> message;
    std::vector<BatchResult> results;
};

/**
 * @brief Decides and performs server lifecycle operations
 *
 * Owns no state beyond references to the registry and the process backend; each call is one
 * complete operation against the configuration captured at construction.
 */
class ServerService {
public:
    using ConfirmFn = std::function<bool(const std::string& question)>;

    struct Options {
        bool ciMode{false};
        /// Asked before drift refreshes in prompt mode and before removals; absent means "no"
        ConfirmFn confirm;
        port::PortAllocator::Probe probe{port::probeTcpPort};
    };

    ServerService(config::GlobalConfig config, registry::RegistryService& registry,
                  process::IProcessBackend& backend);
    ServerService(config::GlobalConfig config, registry::RegistryService& registry,
                  process::IProcessBackend& backend, Options options);

    /// Registers and starts a server, or reconciles an existing registration
    Result<StartResult> start(const StartOptions& opts);

    Result<std::vector<BatchResult>> stop(const Selector& selector, bool force = false);
    Result<std::vector<BatchResult>> restart(const Selector& selector);
    Result<std::vector<BatchResult>> remove(const Selector& selector, bool force = false);
    /// An empty selector considers every server; only drifted servers are touched
    Result<std::vector<BatchResult>> refresh(const Selector& selector, bool dryRun = false);

    Result<InfoResult> info(const std::string& name);
    Result<std::vector<ListItem>> list(const ListOptions& opts);
    Result<LogsResult> logs(const LogsOptions& opts);
    /// Truncates one server's logs, or every log when `name` is empty
    Result<std::string> flush(const std::optional<std::string>& name);

    /// Applies refreshOnChange after `changedKey` was set in the configuration
    ConfigRefreshOutcome handleConfigChange(const std::string& changedKey);

    const config::GlobalConfig& config() const { return config_; }

private:
    struct Rendered {
        std::string resolvedCommand;
        std::optional<EnvMap> env;
        std::vector<std::string> usedConfigKeys;
        registry::ConfigSnapshot snapshot;
    };

    Result<Rendered> render(const std::string& command, const std::optional<EnvMap>& env,
                            int port, Protocol protocol, const std::string& hostname,
                            const std::string& cwd) const;
    Result<void> startProcess(const registry::ServerEntry& entry);
    Result<void> deleteIgnoringMissing(const std::string& handle);
    Result<port::PortAssignment> assignPort(const std::string& cwd, const std::string& command,
                                            std::optional<int> explicitPort);

    Result<StartResult> startNew(const StartOptions& opts, const std::string& name);
    Result<StartResult> refreshOnStart(const registry::ServerEntry& entry,
                                       const StartOptions& opts,
                                       const drift::DriftResult& driftState, bool commandChanged);

    Result<std::vector<registry::ServerEntry>> select(const Selector& selector,
                                                      bool allowEmpty = false) const;
    /// Re-renders against the live configuration, records it and replaces the process
    Result<registry::ServerEntry> rerender(const registry::ServerEntry& entry,
                                           const std::string& command,
                                           const std::optional<EnvMap>& env, Protocol protocol,
                                           const drift::DriftResult& driftState,
                                           std::optional<int>* reassignedFrom = nullptr);
    BatchResult refreshOne(const registry::ServerEntry& entry,
                           const drift::DriftResult& driftState, bool dryRun);

    templates::TemplateContext templateContext(const std::string& cwd) const;
    bool confirm(const std::string& question) const;

    config::GlobalConfig config_;
    registry::RegistryService& registry_;
    process::IProcessBackend& backend_;
    Options options_;
};

} // namespace servherd::app
