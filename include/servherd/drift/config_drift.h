#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <servherd/config/global_config.h>
#include <servherd/registry/server_entry.h>

namespace servherd::drift {

/// Key recorded for the port range dependency every server has
inline constexpr const char* kPortRangeKey = "portRange";
/// Key recorded when a command references {{url}}
inline constexpr const char* kProtocolKey = "protocol";
/// Prefix of keys recorded for referenced custom variables
inline constexpr const char* kVariablePrefix = "variables.";

struct DriftedValue {
    std::string configKey;
    std::string templateVar;
    std::optional<std::string> startedWith;
    std::optional<std::string> currentValue;
};

struct DriftResult {
    bool hasDrift{false};
    std::vector<DriftedValue> driftedValues;
    bool portOutOfRange{false};
    bool protocolChanged{false};
};

/**
 * Configuration keys a command depends on: keys behind built-in variables, `portRange`
 * always, `protocol` iff `{{url}}` is used, and `variables.<name>` for each referenced
 * custom variable defined in `customVariables`.
 */
std::vector<std::string> extractUsedConfigKeys(std::string_view command,
                                               const EnvMap& customVariables = {});

/// Captures the current value of every used key
registry::ConfigSnapshot createConfigSnapshot(const config::GlobalConfig& config,
                                              const std::vector<std::string>& usedKeys);

/// Compares an entry's snapshot with the live configuration
DriftResult detectDrift(const registry::ServerEntry& entry, const config::GlobalConfig& config);

/// "No config drift", or one `  key: "old" → "new"` line per drifted value
std::string formatDrift(const DriftResult& result);

/// `key: "old" → "new"` per drifted value, without indentation
std::vector<std::string> driftDetails(const DriftResult& result);

std::vector<registry::ServerEntry>
findServersUsingConfigKey(const std::vector<registry::ServerEntry>& servers,
                          const std::string& configKey);

struct ServerDrift {
    registry::ServerEntry server;
    DriftResult drift;
};

std::vector<ServerDrift> findServersWithDrift(const std::vector<registry::ServerEntry>& servers,
                                              const config::GlobalConfig& config);

} // namespace servherd::drift
