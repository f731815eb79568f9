#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <servherd/core/types.h>

namespace servherd::registry {

/// Prefix applied to every backend process handle
inline constexpr const char* kProcessHandlePrefix = "servherd-";

inline std::string processHandleFor(const std::string& name) {
    return std::string(kProcessHandlePrefix) + name;
}

/**
 * Configuration values captured when a server last (re)started.
 * Only the values the server's command depends on are filled in.
 */
struct ConfigSnapshot {
    std::optional<std::string> hostname;
    std::optional<std::string> protocol;
    std::optional<std::string> httpsCert;
    std::optional<std::string> httpsKey;
    std::optional<int> portRangeMin;
    std::optional<int> portRangeMax;
    std::optional<EnvMap> customVariables;

    bool operator==(const ConfigSnapshot&) const = default;
};

/**
 * One managed server registration.
 *
 * `name` is unique across the registry. `resolvedCommand` is `command` rendered with the
 * configuration and `port` in effect at the last (re)start.
 */
struct ServerEntry {
    std::string id;
    std::string name;
    std::string command;
    std::string resolvedCommand;
    std::string cwd;
    int port{0};
    Protocol protocol{Protocol::Http};
    std::string hostname;
    EnvMap env;
    std::vector<std::string> tags;
    std::optional<std::string> description;
    std::string createdAt;
    std::string processHandle;
    std::vector<std::string> usedConfigKeys;
    std::optional<ConfigSnapshot> configSnapshot;

    std::string url() const {
        return std::string(protocolToString(protocol)) + "://" + hostname + ":" +
               std::to_string(port);
    }

    bool hasTag(const std::string& tag) const;
};

/**
 * Reads a named field of an entry as a string, as used by the `$` template lookup.
 * Supports top-level scalar fields and `env.<KEY>`.
 */
std::optional<std::string> entryProperty(const ServerEntry& entry, const std::string& prop);

void to_json(nlohmann::json& j, const ConfigSnapshot& s);
void from_json(const nlohmann::json& j, ConfigSnapshot& s);
void to_json(nlohmann::json& j, const ServerEntry& e);
void from_json(const nlohmann::json& j, ServerEntry& e);

} // namespace servherd::registry
