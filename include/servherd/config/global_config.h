#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <servherd/core/types.h>

namespace servherd::config {

struct PortRange {
    int min{3000};
    int max{9999};

    bool contains(int port) const { return port >= min && port <= max; }
    bool operator==(const PortRange&) const = default;
};

/**
 * Process-wide servherd configuration.
 *
 * Invariant: 1 <= portRange.min <= portRange.max <= 65535.
 */
struct GlobalConfig {
    std::string version{"1"};
    std::string hostname{"0.0.0.0"};
    Protocol protocol{Protocol::Http};
    PortRange portRange{};
    std::string tempDir{"/tmp/servherd"};
    std::optional<std::string> httpsCert;
    std::optional<std::string> httpsKey;
    RefreshOnChange refreshOnChange{RefreshOnChange::OnStart};
    EnvMap variables;

    bool operator==(const GlobalConfig&) const = default;
};

/// Names reserved for built-in template variables; custom variables may not use them
inline constexpr const char* kReservedVariableNames[] = {"port", "hostname", "url", "https-cert",
                                                        "https-key"};

bool isReservedVariableName(const std::string& name);

/// Serializes a config to its on-disk JSON form
nlohmann::json toJson(const GlobalConfig& config);

/**
 * Overlays the fields present in `j` onto `base`.
 * Unknown keys are ignored; a field with the wrong type or an invalid value fails the
 * whole merge with ConfigInvalid.
 */
Result<GlobalConfig> mergeJson(const GlobalConfig& base, const nlohmann::json& j);

/// Validates the range invariant and custom variable names
Result<void> validate(const GlobalConfig& config);

} // namespace servherd::config
