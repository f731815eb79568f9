#pragma once

#include <optional>
#include <servherd/core/types.h>

namespace servherd::common {

/**
 * Returns true when the two environment maps differ in key set or any value.
 * A missing map is treated as empty; key order never matters.
 */
[[nodiscard]] bool hasEnvChanged(const std::optional<EnvMap>& stored,
                                 const std::optional<EnvMap>& requested);

/**
 * Stable textual form of an environment map: sorted "KEY=VALUE" lines joined by '\n'.
 */
[[nodiscard]] std::string canonicalEnv(const EnvMap& env);

} // namespace servherd::common
