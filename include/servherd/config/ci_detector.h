#pragma once

#include <optional>
#include <string>

namespace servherd::config {

struct CIModeOptions {
    bool ci{false};
    bool noCi{false};
};

struct CIInfo {
    bool isCI{false};
    std::optional<std::string> name;
};

/**
 * Detects whether servherd runs inside a CI environment.
 *
 * --no-ci wins over --ci, which wins over the environment. The environment check looks at
 * a generic CI variable and then a fixed table of known providers.
 */
class CIDetector {
public:
    static bool isCI(const CIModeOptions& opts = {});

    /// Provider name, "Unknown CI" for a bare CI variable, or nullopt
    static std::optional<std::string> ciName();

    static CIInfo info();
};

} // namespace servherd::config
