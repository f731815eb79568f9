#include <servherd/common/env_compare.h>

namespace servherd::common {

bool hasEnvChanged(const std::optional<EnvMap>& stored, const std::optional<EnvMap>& requested) {
    static const EnvMap empty;
    const EnvMap& a = stored ? *stored : empty;
    const EnvMap& b = requested ? *requested : empty;
    // std::map is ordered, so equality is independent of insertion order
    return a != b;
}

std::string canonicalEnv(const EnvMap& env) {
    std::string out;
    bool first = true;
    for (const auto& [key, value] : env) {
        if (!first)
            out.push_back('\n');
        first = false;
        out += key;
        out.push_back('=');
        out += value;
    }
    return out;
}

} // namespace servherd::common
