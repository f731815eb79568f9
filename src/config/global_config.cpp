#include <servherd/config/global_config.h>

#include <algorithm>
#include <cctype>

namespace servherd::config {

bool isReservedVariableName(const std::string& name) {
    return std::any_of(std::begin(kReservedVariableNames), std::end(kReservedVariableNames),
                       [&](const char* reserved) { return name == reserved; });
}

nlohmann::json toJson(const GlobalConfig& config) {
    nlohmann::json j;
    j["version"] = config.version;
    j["hostname"] = config.hostname;
    j["protocol"] = protocolToString(config.protocol);
    j["portRange"] = {{"min", config.portRange.min}, {"max", config.portRange.max}};
    j["tempDir"] = config.tempDir;
    if (config.httpsCert)
        j["httpsCert"] = *config.httpsCert;
    if (config.httpsKey)
        j["httpsKey"] = *config.httpsKey;
    j["refreshOnChange"] = refreshOnChangeToString(config.refreshOnChange);
    j["variables"] = nlohmann::json::object();
    for (const auto& [name, value] : config.variables) {
        j["variables"][name] = value;
    }
    return j;
}

namespace {

Error invalid(const std::string& what) {
    return Error{ErrorCode::ConfigInvalid, "Invalid configuration: " + what};
}

} // namespace

Result<GlobalConfig> mergeJson(const GlobalConfig& base, const nlohmann::json& j) {
    if (!j.is_object()) {
        return invalid("expected a JSON object");
    }

    GlobalConfig out = base;
    try {
        if (auto it = j.find("version"); it != j.end() && !it->is_null())
            out.version = it->get<std::string>();
        if (auto it = j.find("hostname"); it != j.end() && !it->is_null())
            out.hostname = it->get<std::string>();
        if (auto it = j.find("protocol"); it != j.end() && !it->is_null()) {
            auto p = protocolFromString(it->get<std::string>());
            if (!p)
                return invalid("protocol must be \"http\" or \"https\"");
            out.protocol = *p;
        }
        if (auto it = j.find("portRange"); it != j.end() && !it->is_null()) {
            if (!it->is_object())
                return invalid("portRange must be an object");
            if (auto mn = it->find("min"); mn != it->end())
                out.portRange.min = mn->get<int>();
            if (auto mx = it->find("max"); mx != it->end())
                out.portRange.max = mx->get<int>();
        }
        if (auto it = j.find("tempDir"); it != j.end() && !it->is_null())
            out.tempDir = it->get<std::string>();
        if (auto it = j.find("httpsCert"); it != j.end() && !it->is_null())
            out.httpsCert = it->get<std::string>();
        if (auto it = j.find("httpsKey"); it != j.end() && !it->is_null())
            out.httpsKey = it->get<std::string>();
        if (auto it = j.find("refreshOnChange"); it != j.end() && !it->is_null()) {
            auto r = refreshOnChangeFromString(it->get<std::string>());
            if (!r)
                return invalid("refreshOnChange must be one of manual, on-start, prompt, auto");
            out.refreshOnChange = *r;
        }
        if (auto it = j.find("variables"); it != j.end() && !it->is_null()) {
            if (!it->is_object())
                return invalid("variables must be an object");
            for (const auto& [name, value] : it->items()) {
                out.variables[name] = value.is_string() ? value.get<std::string>() : value.dump();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return invalid(e.what());
    }

    if (auto v = validate(out); !v) {
        return v.error();
    }
    return out;
}

Result<void> validate(const GlobalConfig& config) {
    const auto& r = config.portRange;
    if (r.min < 1 || r.min > 65535 || r.max < 1 || r.max > 65535) {
        return invalid("port range must be within 1-65535");
    }
    if (r.min > r.max) {
        return invalid("Port range min must be less than or equal to max");
    }
    for (const auto& [name, value] : config.variables) {
        if (isReservedVariableName(name)) {
            return invalid("variable name \"" + name + "\" is reserved");
        }
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '_' || c == '-';
            })) {
            return invalid("variable name \"" + name + "\" may only contain letters, digits, "
                                                       "'_' and '-'");
        }
    }
    return Result<void>();
}

} // namespace servherd::config
