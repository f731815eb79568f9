#include <servherd/drift/config_drift.h>
#include <servherd/template/template_engine.h>

#include <algorithm>

namespace servherd::drift {

namespace {

void addUnique(std::vector<std::string>& keys, std::string key) {
    if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(std::move(key));
    }
}

std::string rangeString(int min, int max) {
    return std::to_string(min) + "-" + std::to_string(max);
}

} // namespace

std::vector<std::string> extractUsedConfigKeys(std::string_view command,
                                               const EnvMap& customVariables) {
    std::vector<std::string> keys;
    const auto names = templates::extractVariableNames(command);
    const auto& builtins = templates::builtinConfigKeys();

    for (const auto& name : names) {
        if (auto it = builtins.find(name); it != builtins.end()) {
            if (it->second) {
                addUnique(keys, *it->second);
            }
        }
    }

    addUnique(keys, kPortRangeKey);

    if (std::find(names.begin(), names.end(), "url") != names.end()) {
        addUnique(keys, kProtocolKey);
    }

    for (const auto& name : names) {
        if (!templates::isBuiltinVariable(name) && customVariables.count(name) > 0) {
            addUnique(keys, kVariablePrefix + name);
        }
    }
    return keys;
}

registry::ConfigSnapshot createConfigSnapshot(const config::GlobalConfig& config,
                                              const std::vector<std::string>& usedKeys) {
    registry::ConfigSnapshot snap;
    for (const auto& key : usedKeys) {
        if (key == "hostname") {
            snap.hostname = config.hostname;
        } else if (key == "httpsCert") {
            snap.httpsCert = config.httpsCert;
        } else if (key == "httpsKey") {
            snap.httpsKey = config.httpsKey;
        } else if (key == kProtocolKey) {
            snap.protocol = protocolToString(config.protocol);
        } else if (key == kPortRangeKey) {
            snap.portRangeMin = config.portRange.min;
            snap.portRangeMax = config.portRange.max;
        } else if (key.rfind(kVariablePrefix, 0) == 0) {
            auto name = key.substr(std::char_traits<char>::length(kVariablePrefix));
            if (!snap.customVariables)
                snap.customVariables.emplace();
            if (auto it = config.variables.find(name); it != config.variables.end()) {
                (*snap.customVariables)[name] = it->second;
            }
        }
    }
    return snap;
}

DriftResult detectDrift(const registry::ServerEntry& entry, const config::GlobalConfig& config) {
    DriftResult result;
    if (!entry.configSnapshot) {
        return result;
    }
    const auto& snap = *entry.configSnapshot;

    auto compare = [&](const std::string& key, const char* templateVar,
                       const std::optional<std::string>& before,
                       const std::optional<std::string>& now) {
        if (before != now) {
            result.driftedValues.push_back(DriftedValue{key, templateVar, before, now});
            return true;
        }
        return false;
    };

    for (const auto& key : entry.usedConfigKeys) {
        if (key == "hostname") {
            compare(key, "hostname", snap.hostname, config.hostname);
        } else if (key == "httpsCert") {
            compare(key, "https-cert", snap.httpsCert, config.httpsCert);
        } else if (key == "httpsKey") {
            compare(key, "https-key", snap.httpsKey, config.httpsKey);
        } else if (key == kProtocolKey) {
            if (compare(key, "url", snap.protocol,
                        std::string(protocolToString(config.protocol)))) {
                result.protocolChanged = true;
            }
        } else if (key == kPortRangeKey) {
            // Only an entry port that no longer fits counts; moving bounds alone does not
            if (!config.portRange.contains(entry.port)) {
                result.portOutOfRange = true;
                std::optional<std::string> before;
                if (snap.portRangeMin && snap.portRangeMax) {
                    before = rangeString(*snap.portRangeMin, *snap.portRangeMax);
                }
                result.driftedValues.push_back(
                    DriftedValue{key, "port", before,
                                 rangeString(config.portRange.min, config.portRange.max)});
            }
        } else if (key.rfind(kVariablePrefix, 0) == 0) {
            auto name = key.substr(std::char_traits<char>::length(kVariablePrefix));
            std::optional<std::string> before;
            if (snap.customVariables) {
                if (auto it = snap.customVariables->find(name); it != snap.customVariables->end())
                    before = it->second;
            }
            std::optional<std::string> now;
            if (auto it = config.variables.find(name); it != config.variables.end())
                now = it->second;
            compare(key, name.c_str(), before, now);
        }
    }

    result.hasDrift = !result.driftedValues.empty();
    return result;
}

std::vector<std::string> driftDetails(const DriftResult& result) {
    std::vector<std::string> lines;
    for (const auto& d : result.driftedValues) {
        lines.push_back(d.configKey + ": \"" + d.startedWith.value_or("(not set)") +
                        "\" → \"" + d.currentValue.value_or("(not set)") + "\"");
    }
    return lines;
}

std::string formatDrift(const DriftResult& result) {
    if (!result.hasDrift) {
        return "No config drift";
    }
    std::string out = "Config drift detected:";
    for (const auto& line : driftDetails(result)) {
        out += "\n  " + line;
    }
    return out;
}

std::vector<registry::ServerEntry>
findServersUsingConfigKey(const std::vector<registry::ServerEntry>& servers,
                          const std::string& configKey) {
    std::vector<registry::ServerEntry> out;
    for (const auto& s : servers) {
        if (std::find(s.usedConfigKeys.begin(), s.usedConfigKeys.end(), configKey) !=
            s.usedConfigKeys.end()) {
            out.push_back(s);
        }
    }
    return out;
}

std::vector<ServerDrift> findServersWithDrift(const std::vector<registry::ServerEntry>& servers,
                                              const config::GlobalConfig& config) {
    std::vector<ServerDrift> out;
    for (const auto& s : servers) {
        auto drift = detectDrift(s, config);
        if (drift.hasDrift) {
            out.push_back(ServerDrift{s, std::move(drift)});
        }
    }
    return out;
}

} // namespace servherd::drift
