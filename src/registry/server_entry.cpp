#include <servherd/registry/server_entry.h>

#include <algorithm>

namespace servherd::registry {

bool ServerEntry::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

std::optional<std::string> entryProperty(const ServerEntry& entry, const std::string& prop) {
    if (prop == "id")
        return entry.id;
    if (prop == "name")
        return entry.name;
    if (prop == "command")
        return entry.command;
    if (prop == "resolvedCommand")
        return entry.resolvedCommand;
    if (prop == "cwd")
        return entry.cwd;
    if (prop == "port")
        return std::to_string(entry.port);
    if (prop == "protocol")
        return std::string(protocolToString(entry.protocol));
    if (prop == "hostname")
        return entry.hostname;
    if (prop == "url")
        return entry.url();
    if (prop == "createdAt")
        return entry.createdAt;
    if (prop == "processHandle")
        return entry.processHandle;
    if (prop == "description")
        return entry.description;
    if (prop.rfind("env.", 0) == 0) {
        if (auto it = entry.env.find(prop.substr(4)); it != entry.env.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value)
        j[key] = *value;
}

template <typename T>
void getOptional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

void to_json(nlohmann::json& j, const ConfigSnapshot& s) {
    j = nlohmann::json::object();
    putOptional(j, "hostname", s.hostname);
    putOptional(j, "protocol", s.protocol);
    putOptional(j, "httpsCert", s.httpsCert);
    putOptional(j, "httpsKey", s.httpsKey);
    putOptional(j, "portRangeMin", s.portRangeMin);
    putOptional(j, "portRangeMax", s.portRangeMax);
    putOptional(j, "customVariables", s.customVariables);
}

void from_json(const nlohmann::json& j, ConfigSnapshot& s) {
    getOptional(j, "hostname", s.hostname);
    getOptional(j, "protocol", s.protocol);
    getOptional(j, "httpsCert", s.httpsCert);
    getOptional(j, "httpsKey", s.httpsKey);
    getOptional(j, "portRangeMin", s.portRangeMin);
    getOptional(j, "portRangeMax", s.portRangeMax);
    getOptional(j, "customVariables", s.customVariables);
}

void to_json(nlohmann::json& j, const ServerEntry& e) {
    j = nlohmann::json{{"id", e.id},
                       {"name", e.name},
                       {"command", e.command},
                       {"resolvedCommand", e.resolvedCommand},
                       {"cwd", e.cwd},
                       {"port", e.port},
                       {"protocol", protocolToString(e.protocol)},
                       {"hostname", e.hostname},
                       {"env", e.env},
                       {"createdAt", e.createdAt},
                       {"processHandle", e.processHandle}};
    if (!e.tags.empty())
        j["tags"] = e.tags;
    putOptional(j, "description", e.description);
    if (!e.usedConfigKeys.empty())
        j["usedConfigKeys"] = e.usedConfigKeys;
    putOptional(j, "configSnapshot", e.configSnapshot);
}

void from_json(const nlohmann::json& j, ServerEntry& e) {
    j.at("id").get_to(e.id);
    j.at("name").get_to(e.name);
    j.at("command").get_to(e.command);
    e.resolvedCommand = j.value("resolvedCommand", e.command);
    j.at("cwd").get_to(e.cwd);
    j.at("port").get_to(e.port);
    e.protocol = protocolFromString(j.value("protocol", "http")).value_or(Protocol::Http);
    e.hostname = j.value("hostname", "0.0.0.0");
    if (auto it = j.find("env"); it != j.end() && it->is_object())
        e.env = it->get<EnvMap>();
    if (auto it = j.find("tags"); it != j.end() && it->is_array())
        e.tags = it->get<std::vector<std::string>>();
    getOptional(j, "description", e.description);
    e.createdAt = j.value("createdAt", "");
    e.processHandle = j.value("processHandle", processHandleFor(e.name));
    if (auto it = j.find("usedConfigKeys"); it != j.end() && it->is_array())
        e.usedConfigKeys = it->get<std::vector<std::string>>();
    getOptional(j, "configSnapshot", e.configSnapshot);
}

} // namespace servherd::registry
