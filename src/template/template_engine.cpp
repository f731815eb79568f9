#include <servherd/template/template_engine.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace servherd::templates {

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool isVariableName(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), isNameChar);
}

std::string_view trimView(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Argument of a `$` lookup: either positional or key=value
struct LookupArg {
    std::optional<std::string> key;
    std::string value;
};

std::vector<LookupArg> tokenizeLookupArgs(std::string_view s) {
    std::vector<LookupArg> out;
    size_t i = 0;
    auto readValue = [&](std::string& dst) {
        if (i < s.size() && (s[i] == '"' || s[i] == '\'')) {
            char quote = s[i++];
            while (i < s.size() && s[i] != quote) {
                if (s[i] == '\\' && i + 1 < s.size())
                    ++i;
                dst.push_back(s[i++]);
            }
            if (i < s.size())
                ++i;
        } else {
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
                dst.push_back(s[i++]);
        }
    };

    while (i < s.size()) {
        if (std::isspace(static_cast<unsigned char>(s[i]))) {
            ++i;
            continue;
        }
        LookupArg arg;
        size_t j = i;
        while (j < s.size() && isNameChar(s[j]))
            ++j;
        if (j > i && j < s.size() && s[j] == '=') {
            arg.key = std::string(s.substr(i, j - i));
            i = j + 1;
        }
        readValue(arg.value);
        out.push_back(std::move(arg));
    }
    return out;
}

std::string resolveLookup(std::string_view body, const TemplateContext& context) {
    auto args = tokenizeLookupArgs(body);

    std::vector<std::string> positional;
    std::map<std::string, std::string> hash;
    for (auto& a : args) {
        if (a.key) {
            hash[*a.key] = std::move(a.value);
        } else {
            positional.push_back(std::move(a.value));
        }
    }

    std::string service;
    std::string prop;
    std::string cwd;
    if (positional.size() >= 2) {
        service = positional[0];
        prop = positional[1];
        if (positional.size() >= 3)
            cwd = positional[2];
    } else {
        auto pick = [&](std::initializer_list<const char*> keys) -> std::string {
            for (const char* k : keys) {
                if (auto it = hash.find(k); it != hash.end() && !it->second.empty())
                    return it->second;
            }
            return {};
        };
        service = pick({"service", "svc"});
        prop = pick({"prop", "property"});
        cwd = pick({"cwd"});
    }

    std::string effectiveCwd = !cwd.empty() ? cwd : context.cwd.value_or("");

    if (service.empty()) {
        throw TemplateLookupError(
            "$ helper requires a service name (positional or service=/svc= hash argument)");
    }
    if (prop.empty()) {
        throw TemplateLookupError(
            "$ helper requires a property name (positional or prop=/property= hash argument)");
    }
    if (!context.lookupServer) {
        throw TemplateLookupError("$ helper requires a server lookup function in template context");
    }
    if (effectiveCwd.empty()) {
        throw TemplateLookupError(
            "$ helper requires a cwd (via hash argument or template context)");
    }

    auto server = context.lookupServer(service, effectiveCwd);
    if (!server) {
        throw TemplateLookupError("Server \"" + service + "\" not found in " + effectiveCwd);
    }
    auto value = registry::entryProperty(*server, prop);
    if (!value) {
        throw TemplateLookupError("Property \"" + prop + "\" not found on server \"" + service +
                                  "\"");
    }
    return *value;
}

const std::regex& placeholderRegex() {
    static const std::regex re(R"(\{\{\s*([\w-]+)\s*\}\})");
    return re;
}

} // namespace

std::string render(std::string_view tmpl, const TemplateVariables& vars,
                   const TemplateContext& context) {
    std::string out;
    out.reserve(tmpl.size());

    size_t pos = 0;
    while (pos < tmpl.size()) {
        size_t open = tmpl.find("{{", pos);
        if (open == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        size_t close = tmpl.find("}}", open + 2);
        if (close == std::string_view::npos) {
            out.append(tmpl.substr(pos));
            break;
        }
        out.append(tmpl.substr(pos, open - pos));

        std::string_view raw = tmpl.substr(open, close + 2 - open);
        std::string_view inner = trimView(tmpl.substr(open + 2, close - open - 2));

        if (!inner.empty() && inner.front() == '$' &&
            (inner.size() == 1 || std::isspace(static_cast<unsigned char>(inner[1])))) {
            out.append(resolveLookup(inner.substr(1), context));
        } else if (isVariableName(inner)) {
            if (auto it = vars.find(std::string(inner)); it != vars.end()) {
                out.append(it->second);
            } else {
                out.append(raw);
            }
        } else {
            out.append(raw);
        }
        pos = close + 2;
    }
    return out;
}

EnvMap renderEnvTemplates(const EnvMap& env, const TemplateVariables& vars,
                          const TemplateContext& context) {
    EnvMap out;
    for (const auto& [key, value] : env) {
        out[key] = render(value, vars, context);
    }
    return out;
}

std::vector<std::string> extractVariableNames(std::string_view tmpl) {
    std::vector<std::string> names;
    std::string s(tmpl);
    for (auto it = std::sregex_iterator(s.begin(), s.end(), placeholderRegex());
         it != std::sregex_iterator(); ++it) {
        auto name = (*it)[1].str();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.push_back(std::move(name));
        }
    }
    return names;
}

const std::map<std::string, std::optional<std::string>>& builtinConfigKeys() {
    static const std::map<std::string, std::optional<std::string>> keys{
        {"port", std::nullopt},
        {"hostname", std::string("hostname")},
        {"url", std::nullopt},
        {"https-cert", std::string("httpsCert")},
        {"https-key", std::string("httpsKey")},
    };
    return keys;
}

bool isBuiltinVariable(const std::string& name) {
    return builtinConfigKeys().count(name) > 0;
}

std::vector<MissingVariable> findMissingVariables(std::string_view tmpl,
                                                  const TemplateVariables& vars) {
    std::vector<MissingVariable> missing;
    for (const auto& name : extractVariableNames(tmpl)) {
        auto it = vars.find(name);
        if (it != vars.end() && !it->second.empty()) {
            continue;
        }
        MissingVariable mv;
        mv.templateVar = name;
        mv.isCustom = !isBuiltinVariable(name);
        if (!mv.isCustom) {
            mv.configKey = builtinConfigKeys().at(name);
        } else {
            mv.configKey = "variables." + name;
        }
        mv.configurable = mv.configKey.has_value();
        missing.push_back(std::move(mv));
    }
    return missing;
}

std::string formatMissingVariablesError(const std::vector<MissingVariable>& missing) {
    if (missing.empty()) {
        return {};
    }
    std::string out = "The following template variables are used but not configured:\n";
    for (const auto& v : missing) {
        out += "\n  {{" + v.templateVar + "}} - ";
        if (v.isCustom) {
            out += "Add with: servherd config --add " + v.templateVar + " --value <value>";
        } else if (v.configurable) {
            out += "Set with: servherd config --set " + *v.configKey + " --value <value>";
        } else {
            out += "This variable is auto-generated and cannot be configured directly";
        }
    }
    return out;
}

TemplateVariables getTemplateVariables(const config::GlobalConfig& config, int port,
                                       std::optional<Protocol> protocol,
                                       std::optional<std::string> hostname) {
    TemplateVariables vars = config.variables;
    const std::string host = hostname.value_or(config.hostname);
    const Protocol proto = protocol.value_or(config.protocol);
    vars["port"] = std::to_string(port);
    vars["hostname"] = host;
    vars["url"] = std::string(protocolToString(proto)) + "://" + host + ":" + std::to_string(port);
    vars["https-cert"] = config.httpsCert.value_or("");
    vars["https-key"] = config.httpsKey.value_or("");
    return vars;
}

Result<EnvMap> parseEnvStrings(const std::vector<std::string>& entries) {
    EnvMap env;
    for (const auto& entry : entries) {
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            return Error{ErrorCode::InvalidArgument, "Invalid environment variable format: \"" +
                                                         entry +
                                                         "\". Expected KEY=VALUE format."};
        }
        if (eq == 0) {
            return Error{ErrorCode::InvalidArgument, "Invalid environment variable format: \"" +
                                                         entry + "\". Key cannot be empty."};
        }
        env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    return env;
}

} // namespace servherd::templates
