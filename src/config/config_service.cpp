#include <servherd/config/config_helpers.h>
#include <servherd/config/config_service.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <system_error>

namespace servherd::config {

namespace fs = std::filesystem;

namespace {

std::optional<nlohmann::json> readJsonFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

std::optional<int> parsePort(const std::string& s) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ConfigService::ConfigService() : globalConfigPath_(get_config_path()) {}

ConfigService::ConfigService(fs::path globalConfigPath)
    : globalConfigPath_(std::move(globalConfigPath)) {}

Result<GlobalConfig> ConfigService::load() {
    return load(LoadOptions{});
}

Result<GlobalConfig> ConfigService::load(const LoadOptions& opts) {
    GlobalConfig base = getDefaults();
    loadedProjectPath_.reset();

    if (opts.ciMode) {
        spdlog::debug("CI mode: skipping config files, using defaults and environment");
    } else {
        if (auto global = loadGlobalConfig()) {
            base = std::move(*global);
        }

        std::error_code ec;
        fs::path from = opts.searchFrom ? *opts.searchFrom : fs::current_path(ec);
        if (!from.empty()) {
            if (auto project = searchProjectConfig(from)) {
                auto merged = mergeJson(base, project->second);
                if (!merged) {
                    return Error{ErrorCode::ConfigInvalid,
                                 project->first.string() + ": " + merged.error().message};
                }
                base = std::move(merged).value();
                loadedProjectPath_ = project->first;
                spdlog::debug("Loaded project config from {}", project->first.string());
            }
        }
    }

    config_ = applyEnvironmentOverrides(std::move(base));
    if (auto v = validate(config_); !v) {
        return v.error();
    }
    return config_;
}

std::optional<GlobalConfig> ConfigService::loadGlobalConfig() const {
    std::error_code ec;
    if (!fs::exists(globalConfigPath_, ec)) {
        spdlog::debug("No global config found at {}", globalConfigPath_.string());
        return std::nullopt;
    }
    auto json = readJsonFile(globalConfigPath_);
    if (!json) {
        spdlog::warn("Invalid global config file {}, ignoring", globalConfigPath_.string());
        return std::nullopt;
    }
    auto merged = mergeJson(getDefaults(), *json);
    if (!merged) {
        spdlog::warn("Invalid global config file, ignoring: {}", merged.error().message);
        return std::nullopt;
    }
    spdlog::debug("Loaded global config from {}", globalConfigPath_.string());
    return std::move(merged).value();
}

std::optional<std::pair<fs::path, nlohmann::json>>
ConfigService::searchProjectConfig(const fs::path& from) const {
    std::error_code ec;
    fs::path dir = fs::absolute(from, ec);
    if (ec) {
        return std::nullopt;
    }

    while (true) {
        auto pkg = dir / "package.json";
        if (fs::exists(pkg, ec)) {
            if (auto json = readJsonFile(pkg); json && json->is_object()) {
                if (auto it = json->find("servherd"); it != json->end() && it->is_object()) {
                    return std::make_pair(pkg, *it);
                }
            }
        }
        for (const char* name : {".servherdrc", ".servherdrc.json"}) {
            auto candidate = dir / name;
            if (candidate == globalConfigPath_) {
                continue;
            }
            if (fs::is_regular_file(candidate, ec)) {
                if (auto json = readJsonFile(candidate)) {
                    return std::make_pair(candidate, *json);
                }
            }
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

GlobalConfig ConfigService::applyEnvironmentOverrides(GlobalConfig config) {
    auto env = [](const char* name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name); v && *v) {
            return std::string(v);
        }
        return std::nullopt;
    };

    if (auto v = env("SERVHERD_HOSTNAME"))
        config.hostname = *v;
    if (auto v = env("SERVHERD_PROTOCOL")) {
        if (auto p = protocolFromString(*v)) {
            config.protocol = *p;
        } else {
            spdlog::warn("Ignoring SERVHERD_PROTOCOL={}: expected http or https", *v);
        }
    }
    if (auto v = env("SERVHERD_PORT_MIN")) {
        if (auto p = parsePort(*v)) {
            config.portRange.min = *p;
        } else {
            spdlog::warn("Ignoring SERVHERD_PORT_MIN={}: not a number", *v);
        }
    }
    if (auto v = env("SERVHERD_PORT_MAX")) {
        if (auto p = parsePort(*v)) {
            config.portRange.max = *p;
        } else {
            spdlog::warn("Ignoring SERVHERD_PORT_MAX={}: not a number", *v);
        }
    }
    if (auto v = env("SERVHERD_TEMP_DIR"))
        config.tempDir = *v;
    if (auto v = env("SERVHERD_HTTPS_CERT"))
        config.httpsCert = *v;
    if (auto v = env("SERVHERD_HTTPS_KEY"))
        config.httpsKey = *v;
    return config;
}

Result<void> ConfigService::save(const GlobalConfig& config) {
    if (auto v = validate(config); !v) {
        return v;
    }
    if (!ensure_private_dir(globalConfigPath_.parent_path())) {
        return Error{ErrorCode::ConfigWriteFailed,
                     "Failed to create config directory " +
                         globalConfigPath_.parent_path().string()};
    }

    auto tmp = globalConfigPath_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::ConfigWriteFailed,
                         "Failed to open " + tmp.string() + " for writing"};
        }
        out << toJson(config).dump(2) << "\n";
        if (!out) {
            return Error{ErrorCode::ConfigWriteFailed, "Failed to write " + tmp.string()};
        }
    }

    std::error_code ec;
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace,
                    ec);
    fs::rename(tmp, globalConfigPath_, ec);
    if (ec) {
        return Error{ErrorCode::ConfigWriteFailed,
                     "Failed to replace " + globalConfigPath_.string() + ": " + ec.message()};
    }
    config_ = config;
    spdlog::debug("Saved config to {}", globalConfigPath_.string());
    return Result<void>();
}

Result<std::string> ConfigService::get(const std::string& key) const {
    if (key == "version")
        return config_.version;
    if (key == "hostname")
        return config_.hostname;
    if (key == "protocol")
        return std::string(protocolToString(config_.protocol));
    if (key == "portRange.min")
        return std::to_string(config_.portRange.min);
    if (key == "portRange.max")
        return std::to_string(config_.portRange.max);
    if (key == "tempDir")
        return config_.tempDir;
    if (key == "httpsCert")
        return config_.httpsCert.value_or("");
    if (key == "httpsKey")
        return config_.httpsKey.value_or("");
    if (key == "refreshOnChange")
        return std::string(refreshOnChangeToString(config_.refreshOnChange));
    if (key.rfind("variables.", 0) == 0) {
        auto name = key.substr(10);
        if (auto it = config_.variables.find(name); it != config_.variables.end()) {
            return it->second;
        }
        return Error{ErrorCode::ConfigNotFound, "Variable \"" + name + "\" is not defined"};
    }
    return Error{ErrorCode::InvalidArgument, "Unknown config key: " + key};
}

Result<GlobalConfig> ConfigService::applyValue(const GlobalConfig& base, const std::string& key,
                                               const std::string& value) {
    GlobalConfig next = base;
    if (key == "hostname") {
        if (value.empty())
            return Error{ErrorCode::InvalidArgument, "hostname must not be empty"};
        next.hostname = value;
    } else if (key == "protocol") {
        auto p = protocolFromString(value);
        if (!p)
            return Error{ErrorCode::InvalidArgument, "protocol must be \"http\" or \"https\""};
        next.protocol = *p;
    } else if (key == "portRange.min" || key == "portRange.max") {
        auto p = parsePort(value);
        if (!p || *p < 1 || *p > 65535) {
            return Error{ErrorCode::InvalidArgument,
                         key + " must be a number between 1 and 65535"};
        }
        (key == "portRange.min" ? next.portRange.min : next.portRange.max) = *p;
    } else if (key == "tempDir") {
        next.tempDir = value;
    } else if (key == "httpsCert") {
        next.httpsCert = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else if (key == "httpsKey") {
        next.httpsKey = value.empty() ? std::nullopt : std::optional<std::string>(value);
    } else if (key == "refreshOnChange") {
        auto r = refreshOnChangeFromString(value);
        if (!r) {
            return Error{ErrorCode::InvalidArgument,
                         "refreshOnChange must be one of manual, on-start, prompt, auto"};
        }
        next.refreshOnChange = *r;
    } else if (key.rfind("variables.", 0) == 0) {
        next.variables[key.substr(10)] = value;
    } else {
        return Error{ErrorCode::InvalidArgument, "Unknown config key: " + key};
    }

    if (auto v = validate(next); !v) {
        return Error{ErrorCode::InvalidArgument, v.error().message};
    }
    return next;
}

Result<void> ConfigService::set(const std::string& key, const std::string& value) {
    // Overrides from the project file and environment stay out of the global file
    auto stored = applyValue(loadGlobalConfig().value_or(getDefaults()), key, value);
    if (!stored) {
        return stored.error();
    }
    auto live = applyValue(config_, key, value);
    if (auto r = save(stored.value()); !r) {
        return r;
    }
    if (live) {
        config_ = std::move(live).value();
    }
    return Result<void>();
}

Result<void> ConfigService::addVariable(const std::string& name, const std::string& value) {
    if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '_' || c == '-';
        })) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid variable name \"" + name +
                         "\". Variable names can only contain letters, numbers, underscores, "
                         "and hyphens."};
    }
    if (isReservedVariableName(name)) {
        std::string reserved;
        for (const char* r : kReservedVariableNames) {
            reserved += reserved.empty() ? r : std::string(", ") + r;
        }
        return Error{ErrorCode::InvalidArgument,
                     "\"" + name + "\" is a reserved variable name. Reserved names: " + reserved};
    }
    return set("variables." + name, value);
}

Result<void> ConfigService::removeVariable(const std::string& name) {
    GlobalConfig stored = loadGlobalConfig().value_or(getDefaults());
    if (stored.variables.erase(name) == 0) {
        return Error{ErrorCode::ConfigNotFound, "Variable \"" + name + "\" does not exist"};
    }
    GlobalConfig live = config_;
    live.variables.erase(name);
    if (auto r = save(stored); !r) {
        return r;
    }
    config_ = std::move(live);
    return Result<void>();
}

} // namespace servherd::config
