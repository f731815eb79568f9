#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <servherd/config/global_config.h>
#include <servherd/core/types.h>

namespace servherd::config {

/**
 * @brief Loads, merges and persists the servherd configuration
 *
 * Precedence (lowest to highest): built-in defaults, the global config file, the nearest
 * project config (.servherdrc, .servherdrc.json or a "servherd" key in package.json),
 * then SERVHERD_* environment overrides. In CI mode both files are skipped.
 */
class ConfigService {
public:
    struct LoadOptions {
        bool ciMode{false};
        std::optional<std::filesystem::path> searchFrom;
    };

    ConfigService();
    explicit ConfigService(std::filesystem::path globalConfigPath);

    Result<GlobalConfig> load();
    Result<GlobalConfig> load(const LoadOptions& opts);

    /// Writes the config to the global file (dir 0700, file 0600)
    Result<void> save(const GlobalConfig& config);

    /**
     * Reads a single value by dotted key (hostname, protocol, portRange.min, portRange.max,
     * tempDir, httpsCert, httpsKey, refreshOnChange, variables.<name>).
     */
    Result<std::string> get(const std::string& key) const;

    /// Validates and applies a single value to the global file
    Result<void> set(const std::string& key, const std::string& value);

    /// Adds or replaces a custom template variable
    Result<void> addVariable(const std::string& name, const std::string& value);

    /// Removes a custom variable from the global file
    Result<void> removeVariable(const std::string& name);

    static GlobalConfig getDefaults() { return GlobalConfig{}; }

    const GlobalConfig& current() const { return config_; }
    const std::filesystem::path& configPath() const { return globalConfigPath_; }
    const std::optional<std::filesystem::path>& loadedProjectPath() const {
        return loadedProjectPath_;
    }

    /// Applies a key/value onto a config without persisting it
    static Result<GlobalConfig> applyValue(const GlobalConfig& base, const std::string& key,
                                           const std::string& value);

    /// Applies SERVHERD_* environment overrides
    static GlobalConfig applyEnvironmentOverrides(GlobalConfig config);

private:
    std::optional<GlobalConfig> loadGlobalConfig() const;
    std::optional<std::pair<std::filesystem::path, nlohmann::json>>
    searchProjectConfig(const std::filesystem::path& from) const;

    std::filesystem::path globalConfigPath_;
    std::optional<std::filesystem::path> loadedProjectPath_;
    GlobalConfig config_{};
};

} // namespace servherd::config
