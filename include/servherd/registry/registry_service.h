#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <servherd/core/types.h>
#include <servherd/registry/server_entry.h>

namespace servherd::registry {

struct ServerFilter {
    std::optional<std::string> name;
    std::optional<std::string> tag;
    std::optional<std::string> cwd;
    /// Glob over the unrendered command, brace expansion supported
    std::optional<std::string> cmdGlob;
};

/// Fields supplied when registering a new server
struct NewServer {
    std::string name;
    std::string command;
    std::string resolvedCommand;
    std::string cwd;
    int port{0};
    Protocol protocol{Protocol::Http};
    std::string hostname;
    EnvMap env;
    std::vector<std::string> tags;
    std::optional<std::string> description;
    std::vector<std::string> usedConfigKeys;
    std::optional<ConfigSnapshot> configSnapshot;
};

/// Partial update; only engaged fields are written
struct ServerUpdate {
    std::optional<std::string> command;
    std::optional<std::string> resolvedCommand;
    std::optional<int> port;
    std::optional<Protocol> protocol;
    std::optional<std::string> hostname;
    std::optional<EnvMap> env;
    std::optional<std::vector<std::string>> usedConfigKeys;
    std::optional<ConfigSnapshot> configSnapshot;
    std::optional<std::string> processHandle;
};

/**
 * @brief JSON-file backed registry of managed servers
 *
 * The file holds {"version":"1","servers":[...]}. Each mutation is written through
 * immediately. The registry assumes one servherd invocation at a time and does no locking.
 */
class RegistryService {
public:
    RegistryService();
    explicit RegistryService(std::filesystem::path path);

    /// Reads the file; a missing file is an empty registry, a corrupt one is logged and reset
    Result<void> load();
    Result<void> save() const;

    std::optional<ServerEntry> findByName(const std::string& name) const;
    std::optional<ServerEntry> findByCwdAndName(const std::string& cwd,
                                                const std::string& name) const;
    /// Matches cwd exactly and the command after whitespace normalization
    std::optional<ServerEntry> findByCommandHash(const std::string& cwd,
                                                 const std::string& command) const;
    std::optional<ServerEntry> findById(const std::string& id) const;

    /// Fails with ServerAlreadyExists when the name is taken
    Result<ServerEntry> addServer(const NewServer& fields);
    Result<ServerEntry> updateServer(const std::string& id, const ServerUpdate& update);
    Result<void> removeServer(const std::string& id);

    std::vector<ServerEntry> list(const ServerFilter& filter = {}) const;
    const std::vector<ServerEntry>& servers() const { return servers_; }

    std::set<std::string> names() const;
    std::set<int> ports() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::vector<ServerEntry> servers_;
};

} // namespace servherd::registry
