#include <servherd/common/pattern_utils.h>
#include <servherd/config/config_helpers.h>
#include <servherd/registry/registry_service.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <random>

namespace servherd::registry {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRegistryVersion = "1";

// RFC 4122 version 4 identifier
std::string newServerId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::array<std::uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        auto word = rng();
        for (size_t k = 0; k < 8; ++k) {
            bytes[i + k] = static_cast<std::uint8_t>(word >> (k * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}

} // namespace

RegistryService::RegistryService() : path_(config::get_registry_path()) {}

RegistryService::RegistryService(fs::path path) : path_(std::move(path)) {}

Result<void> RegistryService::load() {
    servers_.clear();
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::debug("No registry at {}, starting empty", path_.string());
        return Result<void>();
    }

    std::ifstream in(path_);
    if (!in) {
        return Error{ErrorCode::RegistryReadFailed, "Failed to open registry " + path_.string()};
    }
    try {
        auto j = nlohmann::json::parse(in);
        servers_ = j.at("servers").get<std::vector<ServerEntry>>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid registry file {}, using empty registry: {}", path_.string(),
                     e.what());
        servers_.clear();
    }
    spdlog::debug("Loaded {} servers from registry", servers_.size());
    return Result<void>();
}

Result<void> RegistryService::save() const {
    if (!config::ensure_private_dir(path_.parent_path())) {
        return Error{ErrorCode::RegistryWriteFailed,
                     "Failed to create registry directory " + path_.parent_path().string()};
    }

    nlohmann::json j;
    j["version"] = kRegistryVersion;
    j["servers"] = servers_;

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::RegistryWriteFailed, "Failed to open " + tmp.string()};
        }
        out << j.dump(2) << "\n";
        if (!out) {
            return Error{ErrorCode::RegistryWriteFailed, "Failed to write " + tmp.string()};
        }
    }
    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Error{ErrorCode::RegistryWriteFailed,
                     "Failed to replace " + path_.string() + ": " + ec.message()};
    }
    return Result<void>();
}

std::optional<ServerEntry> RegistryService::findByName(const std::string& name) const {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& s) { return s.name == name; });
    if (it == servers_.end())
        return std::nullopt;
    return *it;
}

std::optional<ServerEntry> RegistryService::findByCwdAndName(const std::string& cwd,
                                                             const std::string& name) const {
    auto it = std::find_if(servers_.begin(), servers_.end(), [&](const ServerEntry& s) {
        return s.cwd == cwd && s.name == name;
    });
    if (it == servers_.end())
        return std::nullopt;
    return *it;
}

std::optional<ServerEntry> RegistryService::findByCommandHash(const std::string& cwd,
                                                              const std::string& command) const {
    const auto wanted = config::normalize_command(command);
    auto it = std::find_if(servers_.begin(), servers_.end(), [&](const ServerEntry& s) {
        return s.cwd == cwd && config::normalize_command(s.command) == wanted;
    });
    if (it == servers_.end())
        return std::nullopt;
    return *it;
}

std::optional<ServerEntry> RegistryService::findById(const std::string& id) const {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& s) { return s.id == id; });
    if (it == servers_.end())
        return std::nullopt;
    return *it;
}

Result<ServerEntry> RegistryService::addServer(const NewServer& fields) {
    if (findByName(fields.name)) {
        return Error{ErrorCode::ServerAlreadyExists,
                     "Server \"" + fields.name + "\" already exists"};
    }

    ServerEntry entry;
    entry.id = newServerId();
    entry.name = fields.name;
    entry.command = fields.command;
    entry.resolvedCommand = fields.resolvedCommand.empty() ? fields.command
                                                           : fields.resolvedCommand;
    entry.cwd = fields.cwd;
    entry.port = fields.port;
    entry.protocol = fields.protocol;
    entry.hostname = fields.hostname;
    entry.env = fields.env;
    entry.tags = fields.tags;
    entry.description = fields.description;
    entry.createdAt = config::iso_timestamp_now();
    entry.processHandle = processHandleFor(fields.name);
    entry.usedConfigKeys = fields.usedConfigKeys;
    entry.configSnapshot = fields.configSnapshot;

    servers_.push_back(entry);
    if (auto r = save(); !r) {
        servers_.pop_back();
        return r.error();
    }
    spdlog::debug("Registered server {} ({}) on port {}", entry.name, entry.id, entry.port);
    return entry;
}

Result<ServerEntry> RegistryService::updateServer(const std::string& id,
                                                  const ServerUpdate& update) {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& s) { return s.id == id; });
    if (it == servers_.end()) {
        return Error{ErrorCode::ServerNotFound, "Server with id " + id + " not found"};
    }

    ServerEntry previous = *it;
    if (update.command)
        it->command = *update.command;
    if (update.resolvedCommand)
        it->resolvedCommand = *update.resolvedCommand;
    if (update.port)
        it->port = *update.port;
    if (update.protocol)
        it->protocol = *update.protocol;
    if (update.hostname)
        it->hostname = *update.hostname;
    if (update.env)
        it->env = *update.env;
    if (update.usedConfigKeys)
        it->usedConfigKeys = *update.usedConfigKeys;
    if (update.configSnapshot)
        it->configSnapshot = *update.configSnapshot;
    if (update.processHandle)
        it->processHandle = *update.processHandle;

    if (auto r = save(); !r) {
        *it = std::move(previous);
        return r.error();
    }
    return *it;
}

Result<void> RegistryService::removeServer(const std::string& id) {
    auto it = std::find_if(servers_.begin(), servers_.end(),
                           [&](const ServerEntry& s) { return s.id == id; });
    if (it == servers_.end()) {
        return Error{ErrorCode::ServerNotFound, "Server with id " + id + " not found"};
    }
    ServerEntry removed = *it;
    auto pos = servers_.erase(it);
    if (auto r = save(); !r) {
        servers_.insert(pos, std::move(removed));
        return r;
    }
    return Result<void>();
}

std::vector<ServerEntry> RegistryService::list(const ServerFilter& filter) const {
    std::vector<ServerEntry> out;
    for (const auto& s : servers_) {
        if (filter.name && s.name != *filter.name)
            continue;
        if (filter.tag && !s.hasTag(*filter.tag))
            continue;
        if (filter.cwd && s.cwd != *filter.cwd)
            continue;
        if (filter.cmdGlob && !common::glob_match(s.command, *filter.cmdGlob))
            continue;
        out.push_back(s);
    }
    return out;
}

std::set<std::string> RegistryService::names() const {
    std::set<std::string> out;
    for (const auto& s : servers_)
        out.insert(s.name);
    return out;
}

std::set<int> RegistryService::ports() const {
    std::set<int> out;
    for (const auto& s : servers_)
        out.insert(s.port);
    return out;
}

} // namespace servherd::registry
