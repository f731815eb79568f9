#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

namespace servherd::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Terminal sanitization
inline std::string sanitize_for_terminal(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (c >= 0x20 && c <= 0x7E) {
            out.push_back(static_cast<char>(c));
        } else if (c == '\n' || c == '\r' || c == '\t' || c >= 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('?');
        }
    }
    return out;
}

/// Trims and collapses internal whitespace runs to a single space
std::string normalize_command(std::string_view command);

/// Returns the servherd home directory
/// $SERVHERD_HOME/.servherd, otherwise ~/.servherd
std::filesystem::path get_home_dir();

/// Global configuration file: <home>/config.json
std::filesystem::path get_config_path();

/// Server registry file: <home>/registry.json
std::filesystem::path get_registry_path();

/// Log directory used by the supervisor daemon: <home>/logs
std::filesystem::path get_log_dir();

/// Log directory used by direct-spawned children: <home>/logs/direct
std::filesystem::path get_direct_log_dir();

/// Daemon socket: $SERVHERD_DAEMON_SOCKET, otherwise <home>/daemon.sock
std::filesystem::path get_daemon_socket_path();

/// Daemon pid file: <home>/daemon.pid
std::filesystem::path get_daemon_pid_path();

/// Creates a directory tree and applies mode 0700 to the leaf
bool ensure_private_dir(const std::filesystem::path& dir);

/// Current time as ISO-8601 UTC with millisecond precision (2025-01-01T10:00:00.123Z)
std::string iso_timestamp_now();

} // namespace servherd::config
