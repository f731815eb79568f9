#include <servherd/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace servherd::config {

std::string normalize_command(std::string_view command) {
    std::string out;
    out.reserve(command.size());
    bool pendingSpace = false;
    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::filesystem::path get_home_dir() {
    if (const char* env = std::getenv("SERVHERD_HOME"); env && *env) {
        return expand_tilde(env) / ".servherd";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".servherd";
    }
    return std::filesystem::temp_directory_path() / ".servherd";
}

std::filesystem::path get_config_path() {
    return get_home_dir() / "config.json";
}

std::filesystem::path get_registry_path() {
    return get_home_dir() / "registry.json";
}

std::filesystem::path get_log_dir() {
    return get_home_dir() / "logs";
}

std::filesystem::path get_direct_log_dir() {
    return get_log_dir() / "direct";
}

std::filesystem::path get_daemon_socket_path() {
    if (const char* env = std::getenv("SERVHERD_DAEMON_SOCKET"); env && *env) {
        return expand_tilde(env);
    }
    return get_home_dir() / "daemon.sock";
}

std::filesystem::path get_daemon_pid_path() {
    return get_home_dir() / "daemon.pid";
}

bool ensure_private_dir(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Failed to create directory {}: {}", dir.string(), ec.message());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Could not set permissions on {}: {}", dir.string(), ec.message());
    }
    return true;
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace servherd::config
