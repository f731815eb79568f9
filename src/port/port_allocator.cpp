#include <servherd/config/config_helpers.h>
#include <servherd/port/port_allocator.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace servherd::port {

namespace fs = std::filesystem;

Result<bool> probeTcpPort(int port) {
    using boost::asio::ip::tcp;
    boost::asio::io_context io;
    tcp::acceptor acceptor(io);
    boost::system::error_code ec;

    acceptor.open(tcp::v4(), ec);
    if (ec) {
        return Error{ErrorCode::NetworkError, "Failed to open probe socket: " + ec.message()};
    }
    acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    acceptor.bind(tcp::endpoint(tcp::v4(), static_cast<unsigned short>(port)), ec);
    if (!ec) {
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    boost::system::error_code closeEc;
    acceptor.close(closeEc);

    if (!ec) {
        return true;
    }
    if (ec == boost::asio::error::address_in_use) {
        return false;
    }
    return Error{ErrorCode::NetworkError,
                 "Failed to probe port " + std::to_string(port) + ": " + ec.message()};
}

PortAllocator::PortAllocator(const config::GlobalConfig& config, Probe probe)
    : range_(config.portRange), tempDir_(config::expand_tilde(config.tempDir)),
      probe_(std::move(probe)) {}

int PortAllocator::preferredPort(std::string_view cwd, std::string_view command) const {
    std::string input(cwd);
    input.push_back(':');
    input += config::normalize_command(command);
    const auto span = static_cast<std::uint32_t>(range_.max - range_.min + 1);
    return range_.min + static_cast<int>(fnv1a32(input) % span);
}

Result<bool> PortAllocator::isAvailable(int port) const {
    return probe_(port);
}

Result<void> PortAllocator::validateInRange(int port) const {
    if (!range_.contains(port)) {
        return Error{ErrorCode::PortOutOfRange,
                     "Port " + std::to_string(port) + " is outside configured range " +
                         std::to_string(range_.min) + "-" + std::to_string(range_.max)};
    }
    return Result<void>();
}

Result<PortAssignment> PortAllocator::assign(std::string_view cwd, std::string_view command,
                                             std::optional<int> explicitPort, bool ciMode,
                                             const std::set<int>& registryPorts) {
    int start = 0;
    if (explicitPort) {
        if (auto v = validateInRange(*explicitPort); !v) {
            return v.error();
        }
        start = *explicitPort;
    } else {
        start = preferredPort(cwd, command);
    }

    const int span = range_.max - range_.min + 1;
    for (int i = 0; i < span; ++i) {
        const int candidate = range_.min + (start - range_.min + i) % span;

        if (ciMode && (ciUsedPorts_.count(candidate) || registryPorts.count(candidate))) {
            continue;
        }

        auto available = isAvailable(candidate);
        if (!available) {
            return available.error();
        }
        if (!available.value()) {
            spdlog::debug("Port {} is in use", candidate);
            continue;
        }

        if (ciMode) {
            trackUsedPort(candidate);
        }
        if (candidate != start) {
            spdlog::info("Port {} unavailable, using {}", start, candidate);
        }
        return PortAssignment{candidate, candidate != start, start};
    }

    return Error{ErrorCode::PortUnavailable, "No available ports in range " +
                                                 std::to_string(range_.min) + "-" +
                                                 std::to_string(range_.max)};
}

fs::path PortAllocator::leaseFile() const {
    return tempDir_ / kLeaseFileName;
}

// The lease file is shared between concurrent CI jobs without any locking. Two jobs that
// read it at the same moment can still pick the same port; the TTL and the skip list are
// the only mitigation.
void PortAllocator::loadCiUsedPorts() {
    const auto path = leaseFile();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return;
    }
    try {
        std::ifstream in(path);
        auto j = nlohmann::json::parse(in);
        const auto timestamp = j.at("timestamp").get<std::int64_t>();
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
        if (now - timestamp >= kLeaseTtl.count()) {
            spdlog::debug("CI ports file is stale, ignoring");
            return;
        }
        for (const auto& p : j.at("ports")) {
            ciUsedPorts_.insert(p.get<int>());
        }
        spdlog::debug("Loaded {} CI ports from {}", ciUsedPorts_.size(), path.string());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Failed to load CI ports file, starting fresh: {}", e.what());
    }
}

void PortAllocator::saveCiUsedPorts() {
    const auto path = leaseFile();
    std::error_code ec;
    fs::create_directories(tempDir_, ec);
    if (ec) {
        spdlog::warn("Failed to create {}: {}", tempDir_.string(), ec.message());
        return;
    }

    nlohmann::json j;
    j["ports"] = ciUsedPorts_;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::warn("Failed to save CI ports file {}", path.string());
        return;
    }
    out << j.dump();
    spdlog::debug("Saved {} CI ports to {}", ciUsedPorts_.size(), path.string());
}

} // namespace servherd::port
