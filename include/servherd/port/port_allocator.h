#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <servherd/config/global_config.h>
#include <servherd/core/types.h>

namespace servherd::port {

struct PortAssignment {
    int port{0};
    bool reassigned{false};
    /// The port that was requested or preferred before conflict resolution
    int requestedPort{0};
};

/// 32-bit FNV-1a over the bytes of `input`
constexpr std::uint32_t fnv1a32(std::string_view input) noexcept {
    std::uint32_t hash = 0x811c9dc5u;
    for (char c : input) {
        hash ^= static_cast<std::uint8_t>(c);
        hash *= 0x01000193u;
    }
    return hash;
}

/**
 * Probes whether a TCP port can be bound on all interfaces.
 * Address-in-use yields false; any other bind failure is returned as an error.
 */
Result<bool> probeTcpPort(int port);

/**
 * @brief Deterministic port assignment with conflict resolution
 *
 * The preferred port for (cwd, command) is stable across runs and machines. In CI mode,
 * ports claimed by other CI invocations within the last hour are tracked in a lease file
 * under the configured temp directory.
 */
class PortAllocator {
public:
    using Probe = std::function<Result<bool>(int)>;

    static constexpr std::chrono::milliseconds kLeaseTtl{std::chrono::hours(1)};
    static constexpr const char* kLeaseFileName = "ci-ports.json";

    explicit PortAllocator(const config::GlobalConfig& config, Probe probe = probeTcpPort);

    /// FNV-1a of `cwd + ":" + normalized(command)` reduced into the configured range
    int preferredPort(std::string_view cwd, std::string_view command) const;

    Result<bool> isAvailable(int port) const;

    /// Fails with PortOutOfRange when `port` lies outside the configured range
    Result<void> validateInRange(int port) const;

    /**
     * Picks a port for (cwd, command).
     *
     * An explicit port is validated against the range and used as the start point,
     * otherwise the preferred port is. CI mode walks upward (wrapping at max) past ports
     * leased by other CI runs or registered in `registryPorts`; the chosen port is tracked
     * for the next saveCiUsedPorts(). Outside CI mode the start port is probed first and
     * the search moves upward only on conflict.
     */
    Result<PortAssignment> assign(std::string_view cwd, std::string_view command,
                                  std::optional<int> explicitPort = std::nullopt,
                                  bool ciMode = false,
                                  const std::set<int>& registryPorts = {});

    /// Merges non-stale ports from the lease file into the in-memory set
    void loadCiUsedPorts();

    /// Writes the in-memory set with a fresh timestamp
    void saveCiUsedPorts();

    void trackUsedPort(int port) { ciUsedPorts_.insert(port); }
    void clearUsedPorts() { ciUsedPorts_.clear(); }
    const std::set<int>& ciUsedPorts() const { return ciUsedPorts_; }

    std::filesystem::path leaseFile() const;
    const config::PortRange& range() const { return range_; }

private:
    config::PortRange range_;
    std::filesystem::path tempDir_;
    Probe probe_;
    std::set<int> ciUsedPorts_;
};

} // namespace servherd::port
