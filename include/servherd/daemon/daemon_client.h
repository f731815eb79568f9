#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

#include <servherd/core/types.h>
#include <servherd/daemon/ipc_protocol.h>

namespace servherd::daemon {

struct ClientConfig {
    std::filesystem::path socketPath; ///< empty: resolved from the environment
    std::chrono::milliseconds requestTimeout{30000};
    bool autoStart{true};
    int maxRetries{10};
};

/**
 * @brief Blocking client for servherd-daemon
 *
 * One UNIX stream connection is opened on first use and reused for every request of the
 * invocation. When nothing listens on the socket and autoStart is set, the daemon binary is
 * launched and the connection retried with exponential backoff.
 */
class DaemonClient {
public:
    explicit DaemonClient(ClientConfig config = {});
    ~DaemonClient();

    DaemonClient(const DaemonClient&) = delete;
    DaemonClient& operator=(const DaemonClient&) = delete;

    Result<void> connect();
    void disconnect();
    bool isConnected() const;

    /// One request/response exchange; an ErrorResponse is returned as a Response, not an Error
    Result<Response> call(const Request& request);

    Result<PongResponse> ping();

    const std::filesystem::path& socketPath() const;

    /// Forks and execs servherd-daemon detached from our stdio
    static Result<void> startDaemon(const ClientConfig& config);

    /// SERVHERD_DAEMON_BIN, then binaries next to this executable, then PATH
    static std::string resolveDaemonBinary();

private:
    Result<void> tryConnect();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace servherd::daemon
