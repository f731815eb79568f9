#include <servherd/config/config_helpers.h>
#include <servherd/daemon/daemon_client.h>
#include <servherd/daemon/proto_serializer.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace servherd::daemon {

namespace fs = std::filesystem;
using stream_protocol = boost::asio::local::stream_protocol;

struct DaemonClient::Impl {
    explicit Impl(ClientConfig cfg) : config_(std::move(cfg)), socket_(io_) {}

    ClientConfig config_;
    boost::asio::io_context io_;
    stream_protocol::socket socket_;
    bool connected_{false};
    std::atomic<std::uint64_t> nextRequestId_{1};
};

DaemonClient::DaemonClient(ClientConfig config) {
    if (config.socketPath.empty()) {
        config.socketPath = config::get_daemon_socket_path();
    }
    pImpl = std::make_unique<Impl>(std::move(config));
}

DaemonClient::~DaemonClient() {
    disconnect();
}

const fs::path& DaemonClient::socketPath() const {
    return pImpl->config_.socketPath;
}

bool DaemonClient::isConnected() const {
    return pImpl->connected_;
}

void DaemonClient::disconnect() {
    if (!pImpl || !pImpl->connected_) {
        return;
    }
    boost::system::error_code ec;
    pImpl->socket_.shutdown(stream_protocol::socket::shutdown_both, ec);
    pImpl->socket_.close(ec);
    pImpl->connected_ = false;
    spdlog::debug("Disconnected from daemon");
}

Result<void> DaemonClient::tryConnect() {
    boost::system::error_code ec;
    if (pImpl->socket_.is_open()) {
        pImpl->socket_.close(ec);
    }
    pImpl->socket_.connect(stream_protocol::endpoint(pImpl->config_.socketPath.string()), ec);
    if (ec) {
        pImpl->socket_.close(ec);
        return Error{ErrorCode::BackendConnectionFailed,
                     "Cannot connect to daemon at " + pImpl->config_.socketPath.string() + ": " +
                         ec.message()};
    }

    const auto ms = pImpl->config_.requestTimeout.count();
    timeval tv{static_cast<time_t>(ms / 1000), static_cast<suseconds_t>((ms % 1000) * 1000)};
    const int fd = pImpl->socket_.native_handle();
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        spdlog::debug("Failed to set daemon socket timeouts: {}", std::strerror(errno));
    }
    pImpl->connected_ = true;
    return Result<void>();
}

Result<void> DaemonClient::connect() {
    if (pImpl->connected_) {
        return Result<void>();
    }
    auto first = tryConnect();
    if (first) {
        spdlog::debug("Connected to daemon at {}", pImpl->config_.socketPath.string());
        return first;
    }
    if (!pImpl->config_.autoStart) {
        return first;
    }

    spdlog::debug("Daemon not reachable ({}), starting it", first.error().message);
    if (auto started = startDaemon(pImpl->config_); !started) {
        spdlog::warn("Failed to auto-start daemon: {}",
                     config::sanitize_for_terminal(started.error().message));
        return started.error();
    }

    const auto baseDelay = std::chrono::milliseconds(100);
    for (int i = 0; i < pImpl->config_.maxRetries; ++i) {
        std::this_thread::sleep_for(baseDelay * (1 << std::min(i, 5)));
        if (tryConnect()) {
            spdlog::debug("Daemon started successfully after {} retries", i + 1);
            return Result<void>();
        }
    }
    return Error{ErrorCode::BackendConnectionFailed, "Daemon failed to start after retries"};
}

Result<Response> DaemonClient::call(const Request& request) {
    if (auto c = connect(); !c) {
        return c.error();
    }

    Message msg;
    msg.version = PROTOCOL_VERSION;
    msg.requestId = pImpl->nextRequestId_.fetch_add(1);
    msg.payload = request;

    auto encoded = ProtoSerializer::encode_payload(msg);
    if (!encoded) {
        return encoded.error();
    }
    const auto header = encodeFrameHeader(static_cast<std::uint32_t>(encoded.value().size()));

    boost::system::error_code ec;
    std::vector<boost::asio::const_buffer> out{boost::asio::buffer(header),
                                               boost::asio::buffer(encoded.value())};
    boost::asio::write(pImpl->socket_, out, ec);
    if (ec) {
        disconnect();
        return Error{ErrorCode::BackendConnectionFailed,
                     std::string{"Failed to send "} + requestName(request) +
                         " request: " + ec.message()};
    }

    std::array<std::uint8_t, FRAME_HEADER_SIZE> inHeader{};
    boost::asio::read(pImpl->socket_, boost::asio::buffer(inHeader), ec);
    if (ec) {
        disconnect();
        const bool timedOut = ec == boost::asio::error::would_block ||
                              ec == boost::asio::error::try_again ||
                              ec == boost::asio::error::timed_out;
        return Error{timedOut ? ErrorCode::Timeout : ErrorCode::BackendConnectionFailed,
                     std::string{"No response to "} + requestName(request) +
                         " request: " + ec.message()};
    }
    auto size = decodeFrameHeader(inHeader);
    if (!size) {
        disconnect();
        return size.error();
    }
    std::vector<std::uint8_t> payload(size.value());
    boost::asio::read(pImpl->socket_, boost::asio::buffer(payload), ec);
    if (ec) {
        disconnect();
        return Error{ErrorCode::BackendConnectionFailed,
                     "Truncated response from daemon: " + ec.message()};
    }

    auto decoded = ProtoSerializer::decode_payload(payload);
    if (!decoded) {
        return decoded.error();
    }
    auto* response = std::get_if<Response>(&decoded.value().payload);
    if (!response) {
        return Error{ErrorCode::InternalError, "Daemon answered with a request"};
    }
    return *response;
}

Result<PongResponse> DaemonClient::ping() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    auto r = call(PingRequest{static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now).count())});
    if (!r) {
        return r.error();
    }
    if (auto* pong = std::get_if<PongResponse>(&r.value())) {
        return *pong;
    }
    if (auto* err = std::get_if<ErrorResponse>(&r.value())) {
        return Error{err->code, err->message};
    }
    return Error{ErrorCode::InternalError, "Unexpected response to ping"};
}

std::string DaemonClient::resolveDaemonBinary() {
    if (const char* bin = std::getenv("SERVHERD_DAEMON_BIN"); bin && *bin) {
        return bin;
    }
    char buf[4096];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n > 0) {
        buf[n] = '\0';
        const auto cliDir = fs::path(buf).parent_path();
        const std::vector<fs::path> candidates = {
            cliDir / "servherd-daemon", cliDir.parent_path() / "servherd-daemon",
            cliDir.parent_path() / "daemon" / "servherd-daemon"};
        for (const auto& p : candidates) {
            std::error_code ec;
            if (fs::exists(p, ec)) {
                return p.string();
            }
        }
    }
    return "servherd-daemon";
}

Result<void> DaemonClient::startDaemon(const ClientConfig& config) {
    const auto socketPath =
        config.socketPath.empty() ? config::get_daemon_socket_path() : config.socketPath;
    const auto exePath = resolveDaemonBinary();
    spdlog::info("Starting servherd daemon ({})", exePath);

    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::BackendConnectionFailed,
                     "Failed to fork: " + std::string(std::strerror(errno))};
    }

    if (pid == 0) {
        // Own session, and our stdio detached so the CLI's output stays clean
        (void)::setsid();
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            (void)::dup2(devnull, STDIN_FILENO);
            (void)::dup2(devnull, STDOUT_FILENO);
            (void)::dup2(devnull, STDERR_FILENO);
            if (devnull > 2)
                ::close(devnull);
        }
        ::setenv("SERVHERD_DAEMON_SOCKET", socketPath.c_str(), 1);
        ::execlp(exePath.c_str(), exePath.c_str(), "--socket", socketPath.c_str(), "--foreground",
                 static_cast<char*>(nullptr));
        ::_exit(127);
    }

    spdlog::debug("Daemon process spawned (pid={}), polling for readiness", pid);
    return Result<void>();
}

} // namespace servherd::daemon
