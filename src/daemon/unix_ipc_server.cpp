#include <servherd/daemon/unix_ipc_server.h>

#include <servherd/daemon/ipc_protocol.h>
#include <servherd/daemon/proto_serializer.h>
#include <servherd/daemon/request_dispatcher.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

namespace servherd::daemon {

UnixIpcServer::UnixIpcServer(const Config& cfg, RequestDispatcher* dispatcher)
    : cfg_(cfg), dispatcher_(dispatcher) {}

UnixIpcServer::~UnixIpcServer() {
    if (running_.load()) {
        (void)stop();
    }
}

Result<void> UnixIpcServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "IPC server already running"};
    }

    // Ensure socket directory exists and remove stale path
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!cfg_.socketPath.empty()) {
        fs::create_directories(cfg_.socketPath.parent_path(), ec);
        if (ec) {
            running_ = false;
            return Error{ErrorCode::IOError,
                         "Failed to prepare socket directory: " + ec.message()};
        }
        if (fs::exists(cfg_.socketPath, ec)) {
            fs::remove(cfg_.socketPath, ec);
        }
    }

    if (auto r = bind_and_listen(); !r) {
        running_ = false;
        return r;
    }

    accept_thread_ = std::jthread([this](std::stop_token tok) { accept_loop(tok); });

    spdlog::info("IPC server listening on {}", cfg_.socketPath.string());
    return Result<void>();
}

Result<void> UnixIpcServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "IPC server not running"};
    }

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    // Client threads notice running_ within one poll interval
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    while (active_.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    if (active_.load() > 0) {
        spdlog::warn("{} IPC connection(s) still open at shutdown", active_.load());
    }

    if (!cfg_.socketPath.empty()) {
        std::error_code ec;
        std::filesystem::remove(cfg_.socketPath, ec);
        if (!ec) {
            spdlog::debug("Removed IPC socket {}", cfg_.socketPath.string());
        }
    }

    return Result<void>();
}

Result<void> UnixIpcServer::bind_and_listen() {
    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        return Error{ErrorCode::NetworkError,
                     std::string{"socket(AF_UNIX) failed: "} + std::strerror(errno)};
    }

    // Make non-blocking
    int flags = fcntl(listen_fd_, F_GETFL, 0);
    if (flags >= 0)
        fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::string spath = cfg_.socketPath.string();
    if (spath.size() >= sizeof(addr.sun_path)) {
        ::close(listen_fd_);
        listen_fd_ = -1;
        return Error{ErrorCode::InvalidArgument, "Socket path too long"};
    }
    std::strncpy(addr.sun_path, spath.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int e = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        return Error{ErrorCode::NetworkError, std::string{"bind failed: "} + std::strerror(e)};
    }

    if (::chmod(spath.c_str(), static_cast<mode_t>(cfg_.permission_octal)) != 0) {
        spdlog::debug("chmod {} failed: {}", spath, std::strerror(errno));
    }

    if (::listen(listen_fd_, cfg_.backlog) < 0) {
        int e = errno;
        ::close(listen_fd_);
        listen_fd_ = -1;
        return Error{ErrorCode::NetworkError, std::string{"listen failed: "} + std::strerror(e)};
    }

    return Result<void>();
}

void UnixIpcServer::accept_loop(std::stop_token token) {
    spdlog::debug("IPC accept loop started");
    while (!token.stop_requested()) {
        sockaddr_un client_addr{};
        socklen_t len = sizeof(client_addr);
        int cfd = ::accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &len,
                            SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                using namespace std::chrono_literals;
                std::this_thread::sleep_for(5ms);
                continue;
            }
            if (errno == EINTR)
                continue;
            spdlog::debug("accept failed: {}", std::strerror(errno));
            break;
        }

        active_.fetch_add(1);
        std::thread([this, cfd]() {
            handle_client(cfd);
            ::close(cfd);
            active_.fetch_sub(1);
        }).detach();
    }
    spdlog::debug("IPC accept loop exiting");
}

bool UnixIpcServer::read_exact(int fd, void* buf, std::size_t len) {
    auto* p = static_cast<std::uint8_t*>(buf);
    std::size_t got = 0;
    while (got < len) {
        pollfd pfd{fd, POLLIN, 0};
        int pr = ::poll(&pfd, 1, 200);
        if (pr < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (pr == 0) {
            if (!running_.load())
                return false;
            continue;
        }
        ssize_t n = ::recv(fd, p + got, len - got, 0);
        if (n == 0) {
            return false;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            spdlog::debug("recv failed: {}", std::strerror(errno));
            return false;
        }
        got += static_cast<std::size_t>(n);
    }
    return true;
}

bool UnixIpcServer::write_all(int fd, const void* buf, std::size_t len) {
    const auto* p = static_cast<const std::uint8_t*>(buf);
    std::size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd, p + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            spdlog::debug("send failed: {}", std::strerror(errno));
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

void UnixIpcServer::handle_client(int client_fd) {
    while (running_.load()) {
        std::array<std::uint8_t, FRAME_HEADER_SIZE> header{};
        if (!read_exact(client_fd, header.data(), header.size())) {
            return;
        }

        Response response;
        std::uint64_t requestId = 0;
        auto size = decodeFrameHeader(header);
        if (!size) {
            spdlog::warn("Rejecting IPC frame: {}", size.error().message);
            response = ErrorResponse{size.error().code, size.error().message};
        } else {
            std::vector<std::uint8_t> payload(size.value());
            if (!read_exact(client_fd, payload.data(), payload.size())) {
                return;
            }
            auto decoded = ProtoSerializer::decode_payload(payload);
            if (!decoded) {
                response = ErrorResponse{decoded.error().code, decoded.error().message};
            } else if (decoded.value().version != PROTOCOL_VERSION) {
                response = ErrorResponse{ErrorCode::InvalidArgument,
                                         "Unsupported protocol version " +
                                             std::to_string(decoded.value().version)};
            } else if (auto* req = std::get_if<Request>(&decoded.value().payload)) {
                requestId = decoded.value().requestId;
                response = dispatcher_
                               ? dispatcher_->dispatch(*req)
                               : Response{ErrorResponse{ErrorCode::InternalError,
                                                        "Dispatcher not available"}};
            } else {
                response = ErrorResponse{ErrorCode::InvalidArgument, "Expected a request"};
            }
        }

        Message reply;
        reply.version = PROTOCOL_VERSION;
        reply.requestId = requestId;
        reply.payload = std::move(response);
        auto encoded = ProtoSerializer::encode_payload(reply);
        if (!encoded) {
            spdlog::error("Failed to encode IPC response: {}", encoded.error().message);
            return;
        }
        auto out = encodeFrameHeader(static_cast<std::uint32_t>(encoded.value().size()));
        if (!write_all(client_fd, out.data(), out.size()) ||
            !write_all(client_fd, encoded.value().data(), encoded.value().size())) {
            return;
        }
        if (!size) {
            // Stream is out of sync after a bad header
            return;
        }
    }
}

} // namespace servherd::daemon
