#pragma once

#include <atomic>
#include <filesystem>
#include <stop_token>
#include <thread>

#include <servherd/core/types.h>

namespace servherd::daemon {

class RequestDispatcher;

// Simple UNIX domain socket acceptor; each connection is served by its own thread
class UnixIpcServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        int backlog{64};
        // Socket file permissions (umask will be applied on process); default 0600
        unsigned int permission_octal{0600};
    };

    UnixIpcServer(const Config& cfg, RequestDispatcher* dispatcher);
    ~UnixIpcServer();

    Result<void> start();
    Result<void> stop();

    bool is_running() const { return running_.load(); }
    std::size_t active_connections() const { return active_.load(); }

private:
    Result<void> bind_and_listen();
    void accept_loop(std::stop_token token);
    void handle_client(int client_fd);

    bool read_exact(int fd, void* buf, std::size_t len);
    bool write_all(int fd, const void* buf, std::size_t len);

    Config cfg_{};
    RequestDispatcher* dispatcher_{nullptr};

    int listen_fd_{-1};
    std::atomic<bool> running_{false};
    std::jthread accept_thread_{};

    std::atomic<std::size_t> active_{0};
};

} // namespace servherd::daemon
