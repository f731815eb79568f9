#include <servherd/daemon/request_dispatcher.h>

#include <spdlog/spdlog.h>

#include <chrono>

#include <unistd.h>

namespace servherd::daemon {

namespace {

template <typename T> struct always_false : std::false_type {};

Response toResponse(const Result<void>& r, std::string okMessage) {
    if (!r) {
        return ErrorResponse{r.error().code, r.error().message};
    }
    return SuccessResponse{std::move(okMessage)};
}

} // namespace

RequestDispatcher::RequestDispatcher(process::IProcessBackend& supervisor, StopCallback onShutdown)
    : supervisor_(supervisor), onShutdown_(std::move(onShutdown)) {}

Response RequestDispatcher::dispatch(const Request& request) {
    spdlog::debug("Dispatching {} request", requestName(request));
    try {
        return std::visit(
            [this](const auto& req) -> Response {
                using T = std::decay_t<decltype(req)>;
                if constexpr (std::is_same_v<T, StartRequest>) {
                    return handleStart(req);
                } else if constexpr (std::is_same_v<T, StopRequest>) {
                    return toResponse(supervisor_.stop(req.name), "Stopped " + req.name);
                } else if constexpr (std::is_same_v<T, DeleteRequest>) {
                    return toResponse(supervisor_.remove(req.name), "Deleted " + req.name);
                } else if constexpr (std::is_same_v<T, RestartRequest>) {
                    return toResponse(supervisor_.restart(req.name), "Restarted " + req.name);
                } else if constexpr (std::is_same_v<T, DescribeRequest>) {
                    return handleDescribe(req);
                } else if constexpr (std::is_same_v<T, FlushRequest>) {
                    return handleFlush(req);
                } else if constexpr (std::is_same_v<T, ListRequest>) {
                    return handleList();
                } else if constexpr (std::is_same_v<T, PingRequest>) {
                    return handlePing(req);
                } else if constexpr (std::is_same_v<T, ShutdownRequest>) {
                    return handleShutdown(req);
                } else {
                    static_assert(always_false<T>::value, "unhandled request type");
                }
            },
            request);
    } catch (const std::exception& e) {
        spdlog::error("{} request failed: {}", requestName(request), e.what());
        return ErrorResponse{ErrorCode::InternalError, e.what()};
    }
}

Response RequestDispatcher::handleStart(const StartRequest& req) {
    if (req.spec.name.empty()) {
        return ErrorResponse{ErrorCode::InvalidArgument, "Process name is required"};
    }
    if (req.spec.script.empty()) {
        return ErrorResponse{ErrorCode::InvalidArgument, "Script is required"};
    }
    return toResponse(supervisor_.start(req.spec), "Started " + req.spec.name);
}

Response RequestDispatcher::handleDescribe(const DescribeRequest& req) {
    auto r = supervisor_.describe(req.name);
    if (!r) {
        return ErrorResponse{r.error().code, r.error().message};
    }
    return DescribeResponse{r.value()};
}

Response RequestDispatcher::handleFlush(const FlushRequest& req) {
    if (req.name == "*") {
        return toResponse(supervisor_.flushAll(), "Flushed all logs");
    }
    return toResponse(supervisor_.flush(req.name), "Flushed " + req.name);
}

Response RequestDispatcher::handleList() {
    auto r = supervisor_.list();
    if (!r) {
        return ErrorResponse{r.error().code, r.error().message};
    }
    return ListResponse{std::move(r.value())};
}

Response RequestDispatcher::handlePing(const PingRequest&) {
    PongResponse pong;
    pong.serverTimeNs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count());
    pong.pid = static_cast<std::uint32_t>(::getpid());
    return pong;
}

Response RequestDispatcher::handleShutdown(const ShutdownRequest& req) {
    spdlog::info("Shutdown requested over IPC (stop children: {})", req.stopChildren);
    if (onShutdown_) {
        onShutdown_(req.stopChildren);
    }
    return SuccessResponse{"Shutting down"};
}

} // namespace servherd::daemon
