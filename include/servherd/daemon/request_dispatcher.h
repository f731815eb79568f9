#pragma once

#include <functional>

#include <servherd/daemon/ipc_protocol.h>
#include <servherd/process/process_backend.h>

namespace servherd::daemon {

/// Routes decoded requests to the supervisor; every outcome is a Response
class RequestDispatcher {
public:
    using StopCallback = std::function<void(bool stopChildren)>;

    RequestDispatcher(process::IProcessBackend& supervisor, StopCallback onShutdown);

    Response dispatch(const Request& request);

private:
    Response handleStart(const StartRequest& req);
    Response handleDescribe(const DescribeRequest& req);
    Response handleFlush(const FlushRequest& req);
    Response handleList();
    Response handlePing(const PingRequest& req);
    Response handleShutdown(const ShutdownRequest& req);

    process::IProcessBackend& supervisor_;
    StopCallback onShutdown_;
};

} // namespace servherd::daemon
