#include <servherd/process/daemon_backend.h>

#include <spdlog/spdlog.h>

namespace servherd::process {

DaemonBackend::DaemonBackend() : DaemonBackend(daemon::ClientConfig{}) {}

DaemonBackend::DaemonBackend(daemon::ClientConfig config)
    : client_(std::make_unique<daemon::DaemonClient>(std::move(config))) {}

DaemonBackend::~DaemonBackend() = default;

Result<void> DaemonBackend::connect() {
    return client_->connect();
}

void DaemonBackend::disconnect() {
    client_->disconnect();
}

Result<daemon::Response> DaemonBackend::send(const daemon::Request& request) {
    auto r = client_->call(request);
    if (!r) {
        spdlog::debug("Daemon {} request failed: {}", daemon::requestName(request),
                      r.error().message);
        return r.error();
    }
    if (auto* err = std::get_if<daemon::ErrorResponse>(&r.value())) {
        return Error{err->code, err->message};
    }
    return r;
}

Result<void> DaemonBackend::expectSuccess(const daemon::Request& request) {
    auto r = send(request);
    if (!r) {
        return r.error();
    }
    if (!std::holds_alternative<daemon::SuccessResponse>(r.value())) {
        return Error{ErrorCode::InternalError,
                     std::string{"Unexpected response to "} + daemon::requestName(request)};
    }
    return Result<void>();
}

Result<void> DaemonBackend::start(const StartSpec& spec) {
    return expectSuccess(daemon::StartRequest{spec});
}

Result<void> DaemonBackend::stop(const std::string& name) {
    return expectSuccess(daemon::StopRequest{name});
}

Result<void> DaemonBackend::remove(const std::string& name) {
    return expectSuccess(daemon::DeleteRequest{name});
}

Result<void> DaemonBackend::restart(const std::string& name) {
    return expectSuccess(daemon::RestartRequest{name});
}

Result<std::optional<ProcessDescription>> DaemonBackend::describe(const std::string& name) {
    auto r = send(daemon::DescribeRequest{name});
    if (!r) {
        if (r.error().code == ErrorCode::ProcessNotFound) {
            return std::optional<ProcessDescription>{};
        }
        return r.error();
    }
    auto* d = std::get_if<daemon::DescribeResponse>(&r.value());
    if (!d) {
        return Error{ErrorCode::InternalError, "Unexpected response to describe"};
    }
    return std::optional<ProcessDescription>{d->info};
}

Result<void> DaemonBackend::flush(const std::string& name) {
    return expectSuccess(daemon::FlushRequest{name});
}

Result<void> DaemonBackend::flushAll() {
    return expectSuccess(daemon::FlushRequest{"*"});
}

Result<std::vector<ProcessDescription>> DaemonBackend::list() {
    auto r = send(daemon::ListRequest{});
    if (!r) {
        return r.error();
    }
    auto* l = std::get_if<daemon::ListResponse>(&r.value());
    if (!l) {
        return Error{ErrorCode::InternalError, "Unexpected response to list"};
    }
    return std::move(l->processes);
}

} // namespace servherd::process
