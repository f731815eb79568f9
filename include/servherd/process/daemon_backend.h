#pragma once

#include <memory>

#include <servherd/daemon/daemon_client.h>
#include <servherd/process/process_backend.h>

namespace servherd::process {

/**
 * @brief Supervision through servherd-daemon
 *
 * Processes outlive the CLI invocation. Every operation is one request to the daemon; the
 * connection is opened lazily on first use and the daemon is auto-started when absent.
 */
class DaemonBackend final : public IProcessBackend {
public:
    DaemonBackend();
    explicit DaemonBackend(daemon::ClientConfig config);
    ~DaemonBackend() override;

    Result<void> connect() override;
    void disconnect() override;

    Result<void> start(const StartSpec& spec) override;
    Result<void> stop(const std::string& name) override;
    Result<void> remove(const std::string& name) override;
    Result<void> restart(const std::string& name) override;
    Result<std::optional<ProcessDescription>> describe(const std::string& name) override;
    Result<void> flush(const std::string& name) override;
    Result<void> flushAll() override;
    Result<std::vector<ProcessDescription>> list() override;

    std::string_view backendName() const override { return "daemon"; }

private:
    Result<daemon::Response> send(const daemon::Request& request);
    Result<void> expectSuccess(const daemon::Request& request);

    std::unique_ptr<daemon::DaemonClient> client_;
};

} // namespace servherd::process
