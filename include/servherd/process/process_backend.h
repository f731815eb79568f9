#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <servherd/core/types.h>

namespace servherd::process {

/// What a backend needs to launch one supervised process
struct StartSpec {
    std::string name; ///< backend handle, e.g. "servherd-brave-otter"
    std::string script;
    std::vector<std::string> args;
    std::string cwd;
    EnvMap env;
};

/// Live view of a supervised process as reported by a backend
struct ProcessDescription {
    std::string name;
    ServerStatus status{ServerStatus::Unknown};
    std::optional<int> pid;
    /// Epoch milliseconds of the last (re)start
    std::optional<std::int64_t> uptimeStartMs;
    int restartCount{0};
    std::optional<double> cpu;
    std::optional<std::uint64_t> memory;
    std::optional<std::string> outLogPath;
    std::optional<std::string> errLogPath;
};

/**
 * @brief Capability set shared by the daemon-managed and direct-spawn backends
 *
 * Callers address processes by handle only. A handle the backend has never seen is not an
 * error for describe(), which yields an empty optional.
 */
class IProcessBackend {
public:
    virtual ~IProcessBackend() = default;

    virtual Result<void> connect() = 0;
    virtual void disconnect() = 0;

    virtual Result<void> start(const StartSpec& spec) = 0;
    /// Graceful stop; the backend keeps its record
    virtual Result<void> stop(const std::string& name) = 0;
    /// Forceful stop and removal of the backend record
    virtual Result<void> remove(const std::string& name) = 0;
    /// In-place restart with the environment captured at start
    virtual Result<void> restart(const std::string& name) = 0;
    virtual Result<std::optional<ProcessDescription>> describe(const std::string& name) = 0;
    /// Truncates the process logs
    virtual Result<void> flush(const std::string& name) = 0;
    virtual Result<void> flushAll() = 0;
    virtual Result<std::vector<ProcessDescription>> list() = 0;

    virtual std::string_view backendName() const = 0;
};

/// Unknown when the backend has no record; connection faults propagate
Result<ServerStatus> getStatus(IProcessBackend& backend, const std::string& name);

/// Splits a rendered command on whitespace into script and args; an empty command yields "node"
std::pair<std::string, std::vector<std::string>> splitCommand(std::string_view command);

} // namespace servherd::process
