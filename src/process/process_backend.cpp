#include <servherd/process/process_backend.h>

#include <sstream>

namespace servherd::process {

Result<ServerStatus> getStatus(IProcessBackend& backend, const std::string& name) {
    auto desc = backend.describe(name);
    if (!desc) {
        return desc.error();
    }
    if (!desc.value()) {
        return ServerStatus::Unknown;
    }
    return desc.value()->status;
}

std::pair<std::string, std::vector<std::string>> splitCommand(std::string_view command) {
    std::istringstream in{std::string(command)};
    std::vector<std::string> parts;
    std::string tok;
    while (in >> tok) {
        parts.push_back(tok);
    }
    if (parts.empty()) {
        return {"node", {}};
    }
    std::string script = parts.front();
    parts.erase(parts.begin());
    return {std::move(script), std::move(parts)};
}

} // namespace servherd::process
