#include <servherd/cli/output.h>

#include <fmt/format.h>

#include <iostream>

namespace servherd::cli {

void printJsonSuccess(const nlohmann::json& data) {
    nlohmann::json out{{"success", true}, {"data", data}};
    std::cout << out.dump(2) << "\n";
}

void printJsonError(const Error& error) {
    nlohmann::json out{
        {"success", false},
        {"error", {{"code", errorNumber(error.code)}, {"message", error.message}}}};
    std::cout << out.dump(2) << "\n";
}

nlohmann::json toJson(const app::StartResult& result) {
    nlohmann::json j{{"action", app::startActionToString(result.action)},
                     {"server", result.entry},
                     {"status", statusToString(result.status)},
                     {"url", result.entry.url()},
                     {"envChanged", result.envChanged},
                     {"commandChanged", result.commandChanged},
                     {"portReassigned", result.portReassigned},
                     {"configDrift", result.configDrift},
                     {"userDeclinedRefresh", result.userDeclinedRefresh}};
    if (result.originalPort)
        j["originalPort"] = *result.originalPort;
    if (!result.driftDetails.empty())
        j["driftDetails"] = result.driftDetails;
    return j;
}

nlohmann::json toJson(const app::BatchResult& result) {
    nlohmann::json j{{"name", result.name}, {"success", result.success}};
    if (result.status)
        j["status"] = statusToString(*result.status);
    if (result.message)
        j["message"] = *result.message;
    if (result.skipped)
        j["skipped"] = true;
    if (result.cancelled)
        j["cancelled"] = true;
    if (result.configRefreshed)
        j["configRefreshed"] = true;
    if (result.driftDetails)
        j["driftDetails"] = *result.driftDetails;
    if (result.portReassigned) {
        j["portReassigned"] = true;
        if (result.originalPort)
            j["originalPort"] = *result.originalPort;
        if (result.newPort)
            j["newPort"] = *result.newPort;
    }
    return j;
}

nlohmann::json toJson(const std::vector<app::BatchResult>& results) {
    auto arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back(toJson(r));
    }
    return arr;
}

nlohmann::json toJson(const app::InfoResult& result) {
    nlohmann::json j = result.entry;
    j["status"] = statusToString(result.status);
    j["url"] = result.entry.url();
    j["hasDrift"] = result.hasDrift;
    if (const auto& p = result.process) {
        if (p->pid)
            j["pid"] = *p->pid;
        if (p->uptimeStartMs)
            j["uptime"] = *p->uptimeStartMs;
        j["restarts"] = p->restartCount;
        if (p->cpu)
            j["cpu"] = *p->cpu;
        if (p->memory)
            j["memory"] = *p->memory;
        if (p->outLogPath)
            j["outLogPath"] = *p->outLogPath;
        if (p->errLogPath)
            j["errLogPath"] = *p->errLogPath;
    }
    return j;
}

nlohmann::json toJson(const app::ListItem& item) {
    nlohmann::json j = item.entry;
    j["status"] = statusToString(item.status);
    j["url"] = item.entry.url();
    j["hasDrift"] = item.hasDrift;
    return j;
}

bool printBatchResults(const std::vector<app::BatchResult>& results, const std::string& verb) {
    bool allOk = true;
    for (const auto& r : results) {
        if (r.cancelled) {
            std::cout << "[SKIP] " << r.name << ": " << r.message.value_or("cancelled") << "\n";
        } else if (r.skipped) {
            std::cout << (r.name.empty() ? "" : r.name + ": ") << r.message.value_or("skipped")
                      << "\n";
        } else if (r.success) {
            std::cout << "[OK] " << verb << " " << r.name;
            if (r.status)
                std::cout << " (" << statusToString(*r.status) << ")";
            std::cout << "\n";
            if (r.portReassigned && r.originalPort && r.newPort)
                std::cout << "     port " << *r.originalPort << " -> " << *r.newPort << "\n";
        } else {
            allOk = false;
            std::cout << "[FAIL] " << r.name << ": " << r.message.value_or("unknown error")
                      << "\n";
        }
    }
    return allOk;
}

std::string formatBytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    return unit == 0 ? fmt::format("{} B", bytes) : fmt::format("{:.1f} {}", size, units[unit]);
}

} // namespace servherd::cli
