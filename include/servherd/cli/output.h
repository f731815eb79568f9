#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <servherd/app/server_service.h>
#include <servherd/core/types.h>

namespace servherd::cli {

/// Prints {"success":true,"data":...} to stdout
void printJsonSuccess(const nlohmann::json& data);

/// Prints {"success":false,"error":{"code":..,"message":..}} to stdout
void printJsonError(const Error& error);

nlohmann::json toJson(const app::StartResult& result);
nlohmann::json toJson(const app::BatchResult& result);
nlohmann::json toJson(const std::vector<app::BatchResult>& results);
nlohmann::json toJson(const app::InfoResult& result);
nlohmann::json toJson(const app::ListItem& item);

/**
 * One "[OK] <verb> <name>" or "[FAIL] <name>: <message>" line per result.
 * @return true when every result succeeded or was skipped/cancelled
 */
bool printBatchResults(const std::vector<app::BatchResult>& results, const std::string& verb);

/// "12.3 MB" style size
std::string formatBytes(std::uint64_t bytes);

} // namespace servherd::cli
