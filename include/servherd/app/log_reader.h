#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <servherd/core/types.h>

namespace servherd::app {

/// Non-empty lines of a log file, oldest first
Result<std::vector<std::string>> readLogLines(const std::filesystem::path& path);

/**
 * Timestamp of a stored log line ("<ISO-8601>: <text>"), taken from everything before the
 * first ": ". Lines without one yield nullopt.
 */
std::optional<std::chrono::system_clock::time_point> parseLogTimestamp(const std::string& line);

/// Keeps lines stamped at or after `since`; unstamped lines are always kept
std::vector<std::string> filterLogsByTime(const std::vector<std::string>& lines,
                                          std::chrono::system_clock::time_point since);

/// First `head` lines when set, otherwise the last `tail` lines
std::vector<std::string> selectLines(const std::vector<std::string>& lines,
                                     std::optional<std::size_t> head, std::size_t tail);

/**
 * Emits lines appended to `path` until `token` is stopped, starting from the current end of
 * the file. A truncated file is read again from the start.
 */
void followLog(const std::filesystem::path& path, std::stop_token token,
               const std::function<void(const std::string&)>& onLine,
               std::chrono::milliseconds pollInterval = std::chrono::milliseconds{200});

} // namespace servherd::app
