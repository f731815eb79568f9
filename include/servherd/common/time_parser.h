#pragma once

#include <servherd/core/types.h>
#include <chrono>
#include <optional>
#include <string>

namespace servherd::common {

/**
 * @brief Utility for parsing time strings used by `logs --since` and log line stamps
 */
class TimeParser {
public:
    /**
     * @brief Parse a time string into a time_point
     *
     * Supported formats:
     * - Duration ago: "30s", "15m", "1h", "2d", "1w"
     * - ISO 8601: "2024-01-15", "2024-01-15T10:00:00Z", "2024-01-15T10:00:00.123-08:00"
     *
     * @param timeStr String to parse
     * @return Parsed time point or InvalidArgument
     */
    static Result<std::chrono::system_clock::time_point> parse(const std::string& timeStr);

    /**
     * @brief Parse a duration-ago string (e.g., "30m", "2d")
     * @return Time point relative to now, or nullopt if invalid format
     */
    static std::optional<std::chrono::system_clock::time_point>
    parseRelative(const std::string& relativeStr);

    /**
     * @brief Parse an ISO 8601 date/time string
     *
     * Fractional seconds are honored; a missing zone means UTC.
     */
    static std::optional<std::chrono::system_clock::time_point>
    parseISO8601(const std::string& isoStr);

    /// Format a time_point as ISO 8601 UTC with milliseconds
    static std::string formatISO8601(const std::chrono::system_clock::time_point& tp);

    /// Human-readable elapsed time like "3h 12m" or "45s"
    static std::string formatUptime(std::chrono::milliseconds elapsed);

    /// "2 hours ago", "yesterday", ...
    static std::string formatRelative(const std::chrono::system_clock::time_point& tp);
};

} // namespace servherd::common
