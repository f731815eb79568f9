#include <servherd/common/time_parser.h>

#include <fmt/format.h>

#include <cctype>
#include <ctime>
#include <regex>

namespace servherd::common {

namespace {

constexpr const char* kFormatHint = "Use duration (1h, 30m) or ISO date (2024-01-15)";

} // namespace

Result<std::chrono::system_clock::time_point> TimeParser::parse(const std::string& timeStr) {
    if (timeStr.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Invalid time format: empty string. ") + kFormatHint};
    }

    if (auto tp = parseRelative(timeStr)) {
        return tp.value();
    }

    if (auto tp = parseISO8601(timeStr)) {
        return tp.value();
    }

    return Error{ErrorCode::InvalidArgument,
                 "Invalid time format: " + timeStr + ". " + kFormatHint};
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseRelative(const std::string& relativeStr) {
    static const std::regex relativeRegex(R"(^(\d+)([smhdw])$)");

    std::smatch match;
    if (!std::regex_match(relativeStr, match, relativeRegex)) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    const char unit = match[2].str()[0];
    auto now = std::chrono::system_clock::now();

    switch (unit) {
        case 's':
            return now - std::chrono::seconds(value);
        case 'm':
            return now - std::chrono::minutes(value);
        case 'h':
            return now - std::chrono::hours(value);
        case 'd':
            return now - std::chrono::hours(value * 24);
        case 'w':
            return now - std::chrono::hours(value * 24 * 7);
        default:
            return std::nullopt;
    }
}

std::optional<std::chrono::system_clock::time_point>
TimeParser::parseISO8601(const std::string& isoStr) {
    // date, optional time with fraction, optional zone
    static const std::regex isoRegex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)?(Z|[+-]\d{2}(?::?\d{2})?)?$)");

    std::smatch m;
    if (!std::regex_match(isoStr, m, isoRegex)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(m[1].str()) - 1900;
    tm.tm_mon = std::stoi(m[2].str()) - 1;
    tm.tm_mday = std::stoi(m[3].str());
    if (m[4].matched) {
        tm.tm_hour = std::stoi(m[4].str());
        tm.tm_min = std::stoi(m[5].str());
    }
    if (m[6].matched) {
        tm.tm_sec = std::stoi(m[6].str());
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(::timegm(&tm));

    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(9, '0');
        tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(std::stoll(frac)));
    }

    if (m[8].matched && m[8].str() != "Z") {
        const std::string tz = m[8].str();
        const int sign = tz[0] == '+' ? 1 : -1;
        const int hours = std::stoi(tz.substr(1, 2));
        int minutes = 0;
        if (tz.size() > 3) {
            minutes = std::stoi(tz.substr(tz[3] == ':' ? 4 : 3, 2));
        }
        auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
        tp -= sign * offset;
    }
    return tp;
}

std::string TimeParser::formatISO8601(const std::chrono::system_clock::time_point& tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
}

std::string TimeParser::formatUptime(std::chrono::milliseconds elapsed) {
    if (elapsed.count() < 0) {
        elapsed = std::chrono::milliseconds{0};
    }
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    const auto days = total / 86400;
    const auto hours = (total % 86400) / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    if (days > 0) {
        return fmt::format("{}d {}h", days, hours);
    }
    if (hours > 0) {
        return fmt::format("{}h {}m", hours, minutes);
    }
    if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, seconds);
    }
    return fmt::format("{}s", seconds);
}

std::string TimeParser::formatRelative(const std::chrono::system_clock::time_point& tp) {
    auto diff = std::chrono::system_clock::now() - tp;
    if (diff < std::chrono::seconds(1)) {
        return "just now";
    }
    auto plural = [](long long n, const char* unit) {
        return fmt::format("{} {}{} ago", n, unit, n == 1 ? "" : "s");
    };
    if (diff < std::chrono::minutes(1)) {
        return plural(std::chrono::duration_cast<std::chrono::seconds>(diff).count(), "second");
    }
    if (diff < std::chrono::hours(1)) {
        return plural(std::chrono::duration_cast<std::chrono::minutes>(diff).count(), "minute");
    }
    if (diff < std::chrono::hours(24)) {
        return plural(std::chrono::duration_cast<std::chrono::hours>(diff).count(), "hour");
    }
    if (diff < std::chrono::hours(48)) {
        return "yesterday";
    }
    return plural(std::chrono::duration_cast<std::chrono::hours>(diff).count() / 24, "day");
}

} // namespace servherd::common
