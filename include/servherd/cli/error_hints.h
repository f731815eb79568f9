#pragma once
#include <string>
#include <string_view>
#include <servherd/core/types.h>

namespace servherd::cli {

/**
 * Actionable follow-up for a failed command.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @param command The command that was executing (for context)
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    if (message.find("daemon") != std::string_view::npos ||
        message.find("socket") != std::string_view::npos ||
        message.find("Connection refused") != std::string_view::npos) {
        hint.hint = "The servherd daemon may have failed to start; check ~/.servherd/daemon.log";
        hint.command = "servherd-daemon --foreground --log-level debug";
        return hint;
    }

    if (message.find("Permission denied") != std::string_view::npos) {
        hint.hint = "Check file/directory permissions";
        return hint;
    }

    switch (code) {
        case ErrorCode::ServerNotFound:
            hint.hint = "List registered servers";
            hint.command = "servherd list";
            break;

        case ErrorCode::PortOutOfRange:
            hint.hint = "Pick a port inside the range or widen it";
            hint.command = "servherd config --set portRange.max --value <port>";
            break;

        case ErrorCode::PortUnavailable:
            hint.hint = "Every port in the configured range is taken";
            hint.command = "servherd list --running";
            break;

        case ErrorCode::ConfigInvalid:
            hint.hint = "Review the current configuration";
            hint.command = "servherd config --show";
            break;

        case ErrorCode::Timeout:
            hint.hint = "The daemon did not answer in time";
            break;

        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty()
                               ? "servherd --help"
                               : std::string("servherd ") + std::string(command) + " --help";
            break;

        default:
            // No specific hint available
            break;
    }

    return hint;
}

/**
 * Format an error message with an actionable hint.
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }

    return result;
}

} // namespace servherd::cli
