#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace servherd {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using EnvMap = std::map<std::string, std::string>;

// Error types
enum class ErrorCode {
    Success = 0,
    // Configuration
    ConfigNotFound,
    ConfigInvalid,
    ConfigWriteFailed,
    // Registry
    ServerNotFound,
    ServerAlreadyExists,
    RegistryReadFailed,
    RegistryWriteFailed,
    // Ports
    PortOutOfRange,
    PortUnavailable,
    // Process backends
    BackendConnectionFailed,
    BackendStartFailed,
    BackendStopFailed,
    ProcessNotFound,
    // Templates
    TemplateMissingVariable,
    TemplateLookupFailed,
    // General
    InvalidArgument,
    InvalidState,
    IOError,
    NetworkError,
    Timeout,
    OperationCancelled,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigInvalid: return "Invalid configuration";
        case ErrorCode::ConfigWriteFailed: return "Failed to write configuration";
        case ErrorCode::ServerNotFound: return "Server not found";
        case ErrorCode::ServerAlreadyExists: return "Server already exists";
        case ErrorCode::RegistryReadFailed: return "Failed to read registry";
        case ErrorCode::RegistryWriteFailed: return "Failed to write registry";
        case ErrorCode::PortOutOfRange: return "Port out of range";
        case ErrorCode::PortUnavailable: return "No port available";
        case ErrorCode::BackendConnectionFailed: return "Backend connection failed";
        case ErrorCode::BackendStartFailed: return "Failed to start process";
        case ErrorCode::BackendStopFailed: return "Failed to stop process";
        case ErrorCode::ProcessNotFound: return "Process not found";
        case ErrorCode::TemplateMissingVariable: return "Missing template variable";
        case ErrorCode::TemplateLookupFailed: return "Template lookup failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Numeric code shown to users, grouped by concern
constexpr int errorNumber(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return 0;
        case ErrorCode::ServerNotFound: return 1001;
        case ErrorCode::ServerAlreadyExists: return 1002;
        case ErrorCode::PortOutOfRange: return 2001;
        case ErrorCode::PortUnavailable: return 2002;
        case ErrorCode::BackendConnectionFailed: return 3001;
        case ErrorCode::BackendStartFailed: return 3002;
        case ErrorCode::BackendStopFailed: return 3003;
        case ErrorCode::ProcessNotFound: return 3004;
        case ErrorCode::ConfigNotFound: return 4001;
        case ErrorCode::ConfigInvalid: return 4002;
        case ErrorCode::ConfigWriteFailed: return 4003;
        case ErrorCode::RegistryReadFailed: return 5001;
        case ErrorCode::RegistryWriteFailed: return 5002;
        case ErrorCode::TemplateMissingVariable: return 6001;
        case ErrorCode::TemplateLookupFailed: return 6002;
        case ErrorCode::InvalidArgument: return 7001;
        case ErrorCode::InvalidState: return 7002;
        case ErrorCode::OperationCancelled: return 7003;
        case ErrorCode::IOError: return 8001;
        case ErrorCode::NetworkError: return 8002;
        case ErrorCode::Timeout: return 8003;
        case ErrorCode::InternalError:
        case ErrorCode::Unknown: return 9999;
    }
    return 9999;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value, not error");
        }
        return std::get<Error>(data_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    template <typename U> T value_or(U&& defaultValue) const& {
        return has_value() ? std::get<T>(data_) : static_cast<T>(std::forward<U>(defaultValue));
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return !error_.has_value(); }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (error_) {
            throw std::runtime_error("Result contains error: " + error_->message);
        }
    }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Result contains value, not error");
        }
        return *error_;
    }

private:
    std::optional<Error> error_;
};

// Lifecycle status as reported by a process backend
enum class ServerStatus { Online, Stopped, Errored, Unknown };

constexpr const char* statusToString(ServerStatus s) {
    switch (s) {
        case ServerStatus::Online: return "online";
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Errored: return "errored";
        case ServerStatus::Unknown: return "unknown";
    }
    return "unknown";
}

// Maps a raw backend status string onto the servherd state model
inline ServerStatus statusFromString(const std::string& s) {
    if (s == "online")
        return ServerStatus::Online;
    if (s == "stopped" || s == "stopping")
        return ServerStatus::Stopped;
    if (s == "errored")
        return ServerStatus::Errored;
    return ServerStatus::Unknown;
}

enum class Protocol { Http, Https };

constexpr const char* protocolToString(Protocol p) {
    return p == Protocol::Https ? "https" : "http";
}

inline std::optional<Protocol> protocolFromString(const std::string& s) {
    if (s == "http")
        return Protocol::Http;
    if (s == "https")
        return Protocol::Https;
    return std::nullopt;
}

enum class RefreshOnChange { Manual, OnStart, Prompt, Auto };

constexpr const char* refreshOnChangeToString(RefreshOnChange r) {
    switch (r) {
        case RefreshOnChange::Manual: return "manual";
        case RefreshOnChange::OnStart: return "on-start";
        case RefreshOnChange::Prompt: return "prompt";
        case RefreshOnChange::Auto: return "auto";
    }
    return "on-start";
}

inline std::optional<RefreshOnChange> refreshOnChangeFromString(const std::string& s) {
    if (s == "manual")
        return RefreshOnChange::Manual;
    if (s == "on-start")
        return RefreshOnChange::OnStart;
    if (s == "prompt")
        return RefreshOnChange::Prompt;
    if (s == "auto")
        return RefreshOnChange::Auto;
    return std::nullopt;
}

} // namespace servherd

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<servherd::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(servherd::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", servherd::errorToString(error));
    }
};

template <> struct fmt::formatter<servherd::ServerStatus> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(servherd::ServerStatus status, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", servherd::statusToString(status));
    }
};
