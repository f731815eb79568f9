#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <servherd/core/types.h>
#include <servherd/process/process_backend.h>

namespace servherd::daemon {

// ============================================================================
// Requests
// ============================================================================

struct StartRequest {
    process::StartSpec spec;
};

struct StopRequest {
    std::string name;
};

struct DeleteRequest {
    std::string name;
};

struct RestartRequest {
    std::string name;
};

struct DescribeRequest {
    std::string name;
};

/// Truncates logs; name "*" selects every supervised process
struct FlushRequest {
    std::string name;
};

struct ListRequest {};

struct PingRequest {
    std::uint64_t timestampNs{0};
};

struct ShutdownRequest {
    bool stopChildren{true};
};

using Request = std::variant<StartRequest, StopRequest, DeleteRequest, RestartRequest,
                             DescribeRequest, FlushRequest, ListRequest, PingRequest,
                             ShutdownRequest>;

// ============================================================================
// Responses
// ============================================================================

struct SuccessResponse {
    std::string message;
};

struct DescribeResponse {
    std::optional<process::ProcessDescription> info;
};

struct ListResponse {
    std::vector<process::ProcessDescription> processes;
};

struct PongResponse {
    std::uint64_t serverTimeNs{0};
    std::uint32_t pid{0};
};

struct ErrorResponse {
    ErrorCode code{ErrorCode::Unknown};
    std::string message;
};

using Response = std::variant<SuccessResponse, DescribeResponse, ListResponse, PongResponse,
                              ErrorResponse>;

struct Message {
    std::uint32_t version{1};
    std::uint64_t requestId{0};
    std::variant<Request, Response> payload;
};

// ============================================================================
// Protocol Constants
// ============================================================================

constexpr std::uint32_t PROTOCOL_VERSION = 1;
constexpr std::size_t MAX_MESSAGE_SIZE = 4 * 1024 * 1024;
constexpr std::size_t FRAME_HEADER_SIZE = 4;

/// Frames are a 4-byte big-endian payload length followed by the serialized Envelope
std::array<std::uint8_t, FRAME_HEADER_SIZE> encodeFrameHeader(std::uint32_t payloadSize);
Result<std::uint32_t> decodeFrameHeader(const std::array<std::uint8_t, FRAME_HEADER_SIZE>& header);

const char* requestName(const Request& request);

} // namespace servherd::daemon
