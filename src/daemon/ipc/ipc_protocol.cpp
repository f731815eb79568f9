#include <servherd/daemon/ipc_protocol.h>

#include <type_traits>

namespace servherd::daemon {

std::array<std::uint8_t, FRAME_HEADER_SIZE> encodeFrameHeader(std::uint32_t payloadSize) {
    return {static_cast<std::uint8_t>((payloadSize >> 24) & 0xFF),
            static_cast<std::uint8_t>((payloadSize >> 16) & 0xFF),
            static_cast<std::uint8_t>((payloadSize >> 8) & 0xFF),
            static_cast<std::uint8_t>(payloadSize & 0xFF)};
}

Result<std::uint32_t>
decodeFrameHeader(const std::array<std::uint8_t, FRAME_HEADER_SIZE>& header) {
    const std::uint32_t size = (static_cast<std::uint32_t>(header[0]) << 24) |
                               (static_cast<std::uint32_t>(header[1]) << 16) |
                               (static_cast<std::uint32_t>(header[2]) << 8) |
                               static_cast<std::uint32_t>(header[3]);
    if (size > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::NetworkError, "Frame size " + std::to_string(size) +
                                                  " exceeds maximum " +
                                                  std::to_string(MAX_MESSAGE_SIZE)};
    }
    return size;
}

const char* requestName(const Request& request) {
    return std::visit(
        [](const auto& r) -> const char* {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, StartRequest>)
                return "start";
            else if constexpr (std::is_same_v<T, StopRequest>)
                return "stop";
            else if constexpr (std::is_same_v<T, DeleteRequest>)
                return "delete";
            else if constexpr (std::is_same_v<T, RestartRequest>)
                return "restart";
            else if constexpr (std::is_same_v<T, DescribeRequest>)
                return "describe";
            else if constexpr (std::is_same_v<T, FlushRequest>)
                return "flush";
            else if constexpr (std::is_same_v<T, ListRequest>)
                return "list";
            else if constexpr (std::is_same_v<T, PingRequest>)
                return "ping";
            else
                return "shutdown";
        },
        request);
}

} // namespace servherd::daemon
