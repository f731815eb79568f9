#pragma once

#include <servherd/core/types.h>
#include <servherd/daemon/ipc_protocol.h>

#include <cstdint>
#include <vector>

namespace servherd::daemon {

// ProtoSerializer encodes/decodes Message payloads (Request/Response) as a protobuf Envelope.
// Length framing is done by the transport.
class ProtoSerializer {
public:
    static Result<std::vector<std::uint8_t>> encode_payload(const Message& msg);

    static Result<Message> decode_payload(const std::vector<std::uint8_t>& bytes);
};

} // namespace servherd::daemon
