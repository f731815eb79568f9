// Trait-driven serializer: one ProtoBinding per message type
#include <servherd/daemon/proto_serializer.h>

#include "ipc_envelope.pb.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <concepts>
#include <type_traits>
#include <google/protobuf/repeated_field.h>

namespace servherd::daemon {

using Envelope = servherd::daemon::ipc::Envelope;
namespace pb = servherd::daemon::ipc;

static void to_kv_pairs(const EnvMap& in, google::protobuf::RepeatedPtrField<pb::KvPair>* out) {
    out->Clear();
    for (const auto& [k, v] : in) {
        auto* kv = out->Add();
        kv->set_key(k);
        kv->set_value(v);
    }
}

static EnvMap from_kv_pairs(const google::protobuf::RepeatedPtrField<pb::KvPair>& in) {
    EnvMap out;
    for (const auto& kv : in)
        out[kv.key()] = kv.value();
    return out;
}

static void set_spec(pb::StartSpec* out, const process::StartSpec& spec) {
    out->set_name(spec.name);
    out->set_script(spec.script);
    out->clear_args();
    for (const auto& a : spec.args)
        out->add_args(a);
    out->set_cwd(spec.cwd);
    to_kv_pairs(spec.env, out->mutable_env());
}

static process::StartSpec get_spec(const pb::StartSpec& in) {
    process::StartSpec spec;
    spec.name = in.name();
    spec.script = in.script();
    spec.args.assign(in.args().begin(), in.args().end());
    spec.cwd = in.cwd();
    spec.env = from_kv_pairs(in.env());
    return spec;
}

static void set_info(pb::ProcessInfo* out, const process::ProcessDescription& d) {
    out->set_name(d.name);
    out->set_status(statusToString(d.status));
    if (d.pid)
        out->set_pid(*d.pid);
    if (d.uptimeStartMs)
        out->set_started_at_ms(*d.uptimeStartMs);
    out->set_restart_count(d.restartCount);
    if (d.cpu)
        out->set_cpu(*d.cpu);
    if (d.memory)
        out->set_memory_bytes(*d.memory);
    if (d.outLogPath)
        out->set_out_log_path(*d.outLogPath);
    if (d.errLogPath)
        out->set_err_log_path(*d.errLogPath);
}

static process::ProcessDescription get_info(const pb::ProcessInfo& in) {
    process::ProcessDescription d;
    d.name = in.name();
    d.status = statusFromString(in.status());
    if (in.has_pid())
        d.pid = in.pid();
    if (in.has_started_at_ms())
        d.uptimeStartMs = in.started_at_ms();
    d.restartCount = in.restart_count();
    if (in.has_cpu())
        d.cpu = in.cpu();
    if (in.has_memory_bytes())
        d.memory = in.memory_bytes();
    if (in.has_out_log_path())
        d.outLogPath = in.out_log_path();
    if (in.has_err_log_path())
        d.errLogPath = in.err_log_path();
    return d;
}

// Primary template for per-type protobuf bindings. Specialize for each supported type.
template <typename T, typename = void> struct ProtoBinding;

template <typename T>
concept HasProtoBinding = requires(Envelope& e, const Envelope& ce, const T& t) {
    { ProtoBinding<T>::set(e, t) } -> std::same_as<void>;
    { ProtoBinding<T>::case_v } -> std::convertible_to<Envelope::PayloadCase>;
    { ProtoBinding<T>::get(ce) } -> std::same_as<T>;
};

template <> struct ProtoBinding<StartRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kStartRequest;
    static void set(Envelope& env, const StartRequest& r) {
        set_spec(env.mutable_start_request()->mutable_spec(), r.spec);
    }
    static StartRequest get(const Envelope& env) {
        return StartRequest{get_spec(env.start_request().spec())};
    }
};

// Requests that only carry a process handle share the NameRequest message
#define SERVHERD_NAME_BINDING(Type, Field, Case)                                                \
    template <> struct ProtoBinding<Type> {                                                    \
        static constexpr Envelope::PayloadCase case_v = Envelope::Case;                        \
        static void set(Envelope& env, const Type& r) { env.mutable_##Field()->set_name(r.name); } \
        static Type get(const Envelope& env) { return Type{env.Field().name()}; }              \
    };

SERVHERD_NAME_BINDING(StopRequest, stop_request, kStopRequest)
SERVHERD_NAME_BINDING(DeleteRequest, delete_request, kDeleteRequest)
SERVHERD_NAME_BINDING(RestartRequest, restart_request, kRestartRequest)
SERVHERD_NAME_BINDING(DescribeRequest, describe_request, kDescribeRequest)
SERVHERD_NAME_BINDING(FlushRequest, flush_request, kFlushRequest)

#undef SERVHERD_NAME_BINDING

template <> struct ProtoBinding<ListRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kListRequest;
    static void set(Envelope& env, const ListRequest&) { env.mutable_list_request(); }
    static ListRequest get(const Envelope&) { return ListRequest{}; }
};

template <> struct ProtoBinding<PingRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kPingRequest;
    static void set(Envelope& env, const PingRequest& r) {
        env.mutable_ping_request()->set_timestamp_ns(r.timestampNs);
    }
    static PingRequest get(const Envelope& env) {
        return PingRequest{env.ping_request().timestamp_ns()};
    }
};

template <> struct ProtoBinding<ShutdownRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kShutdownRequest;
    static void set(Envelope& env, const ShutdownRequest& r) {
        env.mutable_shutdown_request()->set_stop_children(r.stopChildren);
    }
    static ShutdownRequest get(const Envelope& env) {
        return ShutdownRequest{env.shutdown_request().stop_children()};
    }
};

template <> struct ProtoBinding<SuccessResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kSuccess;
    static void set(Envelope& env, const SuccessResponse& r) {
        env.mutable_success()->set_message(r.message);
    }
    static SuccessResponse get(const Envelope& env) {
        return SuccessResponse{env.success().message()};
    }
};

template <> struct ProtoBinding<DescribeResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kDescribeResponse;
    static void set(Envelope& env, const DescribeResponse& r) {
        auto* out = env.mutable_describe_response();
        out->set_found(r.info.has_value());
        if (r.info)
            set_info(out->mutable_info(), *r.info);
    }
    static DescribeResponse get(const Envelope& env) {
        DescribeResponse r;
        if (env.describe_response().found())
            r.info = get_info(env.describe_response().info());
        return r;
    }
};

template <> struct ProtoBinding<ListResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kListResponse;
    static void set(Envelope& env, const ListResponse& r) {
        auto* out = env.mutable_list_response();
        for (const auto& d : r.processes)
            set_info(out->add_processes(), d);
    }
    static ListResponse get(const Envelope& env) {
        ListResponse r;
        r.processes.reserve(static_cast<size_t>(env.list_response().processes_size()));
        for (const auto& p : env.list_response().processes())
            r.processes.push_back(get_info(p));
        return r;
    }
};

template <> struct ProtoBinding<PongResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kPongResponse;
    static void set(Envelope& env, const PongResponse& r) {
        auto* pong = env.mutable_pong_response();
        pong->set_server_time_ns(r.serverTimeNs);
        pong->set_pid(r.pid);
    }
    static PongResponse get(const Envelope& env) {
        return PongResponse{env.pong_response().server_time_ns(), env.pong_response().pid()};
    }
};

template <> struct ProtoBinding<ErrorResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kError;
    static void set(Envelope& env, const ErrorResponse& er) {
        auto* pe = env.mutable_error();
        pe->set_code(static_cast<uint32_t>(er.code));
        pe->set_message(er.message);
    }
    static ErrorResponse get(const Envelope& env) {
        ErrorResponse er{};
        const auto raw = env.error().code();
        er.code = raw <= static_cast<uint32_t>(ErrorCode::Unknown) ? static_cast<ErrorCode>(raw)
                                                                   : ErrorCode::Unknown;
        er.message = env.error().message();
        return er;
    }
};

template <typename Variant>
static Result<void> encode_variant_into(Envelope& env, const Variant& v) {
    bool encoded = false;
    std::visit(
        [&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (HasProtoBinding<T>) {
                ProtoBinding<T>::set(env, x);
                encoded = true;
            }
        },
        v);
    if (!encoded) {
        return Error{ErrorCode::InvalidArgument, "Unsupported message type for proto"};
    }
    return Result<void>();
}

template <typename T, typename Variant> static Variant decode_as(const Envelope& env) {
    return Variant{std::in_place_type<T>, ProtoBinding<T>::get(env)};
}

Result<std::vector<std::uint8_t>> ProtoSerializer::encode_payload(const Message& msg) {
    Envelope env;
    env.set_version(PROTOCOL_VERSION);
    env.set_request_id(msg.requestId);

    auto r = std::visit([&](const auto& inner) { return encode_variant_into(env, inner); },
                        msg.payload);
    if (!r)
        return r.error();

    const auto size = env.ByteSizeLong();
    if (size > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidArgument, "Serialized payload exceeds MAX_MESSAGE_SIZE"};
    }
    std::vector<std::uint8_t> out(size);
    if (!env.SerializeToArray(out.data(), static_cast<int>(size))) {
        return Error{ErrorCode::InternalError, "Failed to serialize protobuf Envelope"};
    }
    return out;
}

Result<Message> ProtoSerializer::decode_payload(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidArgument, "Payload exceeds MAX_MESSAGE_SIZE"};
    }
    Envelope env;
    if (!env.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Error{ErrorCode::NetworkError, "Failed to parse protobuf Envelope"};
    }
    spdlog::trace("decode_payload: payload_case={} request_id={} size={}B",
                  static_cast<int>(env.payload_case()), env.request_id(), bytes.size());

    Message m;
    m.version = env.version();
    m.requestId = env.request_id();

    switch (env.payload_case()) {
        case Envelope::kStartRequest:
            m.payload = decode_as<StartRequest, Request>(env);
            break;
        case Envelope::kStopRequest:
            m.payload = decode_as<StopRequest, Request>(env);
            break;
        case Envelope::kDeleteRequest:
            m.payload = decode_as<DeleteRequest, Request>(env);
            break;
        case Envelope::kRestartRequest:
            m.payload = decode_as<RestartRequest, Request>(env);
            break;
        case Envelope::kDescribeRequest:
            m.payload = decode_as<DescribeRequest, Request>(env);
            break;
        case Envelope::kFlushRequest:
            m.payload = decode_as<FlushRequest, Request>(env);
            break;
        case Envelope::kListRequest:
            m.payload = decode_as<ListRequest, Request>(env);
            break;
        case Envelope::kPingRequest:
            m.payload = decode_as<PingRequest, Request>(env);
            break;
        case Envelope::kShutdownRequest:
            m.payload = decode_as<ShutdownRequest, Request>(env);
            break;
        case Envelope::kSuccess:
            m.payload = decode_as<SuccessResponse, Response>(env);
            break;
        case Envelope::kDescribeResponse:
            m.payload = decode_as<DescribeResponse, Response>(env);
            break;
        case Envelope::kListResponse:
            m.payload = decode_as<ListResponse, Response>(env);
            break;
        case Envelope::kPongResponse:
            m.payload = decode_as<PongResponse, Response>(env);
            break;
        case Envelope::kError:
            m.payload = decode_as<ErrorResponse, Response>(env);
            break;
        case Envelope::PAYLOAD_NOT_SET:
        default:
            return Error{ErrorCode::InvalidArgument, "Envelope carries no payload"};
    }
    return m;
}

} // namespace servherd::daemon
