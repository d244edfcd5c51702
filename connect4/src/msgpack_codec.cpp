#include "msgpack_codec.hpp"

#include <stdexcept>

namespace connect4::ipc::codec {

namespace {

using Packer = msgpack::packer<msgpack::sbuffer>;

struct PayloadPacker {
    Packer& pk;

    void operator()(const std::monostate&) const { pk.pack_map(0); }
    void operator()(const StatusReport& report) const { pk.pack(report); }
    void operator()(const StatsReport& report) const { pk.pack(report); }
    void operator()(const ShutdownAck& ack) const { pk.pack(ack); }
};

msgpack::object_handle unpack_map(const std::string& bytes, const char* what) {
    msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size());
    if (handle.get().type != msgpack::type::MAP) {
        throw std::invalid_argument(std::string(what) + " is not a map");
    }
    return handle;
}

const msgpack::object* lookup(const msgpack::object& map_obj, const char* key) {
    const msgpack::object_map& map = map_obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const msgpack::object& k = map.ptr[i].key;
        if (k.type == msgpack::type::STR && k.as<std::string>() == key) {
            return &map.ptr[i].val;
        }
    }
    return nullptr;
}

// The payload kind is implied by its keys; an empty map means no payload.
ControlPayload decode_payload(const msgpack::object& obj) {
    if (obj.type != msgpack::type::MAP || obj.via.map.size == 0) {
        return std::monostate{};
    }
    if (lookup(obj, "listen_address")) {
        return obj.as<StatusReport>();
    }
    if (lookup(obj, "connect_total")) {
        return obj.as<StatsReport>();
    }
    if (lookup(obj, "success")) {
        return obj.as<ShutdownAck>();
    }
    throw std::invalid_argument("unrecognised control payload");
}

} // namespace

ControlRequest decode_request(const std::string& bytes) {
    msgpack::object_handle handle = unpack_map(bytes, "request");
    return handle.get().as<ControlRequest>();
}

std::string encode_request(const ControlRequest& request) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, request);
    return std::string(buffer.data(), buffer.size());
}

ControlResponse decode_response(const std::string& bytes) {
    msgpack::object_handle handle = unpack_map(bytes, "response");
    const msgpack::object& root = handle.get();

    ControlResponse response;
    if (const msgpack::object* id = lookup(root, "id")) {
        response.id = id->as<std::string>();
    }
    if (const msgpack::object* payload = lookup(root, "payload")) {
        response.payload = decode_payload(*payload);
    }
    const msgpack::object* error = lookup(root, "error");
    if (error && error->type == msgpack::type::MAP) {
        const msgpack::object* message = lookup(*error, "message");
        response.error = message ? message->as<std::string>() : std::string();
    }
    return response;
}

std::string encode_response(const ControlResponse& response) {
    msgpack::sbuffer buffer;
    Packer pk(&buffer);

    pk.pack_map(4);
    pk.pack("id");
    pk.pack(response.id);
    pk.pack("type");
    pk.pack("response");
    pk.pack("payload");
    std::visit(PayloadPacker{pk}, response.payload);
    pk.pack("error");
    if (response.error) {
        pk.pack_map(1);
        pk.pack("message");
        pk.pack(*response.error);
    } else {
        pk.pack_nil();
    }

    return std::string(buffer.data(), buffer.size());
}

} // namespace connect4::ipc::codec
