#pragma once

#include "control_protocol.hpp"

#include <string>

namespace connect4::ipc::codec {

/**
 * Control frames are msgpack maps. Responses always carry the four keys
 * "id", "type" ("response"), "payload" and "error" (nil or {"message": str}).
 *
 * The decode functions throw msgpack::type_error, msgpack::unpack_error or
 * std::invalid_argument on malformed input.
 */
ControlRequest decode_request(const std::string& bytes);
std::string encode_request(const ControlRequest& request);

ControlResponse decode_response(const std::string& bytes);
std::string encode_response(const ControlResponse& response);

} // namespace connect4::ipc::codec
