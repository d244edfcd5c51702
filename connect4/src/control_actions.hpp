#pragma once

#include "control_protocol.hpp"
#include "service_context.hpp"

#include <string>

namespace connect4::ipc {

/// Run one control action against the service state.
ControlResponse dispatch_action(const ControlRequest& request, ServiceContext& context);

/// Decode a control frame, dispatch it and return the encoded response.
std::string handle_action(const std::string& request_bytes, ServiceContext& context);

} // namespace connect4::ipc
