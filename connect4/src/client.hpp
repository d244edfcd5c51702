#pragma once

#include "options.hpp"

#include "connect4/service/v1/service_v1.pb.h"

#include <grpcpp/support/status.h>

#include <ostream>
#include <string>

namespace connect4::client {

/// Ids left empty in the options stay absent on the wire.
service::v1::ConnectionRequest build_connection_request(const ClientOptions& options);

const char* status_code_name(grpc::StatusCode code);

/// "OK", or "<STATUS_CODE_NAME>: <message>".
std::string format_status(const grpc::Status& status);

/// Issue one Connect call. Returns 0 on OK, 1 on any RPC failure.
int run_connect(const ClientOptions& options, std::ostream& out);

/// Command-line entry point. Exit status 0 on OK, 1 on RPC failure, 2 on bad arguments.
int client_main(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace connect4::client
