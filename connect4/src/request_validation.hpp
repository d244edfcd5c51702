#pragma once

#include "connect4/service/v1/service_v1.pb.h"

#include <grpcpp/support/status.h>

namespace connect4::service {

/**
 * Checks the fields a ConnectionRequest must carry even though the wire
 * encoding marks them optional: metadata, metadata.client_id and
 * metadata.account_id (non-empty). Returns INVALID_ARGUMENT naming the first
 * missing field, OK otherwise.
 */
grpc::Status validate_connection_request(const v1::ConnectionRequest& request);

} // namespace connect4::service
