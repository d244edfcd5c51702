#include "request_validation.hpp"

namespace connect4::service {

grpc::Status validate_connection_request(const v1::ConnectionRequest& request) {
    if (!request.has_metadata()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "metadata is required");
    }

    const auto& metadata = request.metadata();
    if (!metadata.has_client_id() || metadata.client_id().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "metadata.client_id is required");
    }
    if (!metadata.has_account_id() || metadata.account_id().empty()) {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "metadata.account_id is required");
    }

    return grpc::Status::OK;
}

} // namespace connect4::service
