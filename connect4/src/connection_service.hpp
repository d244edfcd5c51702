#pragma once

#include "request_validation.hpp"
#include "service_stats.hpp"

#include "connect4/service/v1/service_v1.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <functional>

namespace connect4::service {

using RequestValidator = std::function<grpc::Status(const v1::ConnectionRequest&)>;

class ConnectionService final : public v1::Connect4Service::Service {
public:
    explicit ConnectionService(ServiceStats& stats, RequestValidator validator = validate_connection_request)
        : stats_(stats), validator_(std::move(validator)) {}

    grpc::Status Connect(grpc::ServerContext* context,
                         const v1::ConnectionRequest* request,
                         v1::ConnectionResponse* response) override;

    /// Transport independent part of Connect. A cancelled call is counted and
    /// answered with CANCELLED before any validation.
    grpc::Status handle_connect(const v1::ConnectionRequest& request,
                                v1::ConnectionResponse& response,
                                bool cancelled = false);

private:
    ServiceStats& stats_;
    RequestValidator validator_;
};

} // namespace connect4::service
