#include "connection_service.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>

namespace connect4::service {

grpc::Status ConnectionService::Connect(grpc::ServerContext* context,
                                        const v1::ConnectionRequest* request,
                                        v1::ConnectionResponse* response) {
    LOG4CPLUS_DEBUG(service_logger(), "Connect from " << context->peer());
    return handle_connect(*request, *response, context->IsCancelled());
}

grpc::Status ConnectionService::handle_connect(const v1::ConnectionRequest& request,
                                               v1::ConnectionResponse& response,
                                               bool cancelled) {
    stats_.connect_total.fetch_add(1, std::memory_order_relaxed);

    if (cancelled) {
        stats_.connect_cancelled.fetch_add(1, std::memory_order_relaxed);
        LOG4CPLUS_DEBUG(service_logger(), "Connect cancelled by the client");
        return grpc::Status(grpc::StatusCode::CANCELLED, "call cancelled");
    }

    try {
        grpc::Status status = validator_(request);
        if (!status.ok()) {
            stats_.connect_rejected.fetch_add(1, std::memory_order_relaxed);
            LOG4CPLUS_WARN(service_logger(), "Connect rejected: " << status.error_message());
            return status;
        }

        response.mutable_response();

        stats_.connect_ok.fetch_add(1, std::memory_order_relaxed);
        LOG4CPLUS_DEBUG(service_logger(), "Connect accepted client_id=" << request.metadata().client_id()
                                              << " account_id=" << request.metadata().account_id());
        return grpc::Status::OK;
    } catch (const std::exception& exc) {
        stats_.connect_failed.fetch_add(1, std::memory_order_relaxed);
        LOG4CPLUS_ERROR(service_logger(), "Connect failed: " << exc.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, "internal error");
    }
}

} // namespace connect4::service
