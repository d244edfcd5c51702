#include "client.hpp"

#include "logger.hpp"

#include "connect4/service/v1/service_v1.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <log4cplus/loggingmacros.h>

#include <chrono>

namespace connect4::client {

service::v1::ConnectionRequest build_connection_request(const ClientOptions& options) {
    service::v1::ConnectionRequest request;
    if (!options.client_id.empty() || !options.account_id.empty()) {
        auto* metadata = request.mutable_metadata();
        if (!options.client_id.empty()) {
            metadata->set_client_id(options.client_id);
        }
        if (!options.account_id.empty()) {
            metadata->set_account_id(options.account_id);
        }
    }
    return request;
}

const char* status_code_name(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK: return "OK";
        case grpc::StatusCode::CANCELLED: return "CANCELLED";
        case grpc::StatusCode::UNKNOWN: return "UNKNOWN";
        case grpc::StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case grpc::StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
        case grpc::StatusCode::NOT_FOUND: return "NOT_FOUND";
        case grpc::StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case grpc::StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case grpc::StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
        case grpc::StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case grpc::StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case grpc::StatusCode::ABORTED: return "ABORTED";
        case grpc::StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case grpc::StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
        case grpc::StatusCode::INTERNAL: return "INTERNAL";
        case grpc::StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case grpc::StatusCode::DATA_LOSS: return "DATA_LOSS";
        default: return "UNKNOWN";
    }
}

std::string format_status(const grpc::Status& status) {
    if (status.ok()) {
        return "OK";
    }
    return std::string(status_code_name(status.error_code())) + ": " + status.error_message();
}

int run_connect(const ClientOptions& options, std::ostream& out) {
    auto channel = grpc::CreateChannel(options.target, grpc::InsecureChannelCredentials());
    auto stub = service::v1::Connect4Service::NewStub(channel);

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(options.timeout_ms));

    service::v1::ConnectionResponse response;
    LOG4CPLUS_DEBUG(core_logger(), "Calling Connect on " << options.target);
    grpc::Status status = stub->Connect(&context, build_connection_request(options), &response);

    out << format_status(status) << std::endl;
    return status.ok() ? 0 : 1;
}

int client_main(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    ClientOptions options;
    std::string error;
    if (!parse_client_options(argc, argv, options, error)) {
        err << error << std::endl;
        err << "Usage: connect4_client [--target host:port] [--client-id ID] [--account-id ID]"
               " [--timeout-ms N] [--config log4cplus.ini]"
            << std::endl;
        return 2;
    }

    if (options.show_version) {
        out << "Version: " << VERSION_STRING << std::endl;
        out << "Commit: " << GIT_VERSION_STRING << std::endl;
        return 0;
    }

    if (!options.log_config.empty()) {
        init_logging(options.log_config);
    }

    return run_connect(options, out);
}

} // namespace connect4::client
