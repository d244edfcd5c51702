#include "rpc_server.hpp"

#include "logger.hpp"

#include <grpcpp/health_check_service_interface.h>
#include <log4cplus/loggingmacros.h>

namespace connect4::service {

RpcServer::RpcServer(std::string listen_address, grpc::Service& service)
    : listen_address_(std::move(listen_address)), service_(service) {}

RpcServer::~RpcServer() {
    shutdown(std::chrono::milliseconds(0));
}

bool RpcServer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }

    grpc::EnableDefaultHealthCheckService(true);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(listen_address_, grpc::InsecureServerCredentials(), &selected_port_);
    builder.RegisterService(&service_);

    server_ = builder.BuildAndStart();
    if (!server_ || selected_port_ == 0) {
        LOG4CPLUS_ERROR(service_logger(), "Failed to bind RPC server on " << listen_address_);
        server_.reset();
        selected_port_ = 0;
        return false;
    }

    running_ = true;
    LOG4CPLUS_INFO(service_logger(), "RPC server listening on " << listen_address_ << " (port " << selected_port_ << ")");
    return true;
}

void RpcServer::shutdown(std::chrono::milliseconds grace) {
    grpc::Server* server = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        server = server_.get();
    }

    // Blocks for up to `grace` while in-flight calls drain; server_ is only
    // released by the destructor.
    LOG4CPLUS_INFO(service_logger(), "Shutting down RPC server on " << listen_address_);
    server->Shutdown(std::chrono::system_clock::now() + grace);
}

void RpcServer::wait() {
    grpc::Server* server = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        server = server_.get();
    }
    if (server) {
        server->Wait();
    }
}

} // namespace connect4::service
