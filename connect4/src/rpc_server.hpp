#pragma once

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace connect4::service {

/**
 * Owns the gRPC server hosting the Connect4Service.
 *
 * @param listen_address host:port to bind, port 0 picks an ephemeral port
 * @param service registered service, must outlive the server
 */
class RpcServer {
public:
    RpcServer(std::string listen_address, grpc::Service& service);
    ~RpcServer();

    RpcServer(const RpcServer&) = delete;
    RpcServer& operator=(const RpcServer&) = delete;

    /// Bind and start serving. Returns false if the address could not be bound.
    bool start();

    /// Stop accepting calls, waiting at most `grace` for in-flight ones.
    void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    /// Block until the server has been shut down.
    void wait();

    bool is_running() const { return running_.load(); }

    const std::string& listen_address() const { return listen_address_; }

    /// Port actually bound, 0 before start().
    int port() const { return selected_port_; }

private:
    std::string listen_address_;
    grpc::Service& service_;
    std::unique_ptr<grpc::Server> server_;
    std::mutex mutex_;
    std::atomic<bool> running_{false};
    int selected_port_ = 0;
};

} // namespace connect4::service
