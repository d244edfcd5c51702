#include "control_actions.hpp"
#include "connection_service.hpp"
#include "ipc_server.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "rpc_server.hpp"
#include "service_context.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <sys/prctl.h>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_signal = 0;

void on_signal(int signum) {
    g_signal = signum;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    connect4::ServiceOptions options;
    std::string error;
    if (!connect4::parse_service_options(argc, argv, options, error)) {
        std::cerr << error << std::endl;
        std::cerr << "Usage: connect4_service [--listen host:port] [--control-socket path] [--no-control]"
                     " [--workers N] [--config log4cplus.ini] [--shutdown-grace-ms N] [--pdeathsig] [-v]"
                  << std::endl;
        return 2;
    }

    if (options.show_version) {
        std::cout << "Version: " << VERSION_STRING << std::endl;
        std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (options.enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    connect4::init_logging(options.log_config);

    LOG4CPLUS_INFO(connect4::core_logger(), "connect4_service starting");
    LOG4CPLUS_INFO(connect4::core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(connect4::core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(connect4::core_logger(), "Listen: " << options.listen_address);
    LOG4CPLUS_INFO(connect4::core_logger(), "Control socket: "
                                                << (options.enable_control ? options.control_socket : "disabled"));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    connect4::service::ServiceStats stats;
    connect4::ServiceContext context(stats);
    std::atomic<bool> shutdown_requested{false};
    context.request_shutdown = [&shutdown_requested]() { shutdown_requested = true; };

    connect4::service::ConnectionService connection_service(stats);
    connect4::service::RpcServer rpc_server(options.listen_address, connection_service);
    if (!rpc_server.start()) {
        LOG4CPLUS_ERROR(connect4::core_logger(), "Failed to start RPC server");
        return 1;
    }
    context.mark_started(options.listen_address, rpc_server.port());

    std::unique_ptr<connect4::ipc::IpcServer> control_server;
    if (options.enable_control) {
        control_server = std::make_unique<connect4::ipc::IpcServer>(
            options.control_socket,
            [&context](const std::string& request_bytes) {
                return connect4::ipc::handle_action(request_bytes, context);
            },
            options.control_workers);
        if (!control_server->start()) {
            LOG4CPLUS_ERROR(connect4::core_logger(), "Failed to start control channel");
            rpc_server.shutdown(std::chrono::milliseconds(0));
            return 1;
        }
    }

    while (g_signal == 0 && !shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (g_signal != 0) {
        LOG4CPLUS_INFO(connect4::core_logger(), "Received signal " << g_signal << ", shutting down");
    } else {
        LOG4CPLUS_INFO(connect4::core_logger(), "Shutdown requested over control channel");
    }

    {
        std::lock_guard<std::mutex> lock(context.mutex);
        context.running = false;
    }
    rpc_server.shutdown(std::chrono::milliseconds(options.shutdown_grace_ms));
    rpc_server.wait();
    if (control_server) {
        control_server->stop();
    }

    auto snap = connect4::service::snapshot(stats);
    LOG4CPLUS_INFO(connect4::core_logger(), "connect4_service stopped: connect_total=" << snap.connect_total
                                                << " ok=" << snap.connect_ok << " rejected=" << snap.connect_rejected
                                                << " failed=" << snap.connect_failed);
    return 0;
}
