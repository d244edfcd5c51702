#pragma once

#include "service_stats.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace connect4 {

/**
 * State of the running service exposed to control actions.
 */
struct ServiceContext {
    std::mutex mutex;

    std::string listen_address;
    int port = 0;
    bool running = false;
    std::string started_at;
    std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};

    service::ServiceStats& stats;

    // Invoked by service.shutdown; must not block.
    std::function<void()> request_shutdown;

    explicit ServiceContext(service::ServiceStats& service_stats) : stats(service_stats) {}

    void mark_started(const std::string& address, int bound_port);
    double uptime_seconds() const;
};

std::string now_iso();

} // namespace connect4
