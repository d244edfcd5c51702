#include "service_context.hpp"

#include <ctime>

namespace connect4 {

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

void ServiceContext::mark_started(const std::string& address, int bound_port) {
    std::lock_guard<std::mutex> lock(mutex);
    listen_address = address;
    port = bound_port;
    running = true;
    started_at = now_iso();
    started = std::chrono::steady_clock::now();
}

double ServiceContext::uptime_seconds() const {
    auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration<double>(elapsed).count();
}

} // namespace connect4
