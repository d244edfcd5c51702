#pragma once

#include <msgpack.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace connect4::ipc {

/// {"id": str, "action": str}; unknown keys such as "payload" are ignored.
struct ControlRequest {
    std::string id;
    std::string action;
    MSGPACK_DEFINE_MAP(id, action);
};

/// service.status
struct StatusReport {
    bool running = false;
    std::string listen_address;
    int port = 0;
    std::string started_at;
    double uptime_s = 0.0;
    MSGPACK_DEFINE_MAP(running, listen_address, port, started_at, uptime_s);
};

/// service.stats
struct StatsReport {
    uint64_t connect_total = 0;
    uint64_t connect_ok = 0;
    uint64_t connect_rejected = 0;
    uint64_t connect_failed = 0;
    uint64_t connect_cancelled = 0;
    MSGPACK_DEFINE_MAP(connect_total, connect_ok, connect_rejected, connect_failed, connect_cancelled);
};

/// service.shutdown
struct ShutdownAck {
    bool success = true;
    MSGPACK_DEFINE_MAP(success);
};

// monostate packs as an empty map and accompanies every error.
using ControlPayload = std::variant<std::monostate, StatusReport, StatsReport, ShutdownAck>;

struct ControlResponse {
    std::string id;
    ControlPayload payload;
    std::optional<std::string> error;
};

} // namespace connect4::ipc
