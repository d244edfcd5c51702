#include "control_actions.hpp"

#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace connect4::ipc {

namespace {

using ActionFn = void (*)(ServiceContext&, ControlResponse&);

void service_status(ServiceContext& context, ControlResponse& response) {
    std::lock_guard<std::mutex> lock(context.mutex);

    StatusReport report;
    report.running = context.running;
    report.listen_address = context.listen_address;
    report.port = context.port;
    report.started_at = context.started_at;
    report.uptime_s = context.running ? context.uptime_seconds() : 0.0;
    response.payload = report;
}

void service_stats(ServiceContext& context, ControlResponse& response) {
    auto snap = service::snapshot(context.stats);

    StatsReport report;
    report.connect_total = snap.connect_total;
    report.connect_ok = snap.connect_ok;
    report.connect_rejected = snap.connect_rejected;
    report.connect_failed = snap.connect_failed;
    report.connect_cancelled = snap.connect_cancelled;
    response.payload = report;
}

void service_shutdown(ServiceContext& context, ControlResponse& response) {
    std::function<void()> trigger;
    {
        std::lock_guard<std::mutex> lock(context.mutex);
        trigger = context.request_shutdown;
    }

    if (!trigger) {
        LOG4CPLUS_ERROR(control_logger(), "service.shutdown: no shutdown handler installed");
        response.error = "Shutdown not supported";
        return;
    }

    LOG4CPLUS_INFO(control_logger(), "service.shutdown requested");
    trigger();
    response.payload = ShutdownAck{};
}

const std::unordered_map<std::string, ActionFn>& actions() {
    static const std::unordered_map<std::string, ActionFn> table = {
        {"service.status", &service_status},
        {"service.stats", &service_stats},
        {"service.shutdown", &service_shutdown},
    };
    return table;
}

} // namespace

ControlResponse dispatch_action(const ControlRequest& request, ServiceContext& context) {
    ControlResponse response;
    response.id = request.id;

    auto it = actions().find(request.action);
    if (it == actions().end()) {
        LOG4CPLUS_WARN(control_logger(), "Unknown action: " << request.action);
        response.error = "Unknown action";
        return response;
    }

    it->second(context, response);
    return response;
}

std::string handle_action(const std::string& request_bytes, ServiceContext& context) {
    ControlRequest request;
    try {
        request = codec::decode_request(request_bytes);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(control_logger(), "Decode error: " << exc.what());
        ControlResponse response;
        response.error = std::string("Decode error: ") + exc.what();
        return codec::encode_response(response);
    }

    LOG4CPLUS_INFO(control_logger(), "Control action: " << request.action << " id=" << request.id);
    return codec::encode_response(dispatch_action(request, context));
}

} // namespace connect4::ipc
