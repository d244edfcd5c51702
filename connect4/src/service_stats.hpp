#pragma once

#include <atomic>
#include <cstdint>

namespace connect4::service {

/**
 * Per-process counters of Connect outcomes.
 * Updated from gRPC handler threads without locking.
 */
struct ServiceStats {
    std::atomic<uint64_t> connect_total{0};
    std::atomic<uint64_t> connect_ok{0};
    std::atomic<uint64_t> connect_rejected{0};
    std::atomic<uint64_t> connect_failed{0};
    std::atomic<uint64_t> connect_cancelled{0};
};

struct StatsSnapshot {
    uint64_t connect_total = 0;
    uint64_t connect_ok = 0;
    uint64_t connect_rejected = 0;
    uint64_t connect_failed = 0;
    uint64_t connect_cancelled = 0;
};

inline StatsSnapshot snapshot(const ServiceStats& stats) {
    StatsSnapshot snap;
    snap.connect_total = stats.connect_total.load(std::memory_order_relaxed);
    snap.connect_ok = stats.connect_ok.load(std::memory_order_relaxed);
    snap.connect_rejected = stats.connect_rejected.load(std::memory_order_relaxed);
    snap.connect_failed = stats.connect_failed.load(std::memory_order_relaxed);
    snap.connect_cancelled = stats.connect_cancelled.load(std::memory_order_relaxed);
    return snap;
}

} // namespace connect4::service
