#pragma once

#include <relay/core/control/dispatch_state.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <relay/core/workers/target_worker.hpp>
#include <cstdint>
#include <vector>

namespace Relay {

struct TargetStats {
    TargetSnapshot target;
    WorkerStatus worker;
};

struct DispatchStats {
    std::vector<TargetStats> targets;
    QueueTotals totals;

    double processing_rate = 0.0;       // delivered per second of uptime
    double success_rate_pct = 0.0;      // delivered / enqueued * 100
    uint64_t uptime_s = 0;

    SelectionStrategy strategy = SelectionStrategy::SMART;
    bool adaptive_enabled = true;
    DispatchState state = DispatchState::RUNNING;

    uint64_t dead_letters = 0;
    uint64_t latency_p50_us = 0;
    uint64_t latency_p99_us = 0;
};

/**
 * @brief Derive the rate fields from totals and uptime
 */
void finalizeRates(DispatchStats& stats);

/**
 * @brief Boxed multi-line report; warn level when any target is unhealthy
 */
void logReport(const DispatchStats& stats, const char* title);

bool isHealthy(const TargetStats& t);

} // namespace Relay
