#include <relay/core/maintenance/health_monitor.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <mutex>

namespace Relay {

HealthMonitor::HealthMonitor(QueueManager& queues, std::chrono::milliseconds interval, StatsSource stats)
    : PeriodicTask("HealthMonitor", interval),
      queues_(queues),
      stats_(std::move(stats)) {}

HealthMonitor::~HealthMonitor() noexcept {
    stop();
}

void HealthMonitor::tick() {
    runOnce(Clock::now_ms());
    if (stats_) {
        logReport(stats_(), "DISPATCH HEALTH REPORT");
    }
}

HealthAdjustment HealthMonitor::runOnce(uint64_t now_ms) {
    HealthAdjustment adj;
    auto& registry = queues_.registry();
    const bool adaptive = queues_.adaptiveEnabled();

    for (TargetId id = 0; id < registry.size(); ++id) {
        TargetState& t = registry.at(id);
        std::lock_guard<std::mutex> lock(t.mutex);
        auto& m = t.metrics;

        if (adaptive && t.limits.adaptive) {
            const double before_mps = t.limits.messages_per_second;
            AdaptAction action = RateLimiter::adapt(t.limits, m.success_rate, m.consecutive_failures);
            if (action == AdaptAction::INCREASED) adj.increased++;
            if (action == AdaptAction::DECREASED) adj.decreased++;
            if (action != AdaptAction::NONE && t.limits.messages_per_second != before_mps) {
                spdlog::info("[HealthMonitor] {} rate {}: {:.1f} -> {:.1f} msg/s, burst {}, recovery {:.0f}s",
                             t.name, toString(action), before_mps, t.limits.messages_per_second,
                             t.limits.burst_limit, t.limits.recovery_time_s);
            }
        }

        if (now_ms > m.rate_limit_until_ms && m.consecutive_failures > 0) {
            m.consecutive_failures--;
            adj.decayed++;
        }
    }
    return adj;
}

} // namespace Relay
