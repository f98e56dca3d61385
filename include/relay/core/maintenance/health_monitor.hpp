#pragma once

#include <relay/core/dispatch/dispatch_stats.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/utils/periodic_task.hpp>
#include <chrono>
#include <cstdint>
#include <functional>

namespace Relay {

struct HealthAdjustment {
    size_t decayed = 0;         // targets whose failure count was lowered
    size_t increased = 0;
    size_t decreased = 0;
};

/**
 * @class HealthMonitor
 * @brief Periodic recovery and rate adaptation for all targets.
 *
 * Each tick, per target:
 *   - outside its cooldown, consecutive_failures drops by one
 *   - when adaptive mode is on (globally and for the target), limits are
 *     adjusted from the current success rate
 * then a boxed report is logged.
 */
class HealthMonitor : public PeriodicTask {
public:
    using StatsSource = std::function<DispatchStats()>;

    HealthMonitor(QueueManager& queues, std::chrono::milliseconds interval, StatsSource stats = {});
    ~HealthMonitor() noexcept override;

    HealthAdjustment runOnce(uint64_t now_ms);

protected:
    void tick() override;

private:
    QueueManager& queues_;
    StatsSource stats_;
};

} // namespace Relay
