#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/utils/periodic_task.hpp>
#include <cstddef>
#include <cstdint>

namespace Relay {

/**
 * @class Reaper
 * @brief Compacts one target's heaps per tick, round robin.
 *
 * Removes items older than the retention window whose retries are spent
 * and rebuilds the heaps. This is the only place heaps are scanned in full.
 */
class Reaper : public PeriodicTask {
public:
    Reaper(QueueManager& queues, const MaintenanceConfig& config);
    ~Reaper() noexcept override;

    /**
     * @brief Reap the next target in turn
     * @return number of items removed
     */
    size_t runOnce(uint64_t now_ms);

    TargetId nextTarget() const { return cursor_; }

protected:
    void tick() override;

private:
    QueueManager& queues_;
    uint64_t retention_ms_;
    TargetId cursor_ = 0;
};

} // namespace Relay
