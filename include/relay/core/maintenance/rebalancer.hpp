#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/utils/periodic_task.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Relay {

struct RebalancePlan {
    bool act = false;
    TargetId from = 0;          // overloaded
    TargetId to = 0;            // underloaded
    size_t gap = 0;
    size_t to_move = 0;
};

/**
 * @class Rebalancer
 * @brief Moves queued items from the most to the least loaded healthy target.
 *
 * Rate-limited targets and targets with more than two consecutive failures
 * take no part. Load is queued / max(0.1, success_rate), ties broken by
 * average processing time. Nothing moves unless the raw queue gap reaches
 * min_gap; then min(gap / 2, max_move) items move, most urgent first.
 *
 * The periodic tick is skipped while adaptive mode is off; runOnce() with
 * force = true always runs.
 */
class Rebalancer : public PeriodicTask {
public:
    static constexpr uint32_t MAX_FAILURES = 2;

    Rebalancer(QueueManager& queues, const MaintenanceConfig& config);
    ~Rebalancer() noexcept override;

    /**
     * @return number of items moved
     */
    size_t runOnce(uint64_t now_ms, bool force = false);

    static RebalancePlan plan(const std::vector<TargetSnapshot>& targets,
                              size_t min_gap, size_t max_move);

protected:
    void tick() override;

private:
    size_t move(const RebalancePlan& plan, uint64_t now_ms);

    QueueManager& queues_;
    size_t min_gap_;
    size_t max_move_;
};

} // namespace Relay
