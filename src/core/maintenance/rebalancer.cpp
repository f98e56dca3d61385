#include <relay/core/maintenance/rebalancer.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace Relay {

Rebalancer::Rebalancer(QueueManager& queues, const MaintenanceConfig& config)
    : PeriodicTask("Rebalancer", std::chrono::milliseconds(config.rebalance_interval_ms)),
      queues_(queues),
      min_gap_(config.rebalance_min_gap),
      max_move_(config.rebalance_max_move) {}

Rebalancer::~Rebalancer() noexcept {
    stop();
}

void Rebalancer::tick() {
    if (!queues_.adaptiveEnabled()) {
        return;
    }
    runOnce(Clock::now_ms());
}

RebalancePlan Rebalancer::plan(const std::vector<TargetSnapshot>& targets,
                               size_t min_gap, size_t max_move) {
    struct Candidate {
        TargetId id;
        size_t queued;
        double load;
        double avg_time;
    };

    std::vector<Candidate> eligible;
    for (const auto& t : targets) {
        if (t.rate_limited || t.metrics.consecutive_failures > MAX_FAILURES) continue;
        double load = static_cast<double>(t.queued) / std::max(0.1, t.metrics.success_rate);
        eligible.push_back({t.id, t.queued, load, t.metrics.avg_processing_time_s});
    }

    RebalancePlan p;
    if (eligible.size() < 2) {
        return p;
    }

    std::stable_sort(eligible.begin(), eligible.end(), [](const Candidate& a, const Candidate& b) {
        if (a.load != b.load) return a.load < b.load;
        return a.avg_time < b.avg_time;
    });

    const Candidate& under = eligible.front();
    const Candidate& over = eligible.back();
    if (over.queued <= under.queued) {
        return p;
    }

    p.gap = over.queued - under.queued;
    if (p.gap < min_gap) {
        return p;
    }

    p.act = true;
    p.from = over.id;
    p.to = under.id;
    p.to_move = std::min(p.gap / 2, max_move);
    return p;
}

size_t Rebalancer::runOnce(uint64_t now_ms, bool force) {
    if (!force && !queues_.adaptiveEnabled()) {
        return 0;
    }

    auto& registry = queues_.registry();
    RebalancePlan p = plan(registry.snapshots(now_ms), min_gap_, max_move_);
    if (!p.act || p.to_move == 0) {
        return 0;
    }

    size_t moved = move(p, now_ms);
    if (moved > 0) {
        queues_.recordRebalanced(moved);
        registry.at(p.to).available.notify_one();
        spdlog::info("[Rebalancer] Moved {} messages {} -> {} (gap {})",
                     moved, registry.at(p.from).name, registry.at(p.to).name, p.gap);
    }
    return moved;
}

size_t Rebalancer::move(const RebalancePlan& p, uint64_t now_ms) {
    auto& registry = queues_.registry();
    TargetState& from = registry.at(p.from);
    TargetState& to = registry.at(p.to);

    // Always lock the lower id first
    TargetState& first = p.from < p.to ? from : to;
    TargetState& second = p.from < p.to ? to : from;
    std::unique_lock<std::mutex> lock_first(first.mutex);
    std::unique_lock<std::mutex> lock_second(second.mutex);

    // Health may have changed since the snapshot
    if (from.isRateLimited(now_ms) || to.isRateLimited(now_ms)
        || from.metrics.consecutive_failures > MAX_FAILURES
        || to.metrics.consecutive_failures > MAX_FAILURES) {
        return 0;
    }

    size_t moved = 0;
    for (auto priority : PRIORITIES_HIGH_TO_LOW) {
        ItemHeap& source = from.queues.heap(priority);
        while (moved < p.to_move && !source.empty()) {
            ItemPtr item = source.pop();
            item->target = p.to;
            item->timestamp_ms = now_ms;
            to.queues.push(std::move(item));
            moved++;
        }
        if (moved >= p.to_move) break;
    }
    if (moved > 0) to.wake_seq++;
    return moved;
}

} // namespace Relay
