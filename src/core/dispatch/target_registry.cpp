#include <relay/core/dispatch/target_registry.hpp>
#include <spdlog/spdlog.h>

namespace Relay {

TargetState::TargetState(TargetId target_id, const TargetConfig& cfg, size_t tracker_capacity)
    : id(target_id),
      name(cfg.name.empty() ? "target-" + std::to_string(target_id) : cfg.name),
      limits(RateLimitSettings::from(cfg)),
      tracker(tracker_capacity) {}

void TargetState::recordProcessingTime(double seconds) {
    if (history_.size() >= HISTORY_CAPACITY) {
        history_sum_ -= history_.front();
        history_.pop_front();
    }
    history_.push_back(seconds);
    history_sum_ += seconds;
    metrics.avg_processing_time_s = history_sum_ / static_cast<double>(history_.size());
}

TargetRegistry::TargetRegistry(const std::vector<TargetConfig>& targets, const RateWindowConfig& window)
    : limiter_(window) {
    targets_.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        targets_.push_back(std::make_unique<TargetState>(i, targets[i], window.tracker_capacity));
        spdlog::info("[TargetRegistry] Target {} '{}': {:.1f} msg/s, burst {}, recovery {:.1f}s{}",
                     i, targets_.back()->name, targets[i].messages_per_second,
                     targets[i].burst_limit, targets[i].recovery_time_s,
                     targets[i].adaptive ? ", adaptive" : "");
    }
}

TargetSnapshot TargetRegistry::snapshotLocked(const TargetState& t, uint64_t now_ms) const {
    TargetSnapshot s;
    s.id = t.id;
    s.name = t.name;
    for (auto p : PRIORITIES_HIGH_TO_LOW) {
        s.queued_by_priority[priorityIndex(p)] = t.queues.size(p);
        s.queued += t.queues.size(p);
    }
    s.metrics = t.metrics;
    s.limits = t.limits;
    s.recent_sends = limiter_.recentCount(t, now_ms);
    s.rate_limited = t.isRateLimited(now_ms);
    s.circuit_open = t.circuit.open && now_ms < t.circuit.closes_at_ms;
    s.circuit_opens = t.circuit.open_count;
    return s;
}

TargetSnapshot TargetRegistry::snapshot(TargetId id, uint64_t now_ms) const {
    const TargetState& t = at(id);
    std::lock_guard<std::mutex> lock(t.mutex);
    return snapshotLocked(t, now_ms);
}

std::vector<TargetSnapshot> TargetRegistry::snapshots(uint64_t now_ms) const {
    std::vector<TargetSnapshot> out;
    out.reserve(targets_.size());
    for (const auto& t : targets_) {
        std::lock_guard<std::mutex> lock(t->mutex);
        out.push_back(snapshotLocked(*t, now_ms));
    }
    return out;
}

} // namespace Relay
