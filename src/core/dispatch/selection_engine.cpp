#include <relay/core/dispatch/selection_engine.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Relay {

SelectionEngine::SelectionEngine(const TargetRegistry& registry, SelectionStrategy strategy)
    : registry_(registry), strategy_(strategy) {}

bool SelectionEngine::isExcluded(TargetId id, const std::vector<TargetId>& excluded) {
    return std::find(excluded.begin(), excluded.end(), id) != excluded.end();
}

TargetId SelectionEngine::select(const std::vector<TargetId>& excluded, uint64_t now_ms) {
    return select(strategy(), excluded, now_ms);
}

TargetId SelectionEngine::select(SelectionStrategy strategy, const std::vector<TargetId>& excluded,
                                 uint64_t now_ms) {
    if (registry_.size() == 0) return 0;

    if (strategy == SelectionStrategy::ROUND_ROBIN) {
        return pickRoundRobin(excluded);
    }

    auto snaps = registry_.snapshots(now_ms);
    std::optional<TargetId> picked = strategy == SelectionStrategy::LEAST_LOADED
        ? pickLeastLoaded(snaps, excluded)
        : pickSmart(snaps, excluded);

    if (picked) return *picked;

    TargetId fb = fallback(snaps, excluded);
    spdlog::debug("[Selection] No eligible target for {} ({} excluded), falling back to {}",
                  toString(strategy), excluded.size(), fb);
    return fb;
}

TargetId SelectionEngine::pickRoundRobin(const std::vector<TargetId>& excluded) {
    const size_t n = registry_.size();
    for (size_t attempt = 0; attempt < n; ++attempt) {
        TargetId id = rr_index_.fetch_add(1, std::memory_order_relaxed) % n;
        if (!isExcluded(id, excluded)) return id;
    }
    return 0;
}

// ============================================================================
// Scoring
// ============================================================================

double SelectionEngine::score(const TargetSnapshot& t) {
    const auto& m = t.metrics;

    double load = std::max(0.0, 100.0 - 2.0 * static_cast<double>(t.queued));

    double health = m.success_rate * 50.0
        + std::min(50.0, 1000.0 / (static_cast<double>(m.error_count) + 10.0));

    double speed = m.avg_processing_time_s > 0.0
        ? std::min(50.0, 5.0 / m.avg_processing_time_s)
        : 0.0;

    double headroom = 0.0;
    const double limit = t.limits.messages_per_second;
    if (limit > 0.0) {
        headroom = std::max(0.0, (limit - static_cast<double>(t.recent_sends)) / limit * 100.0);
    }

    return load * 0.4 + health * 0.3 + speed * 0.2 + headroom * 0.1;
}

bool SelectionEngine::eligibleForSmart(const TargetSnapshot& t) {
    return !t.rate_limited && !t.circuit_open && t.metrics.consecutive_failures < UNHEALTHY_FAILURES;
}

std::optional<TargetId> SelectionEngine::pickSmart(const std::vector<TargetSnapshot>& targets,
                                                   const std::vector<TargetId>& excluded) {
    std::optional<TargetId> best;
    double best_score = 0.0;
    for (const auto& t : targets) {
        if (isExcluded(t.id, excluded) || !eligibleForSmart(t)) continue;
        double s = score(t);
        // strict > keeps the lowest id on ties
        if (!best || s > best_score) {
            best = t.id;
            best_score = s;
        }
    }
    return best;
}

std::optional<TargetId> SelectionEngine::pickLeastLoaded(const std::vector<TargetSnapshot>& targets,
                                                         const std::vector<TargetId>& excluded) {
    std::optional<TargetId> best;
    size_t best_load = 0;
    for (const auto& t : targets) {
        if (isExcluded(t.id, excluded) || t.rate_limited || t.circuit_open) continue;
        size_t load = t.queued + t.metrics.current_load;
        if (!best || load < best_load) {
            best = t.id;
            best_load = load;
        }
    }
    return best;
}

TargetId SelectionEngine::fallback(const std::vector<TargetSnapshot>& targets,
                                   const std::vector<TargetId>& excluded) {
    std::optional<TargetId> best;
    size_t best_load = 0;
    for (const auto& t : targets) {
        if (isExcluded(t.id, excluded)) continue;
        size_t load = t.queued + t.metrics.current_load;
        if (!best || load < best_load) {
            best = t.id;
            best_load = load;
        }
    }
    return best.value_or(0);
}

} // namespace Relay
