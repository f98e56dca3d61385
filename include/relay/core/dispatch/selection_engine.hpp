#pragma once

#include <relay/core/dispatch/target_registry.hpp>
#include <relay/core/dispatch/types.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace Relay {

/**
 * @class SelectionEngine
 * @brief Picks the target for a new or retried item.
 *
 * Works on snapshots taken one target lock at a time, so it never holds a
 * target lock while scoring. The answer may be slightly stale by the time the
 * item is pushed; that only affects balance, not correctness.
 */
class SelectionEngine {
public:
    // A target with this many consecutive failures is not scored
    static constexpr uint32_t UNHEALTHY_FAILURES = 3;

    SelectionEngine(const TargetRegistry& registry, SelectionStrategy strategy);

    TargetId select(const std::vector<TargetId>& excluded, uint64_t now_ms);
    TargetId select(SelectionStrategy strategy, const std::vector<TargetId>& excluded, uint64_t now_ms);

    void setStrategy(SelectionStrategy s) { strategy_.store(s, std::memory_order_release); }
    SelectionStrategy strategy() const { return strategy_.load(std::memory_order_acquire); }

    // ------------------------------------------------------------------
    // Pure strategy functions over snapshots
    // ------------------------------------------------------------------

    /**
     * @brief Weighted score, higher is better
     *
     *   40% queue load   max(0, 100 - 2 * queued)
     *   30% health       success * 50 + min(50, 1000 / (errors + 10))
     *   20% speed        min(50, 5 / avg_time), 0 with no samples
     *   10% headroom     max(0, (mps - recent) / mps * 100)
     */
    static double score(const TargetSnapshot& t);

    static bool eligibleForSmart(const TargetSnapshot& t);

    static std::optional<TargetId> pickSmart(const std::vector<TargetSnapshot>& targets,
                                             const std::vector<TargetId>& excluded);
    static std::optional<TargetId> pickLeastLoaded(const std::vector<TargetSnapshot>& targets,
                                                   const std::vector<TargetId>& excluded);

    /**
     * @brief Last resort: least loaded non-excluded target ignoring health,
     *        or target 0 when everything is excluded
     */
    static TargetId fallback(const std::vector<TargetSnapshot>& targets,
                             const std::vector<TargetId>& excluded);

private:
    static bool isExcluded(TargetId id, const std::vector<TargetId>& excluded);

    TargetId pickRoundRobin(const std::vector<TargetId>& excluded);

    const TargetRegistry& registry_;
    std::atomic<SelectionStrategy> strategy_;
    std::atomic<size_t> rr_index_{0};
};

} // namespace Relay
