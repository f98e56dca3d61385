#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/item_heap.hpp>
#include <relay/core/dispatch/rate_limiter.hpp>
#include <relay/core/dispatch/types.hpp>
#include <array>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Relay {

// ============================================================================
// PER-TARGET STATE
// ============================================================================

struct TargetMetrics {
    uint64_t messages_processed = 0;
    double success_rate = 1.0;              // [0, 1]
    double avg_processing_time_s = 0.0;
    uint32_t current_load = 0;              // in flight
    uint64_t error_count = 0;
    uint32_t consecutive_failures = 0;
    uint64_t rate_limit_until_ms = 0;

    // error breakdown, for logs and stats only
    uint64_t network_errors = 0;
    uint64_t timeouts = 0;
    uint64_t other_errors = 0;
    uint64_t retry_after_signals = 0;
    uint64_t rate_limit_hits = 0;           // local burst-limit deferrals
};

struct CircuitState {
    bool open = false;
    uint64_t opened_at_ms = 0;
    uint64_t closes_at_ms = 0;      // first instant a send is allowed again
    uint64_t open_count = 0;
};

/**
 * @class TargetState
 * @brief Everything the engine knows about one output channel.
 *
 * `mutex` guards every mutable member below it. `available` is signalled on
 * push so an idle worker wakes without waiting out its poll interval.
 */
class TargetState {
public:
    static constexpr size_t HISTORY_CAPACITY = 100;

    TargetState(TargetId target_id, const TargetConfig& cfg, size_t tracker_capacity);

    TargetState(const TargetState&) = delete;
    TargetState& operator=(const TargetState&) = delete;

    const TargetId id;
    const std::string name;

    mutable std::mutex mutex;
    std::condition_variable available;

    PriorityQueueSet queues;
    TargetMetrics metrics;
    RateLimitSettings limits;
    RateTracker tracker;
    CircuitState circuit;
    uint64_t wake_seq = 0;          // bumped on every push and wake-up

    bool isRateLimited(uint64_t now_ms) const {
        return now_ms < metrics.rate_limit_until_ms;
    }

    // Pushes a sample (seconds) into the ring and recomputes the average
    void recordProcessingTime(double seconds);

    size_t historySize() const { return history_.size(); }

private:
    std::deque<double> history_;
    double history_sum_ = 0.0;
};

/**
 * @brief Copy of one target's state taken under its lock
 */
struct TargetSnapshot {
    TargetId id = 0;
    std::string name;
    size_t queued = 0;
    std::array<size_t, PRIORITY_CLASSES> queued_by_priority{};
    TargetMetrics metrics;
    RateLimitSettings limits;
    size_t recent_sends = 0;
    bool rate_limited = false;
    bool circuit_open = false;
    uint64_t circuit_opens = 0;

    size_t queuedAt(MessagePriority p) const { return queued_by_priority[priorityIndex(p)]; }
};

// ============================================================================
// REGISTRY
// ============================================================================

/**
 * @class TargetRegistry
 * @brief Owns the TargetState of every configured target.
 *
 * Targets are created once at construction with dense ids 0..N-1 and never
 * added or removed afterwards, so references stay valid for the registry's
 * lifetime.
 */
class TargetRegistry {
public:
    TargetRegistry(const std::vector<TargetConfig>& targets, const RateWindowConfig& window);

    size_t size() const { return targets_.size(); }
    bool contains(TargetId id) const { return id < targets_.size(); }

    TargetState& at(TargetId id) { return *targets_.at(id); }
    const TargetState& at(TargetId id) const { return *targets_.at(id); }

    const RateLimiter& rateLimiter() const { return limiter_; }

    TargetSnapshot snapshot(TargetId id, uint64_t now_ms) const;

    /**
     * @brief Snapshot of all targets, each taken under its own lock in turn
     *
     * Never holds more than one target lock at a time. The result is not a
     * consistent cut across targets.
     */
    std::vector<TargetSnapshot> snapshots(uint64_t now_ms) const;

private:
    TargetSnapshot snapshotLocked(const TargetState& t, uint64_t now_ms) const;

    RateLimiter limiter_;
    std::vector<std::unique_ptr<TargetState>> targets_;
};

} // namespace Relay
