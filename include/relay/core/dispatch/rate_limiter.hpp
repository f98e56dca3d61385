#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>

namespace Relay {

class TargetState;

/**
 * @class RateTracker
 * @brief Bounded, time-ordered window of recent send timestamps
 *
 * Holds at most `capacity` entries; the oldest is evicted first. Guarded by
 * the owning target's lock.
 */
class RateTracker {
public:
    explicit RateTracker(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    void record(uint64_t now_ms);

    // Drop entries older than `window_ms` relative to now
    void prune(uint64_t now_ms, uint64_t window_ms);

    // Entries inside the window, without mutating
    size_t countSince(uint64_t since_ms) const;

    size_t size() const { return stamps_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { stamps_.clear(); }

private:
    size_t capacity_;
    std::deque<uint64_t> stamps_;
};

// Live rate-limit settings of one target; adapted at runtime
struct RateLimitSettings {
    double messages_per_second = 20.0;
    uint32_t burst_limit = 40;
    double recovery_time_s = 5.0;
    bool adaptive = true;

    static RateLimitSettings from(const TargetConfig& cfg) {
        return RateLimitSettings{cfg.messages_per_second, cfg.burst_limit,
                                 cfg.recovery_time_s, cfg.adaptive};
    }
};

enum class AdaptAction : uint8_t {
    NONE = 0,
    INCREASED = 1,
    DECREASED = 2
};

/**
 * @class RateLimiter
 * @brief Sliding-window admission and adaptive limit adjustment.
 *
 * All methods expect the caller to hold the target's lock.
 */
class RateLimiter {
public:
    // Adaptive bounds
    static constexpr double MPS_CEILING = 30.0;
    static constexpr double MPS_FLOOR = 5.0;
    static constexpr uint32_t BURST_CEILING = 60;
    static constexpr uint32_t BURST_FLOOR = 10;
    static constexpr double RECOVERY_FLOOR_S = 2.0;
    static constexpr double RECOVERY_CEILING_S = 30.0;

    explicit RateLimiter(const RateWindowConfig& config) : config_(config) {}

    /**
     * @brief Admission check for one send
     *
     * Returns false while the target is cooling down. If the window already
     * holds burst_limit sends, starts a cooldown of recovery_time and returns
     * false. Does not record the send; call record() once an item is taken.
     */
    bool tryAcquire(TargetState& target, uint64_t now_ms) const;

    void record(TargetState& target, uint64_t now_ms) const;

    // Sends inside the window ending at now_ms
    size_t recentCount(const TargetState& target, uint64_t now_ms) const;

    /**
     * @brief One adaptive adjustment step from the target's current health
     *
     * success > 0.95 with no consecutive failures raises the rate; success
     * < 0.8 or more than two consecutive failures lowers it.
     */
    static AdaptAction adapt(RateLimitSettings& limits, double success_rate,
                             uint32_t consecutive_failures);

    uint64_t windowMs() const { return config_.window_ms; }

private:
    RateWindowConfig config_;
};

const char* toString(AdaptAction action);

} // namespace Relay
