#include <relay/core/dispatch/rate_limiter.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace Relay {

// ============================================================================
// RateTracker
// ============================================================================

void RateTracker::record(uint64_t now_ms) {
    if (stamps_.size() >= capacity_) {
        stamps_.pop_front();
    }
    stamps_.push_back(now_ms);
}

void RateTracker::prune(uint64_t now_ms, uint64_t window_ms) {
    const uint64_t cutoff = now_ms > window_ms ? now_ms - window_ms : 0;
    while (!stamps_.empty() && stamps_.front() < cutoff) {
        stamps_.pop_front();
    }
}

size_t RateTracker::countSince(uint64_t since_ms) const {
    auto first = std::lower_bound(stamps_.begin(), stamps_.end(), since_ms);
    return static_cast<size_t>(std::distance(first, stamps_.end()));
}

// ============================================================================
// RateLimiter
// ============================================================================

bool RateLimiter::tryAcquire(TargetState& target, uint64_t now_ms) const {
    auto& m = target.metrics;
    if (now_ms < m.rate_limit_until_ms) {
        return false;
    }

    target.tracker.prune(now_ms, config_.window_ms);
    // A burst above the tracker capacity could never be reached
    const size_t limit = std::min<size_t>(target.limits.burst_limit, target.tracker.capacity());
    if (target.tracker.size() >= limit) {
        const auto cooldown_ms = static_cast<uint64_t>(target.limits.recovery_time_s * 1000.0);
        m.rate_limit_until_ms = now_ms + cooldown_ms;
        m.rate_limit_hits++;
        spdlog::warn("[RateLimiter] {} hit burst limit ({} in {}ms), cooling down {}ms",
                     target.name, target.tracker.size(), config_.window_ms, cooldown_ms);
        return false;
    }
    return true;
}

void RateLimiter::record(TargetState& target, uint64_t now_ms) const {
    target.tracker.record(now_ms);
}

size_t RateLimiter::recentCount(const TargetState& target, uint64_t now_ms) const {
    const uint64_t since = now_ms > config_.window_ms ? now_ms - config_.window_ms : 0;
    return target.tracker.countSince(since);
}

AdaptAction RateLimiter::adapt(RateLimitSettings& limits, double success_rate,
                               uint32_t consecutive_failures) {
    if (success_rate > 0.95 && consecutive_failures == 0) {
        limits.messages_per_second = std::min(MPS_CEILING, limits.messages_per_second * 1.1);
        limits.burst_limit = std::min<uint32_t>(
            BURST_CEILING, static_cast<uint32_t>(limits.messages_per_second * 2.0));
        limits.recovery_time_s = std::max(RECOVERY_FLOOR_S, limits.recovery_time_s - 1.0);
        return AdaptAction::INCREASED;
    }
    if (success_rate < 0.8 || consecutive_failures > 2) {
        limits.messages_per_second = std::max(MPS_FLOOR, limits.messages_per_second * 0.8);
        limits.burst_limit = std::max<uint32_t>(
            BURST_FLOOR, static_cast<uint32_t>(limits.messages_per_second * 1.5));
        limits.recovery_time_s = std::min(RECOVERY_CEILING_S, limits.recovery_time_s + 5.0);
        return AdaptAction::DECREASED;
    }
    return AdaptAction::NONE;
}

const char* toString(AdaptAction action) {
    switch (action) {
        case AdaptAction::NONE:       return "NONE";
        case AdaptAction::INCREASED:  return "INCREASED";
        case AdaptAction::DECREASED:  return "DECREASED";
        default:                      return "UNKNOWN";
    }
}

} // namespace Relay
