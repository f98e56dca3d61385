// ============================================================================
// RATE LIMITER UNIT TESTS
// ============================================================================
// Sliding-window admission at dequeue and adaptive limit adjustment
// ============================================================================

#include <gtest/gtest.h>
#include <relay/core/dispatch/rate_limiter.hpp>
#include "test_helpers.hpp"

using namespace Relay;
using RelayTest::DispatchHarness;
using RelayTest::makeConfig;

namespace {

DispatchConfig burstConfig(uint32_t burst, uint32_t window_ms) {
    auto config = makeConfig(1);
    config.targets[0].burst_limit = burst;
    config.targets[0].recovery_time_s = 5.0;
    config.rate.window_ms = window_ms;
    return config;
}

} // namespace

// ============================================================================
// WINDOW ADMISSION
// ============================================================================

TEST(RateLimiter, BurstOfFifteenAdmitsTen) {
    DispatchHarness h(burstConfig(10, 1000));
    const uint64_t now = 50000;
    for (uint64_t i = 0; i < 15; ++i) {
        ASSERT_TRUE(h.submitTo(0, i, now));
    }

    size_t proceeded = 0;
    size_t deferred = 0;
    for (int i = 0; i < 15; ++i) {
        auto r = h.queues.dequeue(0, now);
        if (r.status == DequeueStatus::ITEM) proceeded++;
        if (r.status == DequeueStatus::RATE_LIMITED) deferred++;
    }

    EXPECT_EQ(proceeded, 10u);
    EXPECT_EQ(deferred, 5u);
    EXPECT_EQ(h.queued(0), 5u);  // deferred, not failed
    EXPECT_EQ(h.queues.totals().failed, 0u);

    auto snap = h.registry.snapshot(0, now);
    EXPECT_TRUE(snap.rate_limited);
    EXPECT_EQ(snap.metrics.rate_limit_until_ms, now + 5000);
    EXPECT_EQ(snap.metrics.rate_limit_hits, 1u);
}

TEST(RateLimiter, CooldownAndWindowExpiryRestoreAdmission) {
    DispatchHarness h(burstConfig(2, 1000));
    const uint64_t now = 10000;
    for (uint64_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(h.submitTo(0, i, now));
    }

    EXPECT_EQ(h.queues.dequeue(0, now).status, DequeueStatus::ITEM);
    EXPECT_EQ(h.queues.dequeue(0, now).status, DequeueStatus::ITEM);
    EXPECT_EQ(h.queues.dequeue(0, now).status, DequeueStatus::RATE_LIMITED);

    // Still cooling down
    EXPECT_EQ(h.queues.dequeue(0, now + 4999).status, DequeueStatus::RATE_LIMITED);

    // Cooldown over and the old sends have left the window
    EXPECT_EQ(h.queues.dequeue(0, now + 5000).status, DequeueStatus::ITEM);
}

TEST(RateLimiter, EmptyQueueDoesNotStartCooldown) {
    DispatchHarness h(burstConfig(1, 1000));
    ASSERT_TRUE(h.submitTo(0, 1, 1000));
    EXPECT_EQ(h.queues.dequeue(0, 1000).status, DequeueStatus::ITEM);
    EXPECT_EQ(h.queues.dequeue(0, 1000).status, DequeueStatus::EMPTY);
    EXPECT_FALSE(h.registry.snapshot(0, 1000).rate_limited);
}

TEST(RateTracker, EvictsOldestAtCapacity) {
    RateTracker tracker(3);
    tracker.record(1);
    tracker.record(2);
    tracker.record(3);
    tracker.record(4);
    EXPECT_EQ(tracker.size(), 3u);
    EXPECT_EQ(tracker.countSince(2), 3u);
    EXPECT_EQ(tracker.countSince(4), 1u);

    tracker.prune(1004, 1000);
    EXPECT_EQ(tracker.size(), 1u);
}

// ============================================================================
// ADAPTIVE ADJUSTMENT
// ============================================================================

TEST(RateLimiterAdapt, HealthyTargetSpeedsUp) {
    RateLimitSettings limits{20.0, 40, 5.0, true};
    EXPECT_EQ(RateLimiter::adapt(limits, 0.99, 0), AdaptAction::INCREASED);
    EXPECT_NEAR(limits.messages_per_second, 22.0, 1e-9);
    EXPECT_EQ(limits.burst_limit, 44u);
    EXPECT_DOUBLE_EQ(limits.recovery_time_s, 4.0);
}

TEST(RateLimiterAdapt, IncreaseIsCapped) {
    RateLimitSettings limits{29.0, 58, 2.0, true};
    RateLimiter::adapt(limits, 1.0, 0);
    EXPECT_DOUBLE_EQ(limits.messages_per_second, RateLimiter::MPS_CEILING);
    EXPECT_EQ(limits.burst_limit, RateLimiter::BURST_CEILING);
    EXPECT_DOUBLE_EQ(limits.recovery_time_s, RateLimiter::RECOVERY_FLOOR_S);
}

TEST(RateLimiterAdapt, UnhealthyTargetSlowsDown) {
    RateLimitSettings limits{20.0, 40, 5.0, true};
    EXPECT_EQ(RateLimiter::adapt(limits, 0.7, 0), AdaptAction::DECREASED);
    EXPECT_NEAR(limits.messages_per_second, 16.0, 1e-9);
    EXPECT_EQ(limits.burst_limit, 24u);
    EXPECT_DOUBLE_EQ(limits.recovery_time_s, 10.0);
}

TEST(RateLimiterAdapt, ConsecutiveFailuresSlowDownEvenWithGoodRate) {
    RateLimitSettings limits{6.0, 12, 28.0, true};
    EXPECT_EQ(RateLimiter::adapt(limits, 0.99, 3), AdaptAction::DECREASED);
    EXPECT_DOUBLE_EQ(limits.messages_per_second, RateLimiter::MPS_FLOOR);
    EXPECT_EQ(limits.burst_limit, RateLimiter::BURST_FLOOR);
    EXPECT_DOUBLE_EQ(limits.recovery_time_s, RateLimiter::RECOVERY_CEILING_S);
}

TEST(RateLimiterAdapt, MiddleBandLeavesLimitsAlone) {
    RateLimitSettings limits{20.0, 40, 5.0, true};
    EXPECT_EQ(RateLimiter::adapt(limits, 0.9, 1), AdaptAction::NONE);
    EXPECT_DOUBLE_EQ(limits.messages_per_second, 20.0);
    EXPECT_EQ(limits.burst_limit, 40u);
}
