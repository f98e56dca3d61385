// ============================================================================
// MAINTENANCE UNIT TESTS
// ============================================================================
// Rebalancer, reaper and health monitor, driven through runOnce() with an
// explicit clock. The periodic threads are never started here.
// ============================================================================

#include <gtest/gtest.h>
#include <relay/core/maintenance/health_monitor.hpp>
#include <relay/core/maintenance/reaper.hpp>
#include <relay/core/maintenance/rebalancer.hpp>
#include "test_helpers.hpp"

using namespace Relay;
using RelayTest::DispatchHarness;
using RelayTest::makeConfig;

namespace {

TargetSnapshot snap(TargetId id, size_t queued, double success_rate = 1.0) {
    TargetSnapshot s;
    s.id = id;
    s.queued = queued;
    s.metrics.success_rate = success_rate;
    return s;
}

void fill(DispatchHarness& h, TargetId target, size_t count, uint64_t now) {
    for (size_t i = 0; i < count; ++i) {
        ASSERT_TRUE(h.submitTo(target, target * 1000 + i, now));
    }
}

} // namespace

// ============================================================================
// REBALANCE PLANNING
// ============================================================================

TEST(RebalancePlan, MovesHalfTheGapCappedAtMax) {
    auto p = Rebalancer::plan({snap(0, 50), snap(1, 5)}, 10, 20);
    ASSERT_TRUE(p.act);
    EXPECT_EQ(p.from, 0u);
    EXPECT_EQ(p.to, 1u);
    EXPECT_EQ(p.gap, 45u);
    EXPECT_EQ(p.to_move, 20u);

    auto small = Rebalancer::plan({snap(0, 16), snap(1, 2)}, 10, 20);
    ASSERT_TRUE(small.act);
    EXPECT_EQ(small.to_move, 7u);
}

TEST(RebalancePlan, SmallGapIsLeftAlone) {
    auto p = Rebalancer::plan({snap(0, 14), snap(1, 5)}, 10, 20);
    EXPECT_FALSE(p.act);
    EXPECT_EQ(p.gap, 9u);
}

TEST(RebalancePlan, UnhealthyTargetsTakeNoPart) {
    auto limited = snap(0, 5);
    limited.rate_limited = true;
    auto failing = snap(1, 0);
    failing.metrics.consecutive_failures = 3;

    auto p = Rebalancer::plan({limited, failing, snap(2, 60)}, 10, 20);
    EXPECT_FALSE(p.act);

    // Two failures are still tolerated
    failing.metrics.consecutive_failures = 2;
    p = Rebalancer::plan({limited, failing, snap(2, 60)}, 10, 20);
    ASSERT_TRUE(p.act);
    EXPECT_EQ(p.from, 2u);
    EXPECT_EQ(p.to, 1u);
}

TEST(RebalancePlan, LowSuccessRateWeighsLoad) {
    // 20 queued at 0.5 success counts as 40, so target 1 is the overloaded one
    auto p = Rebalancer::plan({snap(0, 30), snap(1, 20, 0.5), snap(2, 5)}, 10, 20);
    ASSERT_TRUE(p.act);
    EXPECT_EQ(p.from, 1u);
    EXPECT_EQ(p.to, 2u);
    EXPECT_EQ(p.gap, 15u);
}

// ============================================================================
// REBALANCER
// ============================================================================

TEST(Rebalancer, OnePassMovesTwentyItems) {
    DispatchHarness h(makeConfig(2));
    fill(h, 0, 50, 1000);
    fill(h, 1, 5, 1000);

    Rebalancer rebalancer(h.queues, h.config.maintenance);
    EXPECT_EQ(rebalancer.runOnce(2000), 20u);
    EXPECT_EQ(h.queued(0), 30u);
    EXPECT_EQ(h.queued(1), 25u);
    EXPECT_EQ(h.queues.totals().rebalanced, 20u);
    EXPECT_EQ(h.queues.pending(), 55u);

    // Moved items now belong to the new target
    auto r = h.queues.dequeue(1, 2000);
    ASSERT_EQ(r.status, DequeueStatus::ITEM);
    EXPECT_EQ(r.item->target, 1u);
}

TEST(Rebalancer, SkipsWhenAdaptiveOffUnlessForced) {
    DispatchHarness h(makeConfig(2));
    fill(h, 0, 30, 1000);
    h.queues.setAdaptive(false);

    Rebalancer rebalancer(h.queues, h.config.maintenance);
    EXPECT_EQ(rebalancer.runOnce(2000), 0u);
    EXPECT_EQ(h.queued(0), 30u);

    EXPECT_EQ(rebalancer.runOnce(2000, true), 15u);
    EXPECT_EQ(h.queued(1), 15u);
}

TEST(Rebalancer, RateLimitedTargetReceivesNothing) {
    DispatchHarness h(makeConfig(2));
    fill(h, 0, 40, 1000);
    h.withTarget(1, [](TargetState& t) { t.metrics.rate_limit_until_ms = 10000; });

    Rebalancer rebalancer(h.queues, h.config.maintenance);
    EXPECT_EQ(rebalancer.runOnce(2000), 0u);
    EXPECT_EQ(h.queued(1), 0u);
}

// ============================================================================
// REAPER
// ============================================================================

TEST(Reaper, RemovesOnlyOldExhaustedItems) {
    auto config = makeConfig(1);
    config.maintenance.retention_s = 300;
    DispatchHarness h(config);

    auto exhausted_old = RelayTest::makeItem(1, MessagePriority::NORMAL, 0, 1);
    exhausted_old->retry_count = 3;
    auto exhausted_new = RelayTest::makeItem(2, MessagePriority::NORMAL, 200000, 2);
    exhausted_new->retry_count = 3;
    auto retries_left = RelayTest::makeItem(3, MessagePriority::LOW, 0, 3);
    retries_left->retry_count = 1;
    h.withTarget(0, [&](TargetState& t) {
        t.queues.push(exhausted_old);
        t.queues.push(exhausted_new);
        t.queues.push(retries_left);
    });

    Reaper reaper(h.queues, h.config.maintenance);
    EXPECT_EQ(reaper.runOnce(301000), 1u);
    EXPECT_EQ(h.queued(0), 2u);
    EXPECT_EQ(h.queues.totals().expired, 1u);
    EXPECT_EQ(h.dead_letters.totalFor(DeadLetterReason::REAPED), 1u);

    auto recent = h.dead_letters.recent(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].item->payload.id, 1u);
}

TEST(Reaper, VisitsOneTargetPerPass) {
    DispatchHarness h(makeConfig(3));
    for (TargetId id = 0; id < 3; ++id) {
        auto item = RelayTest::makeItem(id, MessagePriority::NORMAL, 0, id);
        item->retry_count = 3;
        h.withTarget(id, [&](TargetState& t) { t.queues.push(item); });
    }

    Reaper reaper(h.queues, h.config.maintenance);
    EXPECT_EQ(reaper.nextTarget(), 0u);
    EXPECT_EQ(reaper.runOnce(400000), 1u);
    EXPECT_EQ(h.queued(0), 0u);
    EXPECT_EQ(h.queued(1), 1u);
    EXPECT_EQ(h.queued(2), 1u);

    EXPECT_EQ(reaper.runOnce(400000), 1u);
    EXPECT_EQ(reaper.runOnce(400000), 1u);
    EXPECT_EQ(reaper.nextTarget(), 0u);
    EXPECT_EQ(reaper.runOnce(400000), 0u);
}

// ============================================================================
// HEALTH MONITOR
// ============================================================================

TEST(HealthMonitor, DecaysFailuresOutsideCooldown) {
    DispatchHarness h(makeConfig(2));
    h.withTarget(0, [](TargetState& t) { t.metrics.consecutive_failures = 2; });
    h.withTarget(1, [](TargetState& t) {
        t.metrics.consecutive_failures = 2;
        t.metrics.rate_limit_until_ms = 5000;
    });

    HealthMonitor monitor(h.queues, std::chrono::milliseconds(1000));
    auto adj = monitor.runOnce(1000);
    EXPECT_EQ(adj.decayed, 1u);
    EXPECT_EQ(h.registry.snapshot(0, 1000).metrics.consecutive_failures, 1u);
    EXPECT_EQ(h.registry.snapshot(1, 1000).metrics.consecutive_failures, 2u);
}

TEST(HealthMonitor, AdaptsLimitsFromSuccessRate) {
    DispatchHarness h(makeConfig(2));
    h.withTarget(0, [](TargetState& t) {
        t.metrics.success_rate = 0.7;
        t.metrics.consecutive_failures = 3;
    });

    HealthMonitor monitor(h.queues, std::chrono::milliseconds(1000));
    auto adj = monitor.runOnce(1000);
    EXPECT_EQ(adj.decreased, 1u);
    EXPECT_EQ(adj.increased, 1u);

    auto slowed = h.registry.snapshot(0, 1000);
    EXPECT_NEAR(slowed.limits.messages_per_second, 16.0, 1e-9);
    EXPECT_EQ(slowed.limits.burst_limit, 24u);
    EXPECT_DOUBLE_EQ(slowed.limits.recovery_time_s, 10.0);
    EXPECT_EQ(slowed.metrics.consecutive_failures, 2u);

    auto sped_up = h.registry.snapshot(1, 1000);
    EXPECT_NEAR(sped_up.limits.messages_per_second, 22.0, 1e-9);
    EXPECT_EQ(sped_up.limits.burst_limit, 44u);
}

TEST(HealthMonitor, LeavesLimitsAloneWhenAdaptiveOff) {
    auto config = makeConfig(2);
    config.targets[1].adaptive = false;
    DispatchHarness h(config);

    HealthMonitor monitor(h.queues, std::chrono::milliseconds(1000));
    auto adj = monitor.runOnce(1000);
    EXPECT_EQ(adj.increased, 1u);
    EXPECT_DOUBLE_EQ(h.registry.snapshot(1, 1000).limits.messages_per_second, 20.0);

    h.queues.setAdaptive(false);
    adj = monitor.runOnce(2000);
    EXPECT_EQ(adj.increased, 0u);
    EXPECT_EQ(adj.decreased, 0u);
}
