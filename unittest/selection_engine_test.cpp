// ============================================================================
// SELECTION ENGINE UNIT TESTS
// ============================================================================
// Scoring, eligibility, tie-breaking and fallback of target selection
// ============================================================================

#include <gtest/gtest.h>
#include <relay/core/dispatch/selection_engine.hpp>
#include "test_helpers.hpp"

using namespace Relay;
using RelayTest::DispatchHarness;
using RelayTest::makeConfig;

namespace {

TargetSnapshot snap(TargetId id, size_t queued = 0) {
    TargetSnapshot s;
    s.id = id;
    s.name = "t" + std::to_string(id);
    s.queued = queued;
    return s;
}

} // namespace

// ============================================================================
// SCORING
// ============================================================================

TEST(SelectionEngine, ScoreCombinesWeightedComponents) {
    TargetSnapshot s = snap(0, 10);
    s.metrics.success_rate = 1.0;
    s.metrics.error_count = 0;
    s.metrics.avg_processing_time_s = 0.5;
    s.limits.messages_per_second = 20.0;
    s.recent_sends = 5;

    // load 80*0.4 + health 100*0.3 + speed 10*0.2 + headroom 75*0.1
    EXPECT_NEAR(SelectionEngine::score(s), 32.0 + 30.0 + 2.0 + 7.5, 1e-9);
}

TEST(SelectionEngine, ScoreComponentsClampAtZero) {
    TargetSnapshot s = snap(0, 500);
    s.metrics.success_rate = 0.0;
    s.metrics.error_count = 990;
    s.metrics.avg_processing_time_s = 0.0;
    s.limits.messages_per_second = 10.0;
    s.recent_sends = 60;

    // only the error term survives: 1000 / 1000 = 1
    EXPECT_NEAR(SelectionEngine::score(s), 0.3, 1e-9);
}

// ============================================================================
// STRATEGIES
// ============================================================================

TEST(SelectionEngine, SmartPrefersLessLoaded) {
    std::vector<TargetSnapshot> targets{snap(0, 30), snap(1, 5), snap(2, 20)};
    EXPECT_EQ(SelectionEngine::pickSmart(targets, {}), TargetId{1});
}

TEST(SelectionEngine, SmartTieGoesToLowestId) {
    std::vector<TargetSnapshot> targets{snap(0), snap(1), snap(2)};
    EXPECT_EQ(SelectionEngine::pickSmart(targets, {}), TargetId{0});
    EXPECT_EQ(SelectionEngine::pickSmart(targets, {0}), TargetId{1});
}

TEST(SelectionEngine, SmartSkipsRateLimitedAndFailing) {
    std::vector<TargetSnapshot> targets{snap(0), snap(1, 40), snap(2, 45)};
    targets[0].rate_limited = true;
    targets[1].metrics.consecutive_failures = SelectionEngine::UNHEALTHY_FAILURES;
    EXPECT_EQ(SelectionEngine::pickSmart(targets, {}), TargetId{2});

    targets[2].metrics.consecutive_failures = 5;
    EXPECT_FALSE(SelectionEngine::pickSmart(targets, {}).has_value());
}

TEST(SelectionEngine, LeastLoadedCountsInFlight) {
    std::vector<TargetSnapshot> targets{snap(0, 3), snap(1, 1), snap(2, 2)};
    targets[1].metrics.current_load = 5;
    EXPECT_EQ(SelectionEngine::pickLeastLoaded(targets, {}), TargetId{2});

    targets[2].rate_limited = true;
    EXPECT_EQ(SelectionEngine::pickLeastLoaded(targets, {}), TargetId{0});
}

TEST(SelectionEngine, OpenCircuitIsNeverScoredOrLeastLoaded) {
    std::vector<TargetSnapshot> targets{snap(0), snap(1, 30)};
    targets[0].circuit_open = true;
    EXPECT_FALSE(SelectionEngine::eligibleForSmart(targets[0]));
    EXPECT_EQ(SelectionEngine::pickSmart(targets, {}), TargetId{1});
    EXPECT_EQ(SelectionEngine::pickLeastLoaded(targets, {}), TargetId{1});

    targets[1].circuit_open = true;
    EXPECT_FALSE(SelectionEngine::pickSmart(targets, {}).has_value());
    EXPECT_FALSE(SelectionEngine::pickLeastLoaded(targets, {}).has_value());
}

TEST(SelectionEngine, FallbackIgnoresHealthButHonoursExclusions) {
    std::vector<TargetSnapshot> targets{snap(0, 9), snap(1, 3), snap(2, 1)};
    for (auto& t : targets) t.metrics.consecutive_failures = 10;

    EXPECT_EQ(SelectionEngine::fallback(targets, {}), TargetId{2});
    EXPECT_EQ(SelectionEngine::fallback(targets, {2}), TargetId{1});
    EXPECT_EQ(SelectionEngine::fallback(targets, {0, 1, 2}), TargetId{0});
}

// ============================================================================
// LIVE REGISTRY
// ============================================================================

TEST(SelectionEngine, RoundRobinCycles) {
    auto config = makeConfig(3);
    config.strategy = SelectionStrategy::ROUND_ROBIN;
    DispatchHarness h(config);

    EXPECT_EQ(h.selection.select({}, 0), TargetId{0});
    EXPECT_EQ(h.selection.select({}, 0), TargetId{1});
    EXPECT_EQ(h.selection.select({}, 0), TargetId{2});
    EXPECT_EQ(h.selection.select({}, 0), TargetId{0});
}

TEST(SelectionEngine, SmartWithUnhealthyEverywhereFallsBack) {
    DispatchHarness h(makeConfig(2));
    h.withTarget(0, [](TargetState& t) { t.metrics.consecutive_failures = 4; });
    h.withTarget(1, [](TargetState& t) { t.metrics.rate_limit_until_ms = 1000000; });

    // Both ineligible for scoring; least loaded non-excluded wins
    EXPECT_EQ(h.selection.select(SelectionStrategy::SMART, {}, 1000), TargetId{0});
    EXPECT_EQ(h.selection.select(SelectionStrategy::SMART, {0}, 1000), TargetId{1});
}

TEST(SelectionEngine, StrategyIsRuntimeConfigurable) {
    DispatchHarness h(makeConfig(2));
    EXPECT_EQ(h.selection.strategy(), SelectionStrategy::SMART);
    h.selection.setStrategy(SelectionStrategy::LEAST_LOADED);
    EXPECT_EQ(h.selection.strategy(), SelectionStrategy::LEAST_LOADED);

    EXPECT_EQ(parseSelectionStrategy("round_robin"), SelectionStrategy::ROUND_ROBIN);
    EXPECT_FALSE(parseSelectionStrategy("random").has_value());
}
