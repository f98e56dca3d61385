// ============================================================================
// DISPATCH ENGINE INTEGRATION TESTS
// ============================================================================
// Full engine with worker threads and a scripted send function. Delays are
// shrunk to milliseconds; maintenance intervals are long enough that the
// periodic tasks never fire during a test.
// ============================================================================

#include <gtest/gtest.h>
#include <relay/core/dispatch/dispatch_engine.hpp>
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace Relay;

namespace {

DispatchConfig fastConfig(size_t targets) {
    auto config = RelayTest::makeConfig(targets);
    for (auto& t : config.targets) {
        t.burst_limit = 500;
    }
    config.rate.tracker_capacity = 1000;

    config.queue.requeue_delay_unit_ms = 1;

    config.resilience.max_attempts = 1;
    config.resilience.base_delay_ms = 1;
    config.resilience.jitter_max_ms = 0;
    config.resilience.send_timeout_ms = 1000;
    config.resilience.circuit_threshold = 100;

    config.workers.idle_poll_ms = 5;
    config.workers.rate_limited_pause_ms = 5;
    config.workers.restart_pause_ms = 1;

    config.maintenance.monitor_interval_ms = 600000;
    config.maintenance.rebalance_interval_ms = 600000;
    config.maintenance.reaper_interval_ms = 600000;
    return config;
}

struct ScriptedSender {
    std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
    std::shared_ptr<std::atomic<bool>> failing = std::make_shared<std::atomic<bool>>(false);

    SendFunction fn() const {
        auto c = calls;
        auto f = failing;
        return [c, f](TargetId, const Payload&) {
            c->fetch_add(1);
            return f->load() ? SendResult::failure(ErrorKind::NETWORK, "unreachable")
                             : SendResult::success();
        };
    }
};

Payload message(uint64_t id) {
    Payload p;
    p.id = id;
    return p;
}

const auto IDLE_TIMEOUT = std::chrono::seconds(10);

} // namespace

// ============================================================================
// DELIVERY
// ============================================================================

TEST(DispatchEngine, DeliversEverySubmittedMessage) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.start();

    for (uint64_t id = 1; id <= 20; ++id) {
        ASSERT_TRUE(engine.submit(message(id)));
    }
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    engine.stop();

    EXPECT_EQ(sender.calls->load(), 20);
    auto stats = engine.stats();
    EXPECT_EQ(stats.totals.enqueued, 20u);
    EXPECT_EQ(stats.totals.processed, 20u);
    EXPECT_EQ(stats.totals.pending, 0u);
    EXPECT_DOUBLE_EQ(stats.success_rate_pct, 100.0);
    EXPECT_EQ(stats.dead_letters, 0u);

    uint64_t handled = 0;
    for (const auto& t : stats.targets) {
        handled += t.worker.items_handled;
        EXPECT_EQ(t.target.metrics.current_load, 0u);
    }
    EXPECT_EQ(handled, 20u);
}

TEST(DispatchEngine, ExhaustedMessageEndsInDeadLetters) {
    ScriptedSender sender;
    sender.failing->store(true);
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.start();

    ASSERT_TRUE(engine.submit(message(99)));
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    engine.stop();

    // One delivery per retry budget step, one attempt each
    EXPECT_EQ(sender.calls->load(), 3);

    auto stats = engine.stats();
    EXPECT_EQ(stats.totals.failed, 1u);
    EXPECT_EQ(stats.totals.requeued, 2u);
    EXPECT_EQ(stats.totals.processed, 0u);

    auto dead = engine.deadLetters(10);
    ASSERT_EQ(dead.size(), 1u);
    EXPECT_EQ(dead[0].item->payload.id, 99u);
    EXPECT_EQ(dead[0].reason, DeadLetterReason::RETRIES_EXHAUSTED);
    EXPECT_EQ(dead[0].item->retry_count, 3u);
}

TEST(DispatchEngine, OpenCircuitHoldsMessagesUntilCooldownEnds) {
    auto config = fastConfig(1);
    config.resilience.circuit_threshold = 1;
    config.resilience.circuit_timeout_s = 1;

    auto calls = std::make_shared<std::atomic<int>>(0);
    SendFunction send = [calls](TargetId, const Payload&) {
        return calls->fetch_add(1) == 0 ? SendResult::failure(ErrorKind::NETWORK, "refused")
                                        : SendResult::success();
    };
    DispatchEngine engine(config, send, 1);
    engine.start();

    for (uint64_t id = 1; id <= 3; ++id) {
        ASSERT_TRUE(engine.submit(message(id)));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    // One real failure opened the circuit; the rest wait it out
    auto cooling = engine.stats();
    EXPECT_EQ(calls->load(), 1);
    EXPECT_EQ(cooling.totals.failed, 0u);
    EXPECT_EQ(cooling.totals.pending, 3u);
    EXPECT_EQ(cooling.dead_letters, 0u);

    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    engine.stop();

    auto stats = engine.stats();
    EXPECT_EQ(calls->load(), 4);
    EXPECT_EQ(stats.totals.processed, 3u);
    EXPECT_EQ(stats.totals.failed, 0u);
    EXPECT_EQ(stats.dead_letters, 0u);
    EXPECT_EQ(stats.targets[0].target.circuit_opens, 1u);
}

// ============================================================================
// CONTROL
// ============================================================================

TEST(DispatchEngine, PauseHoldsDeliveriesUntilResume) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.pause();
    engine.start();

    for (uint64_t id = 1; id <= 5; ++id) {
        ASSERT_TRUE(engine.submit(message(id)));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(sender.calls->load(), 0);
    EXPECT_EQ(engine.stats().totals.pending, 5u);

    engine.resume();
    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    EXPECT_EQ(sender.calls->load(), 5);
    engine.stop();
}

TEST(DispatchEngine, DrainRejectsNewSubmissions) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.start();

    for (uint64_t id = 1; id <= 3; ++id) {
        ASSERT_TRUE(engine.submit(message(id)));
    }
    engine.drain();
    EXPECT_EQ(engine.state(), DispatchState::DRAINING);
    EXPECT_FALSE(engine.submit(message(4)));

    ASSERT_TRUE(engine.waitUntilIdle(IDLE_TIMEOUT));
    engine.stop();

    auto stats = engine.stats();
    EXPECT_EQ(stats.totals.processed, 3u);
    EXPECT_EQ(stats.totals.rejected, 1u);
}

TEST(DispatchEngine, QueueCapRejectsOverflow) {
    auto config = fastConfig(1);
    config.queue.max_queue_size = 3;
    ScriptedSender sender;
    DispatchEngine engine(config, sender.fn(), 1);

    for (uint64_t id = 1; id <= 3; ++id) {
        EXPECT_TRUE(engine.submit(message(id)));
    }
    EXPECT_FALSE(engine.submit(message(4)));
    EXPECT_EQ(engine.stats().totals.rejected, 1u);
}

TEST(DispatchEngine, ClearQueuesDropsEverythingQueued) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);

    for (uint64_t id = 1; id <= 10; ++id) {
        ASSERT_TRUE(engine.submit(message(id)));
    }
    EXPECT_EQ(engine.clearQueues(), 10u);
    EXPECT_EQ(engine.stats().totals.pending, 0u);
    EXPECT_TRUE(engine.waitUntilIdle(std::chrono::milliseconds(10)));
}

TEST(DispatchEngine, ManualRebalanceRunsEvenWhenAdaptiveOff) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.configure(SelectionStrategy::ROUND_ROBIN, false);

    SubmitHints hints;
    hints.preferred_target = 0;
    for (uint64_t id = 1; id <= 30; ++id) {
        ASSERT_TRUE(engine.submit(message(id), hints));
    }
    EXPECT_EQ(engine.rebalanceNow(), 15u);

    auto stats = engine.stats();
    EXPECT_EQ(stats.targets[0].target.queued, 15u);
    EXPECT_EQ(stats.targets[1].target.queued, 15u);
    EXPECT_EQ(stats.totals.rebalanced, 15u);
}

// ============================================================================
// STATS & LIFECYCLE
// ============================================================================

TEST(DispatchEngine, StatsReflectConfiguration) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(3), sender.fn(), 1);

    auto stats = engine.stats();
    ASSERT_EQ(stats.targets.size(), 3u);
    EXPECT_EQ(stats.targets[2].target.name, "target-2");
    EXPECT_EQ(stats.strategy, SelectionStrategy::SMART);
    EXPECT_TRUE(stats.adaptive_enabled);
    EXPECT_EQ(stats.state, DispatchState::RUNNING);

    engine.configure(SelectionStrategy::LEAST_LOADED, false);
    stats = engine.stats();
    EXPECT_EQ(stats.strategy, SelectionStrategy::LEAST_LOADED);
    EXPECT_FALSE(stats.adaptive_enabled);
}

TEST(DispatchEngine, StopIsIdempotentAndFinal) {
    ScriptedSender sender;
    DispatchEngine engine(fastConfig(2), sender.fn(), 1);
    engine.start();
    EXPECT_TRUE(engine.isRunning());

    engine.stop();
    engine.stop();
    EXPECT_FALSE(engine.isRunning());

    engine.start();
    EXPECT_FALSE(engine.isRunning());
}
