#pragma once

#include <relay/core/control/dispatch_state.hpp>
#include <relay/core/dispatch/dead_letter_queue.hpp>
#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/dispatch_stats.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/dispatch/selection_engine.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <relay/core/maintenance/health_monitor.hpp>
#include <relay/core/maintenance/reaper.hpp>
#include <relay/core/maintenance/rebalancer.hpp>
#include <relay/core/metrics/histogram.hpp>
#include <relay/core/resilience/circuit_breaker.hpp>
#include <relay/core/resilience/resilience_layer.hpp>
#include <relay/core/utils/thread_pool.hpp>
#include <relay/core/workers/target_worker.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace Relay {

/**
 * @class DispatchEngine
 * @brief Public face of the relay: submit messages, the engine delivers them.
 *
 * Threads once started: one TargetWorker per target, the health monitor,
 * the rebalancer, the reaper and the send pool. submit() and stats() are
 * safe from any thread and never throw. Delivery outcomes are acked by
 * the owning worker through QueueManager::ack(), never from outside.
 *
 * Shutdown order: background tasks, pending sleeps cancelled, workers
 * joined, send pool drained.
 */
class DispatchEngine {
public:
    DispatchEngine(const DispatchConfig& config, SendFunction send, uint64_t seed = 0);
    ~DispatchEngine() noexcept;

    DispatchEngine(const DispatchEngine&) = delete;
    DispatchEngine& operator=(const DispatchEngine&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(std::memory_order_acquire); }

    /**
     * @return false when the queue is full or the engine is draining
     */
    bool submit(Payload payload, const SubmitHints& hints = {});

    void configure(SelectionStrategy strategy, bool adaptive_enabled);

    DispatchStats stats() const;

    void pause();
    void resume();
    void drain();

    /**
     * @brief Wait until nothing is queued or in flight
     * @return false on timeout
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    size_t clearQueues();
    size_t rebalanceNow();
    std::vector<DeadLetter> deadLetters(size_t max_count = 100) const;

    size_t targetCount() const { return registry_.size(); }
    DispatchState state() const { return state_.getState(); }

private:
    DispatchConfig config_;
    DispatchStateManager state_;
    TargetRegistry registry_;
    SelectionEngine selection_;
    CircuitBreaker breaker_;
    DeadLetterQueue dead_letters_;
    QueueManager queues_;
    ThreadPool send_pool_;
    ResilienceLayer resilience_;
    LatencyHistogram latency_;

    std::vector<std::unique_ptr<TargetWorker>> workers_;
    std::unique_ptr<HealthMonitor> monitor_;
    std::unique_ptr<Rebalancer> rebalancer_;
    std::unique_ptr<Reaper> reaper_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    uint64_t started_ms_;
};

} // namespace Relay
