#pragma once

#include <relay/core/control/dispatch_state.hpp>
#include <relay/core/dispatch/dead_letter_queue.hpp>
#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/selection_engine.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <relay/core/dispatch/types.hpp>
#include <relay/core/resilience/circuit_breaker.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace Relay {

enum class DequeueStatus : uint8_t {
    ITEM = 0,
    EMPTY = 1,          // nothing due; see next_due_ms
    RATE_LIMITED = 2    // cooling down or burst limit reached
};

const char* toString(DequeueStatus status);

struct DequeueResult {
    DequeueStatus status = DequeueStatus::EMPTY;
    ItemPtr item;
    uint64_t next_due_ms = 0;   // earliest backed-off item still waiting, 0 if none
    uint64_t wake_seq = 0;      // target's wake sequence seen by this call
};

enum class RequeueOutcome : uint8_t {
    REQUEUED = 0,
    DEAD_LETTERED = 1
};

// Cumulative counters plus current pending count
struct QueueTotals {
    uint64_t enqueued = 0;
    uint64_t processed = 0;     // delivered successfully
    uint64_t failed = 0;        // retries exhausted
    uint64_t rejected = 0;      // queue full or draining
    uint64_t expired = 0;       // aged out at dequeue or reaped
    uint64_t requeued = 0;
    uint64_t rebalanced = 0;
    uint64_t pending = 0;       // queued or in flight
};

/**
 * @class QueueManager
 * @brief Owns the life of a queued item from submit() to ack or dead letter.
 *
 * Item flow:
 *   submit() -> target heap -> dequeue() -> [send] -> ack()
 *                                               \-> requeueFailed() -> other target heap
 *                                                                   -> dead letter
 *                                               \-> holdForOpenCircuit() -> usable or own heap
 *
 * Every heap and metric access happens under that target's lock; no call
 * here holds two target locks at once.
 */
class QueueManager {
public:
    QueueManager(const DispatchConfig& config,
                 TargetRegistry& registry,
                 SelectionEngine& selection,
                 const CircuitBreaker& breaker,
                 DeadLetterQueue& dead_letters,
                 const DispatchStateManager& state);

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    /**
     * @brief Classify, pick a target and enqueue
     * @return false if the aggregate cap is reached or the engine is draining
     */
    bool submit(Payload payload, const SubmitHints& hints, uint64_t now_ms);

    /**
     * @brief Take the next due item for a target
     *
     * Scans URGENT to LOW. Items past max age or with spent retries are
     * discarded on the way. An item is handed out only if the rate limiter
     * admits it; otherwise it stays queued and RATE_LIMITED is returned.
     */
    DequeueResult dequeue(TargetId target, uint64_t now_ms);

    /**
     * @brief Record the outcome of one delivery on the item's target
     *
     * Always releases the in-flight slot. CIRCUIT_OPEN, CANCELLED and
     * RATE_LIMITED leave the health metrics untouched: the first two never
     * reached the remote side and the last one was deferred by it.
     */
    void ack(const ItemPtr& item, bool success, double processing_s, ErrorKind kind, uint64_t now_ms);

    /**
     * @brief Retry a failed item on another target, or give up on it
     *
     * Call after ack(). Bumps retry_count, backs off the timestamp and
     * demotes the priority unless the failure was an explicit rate limit.
     */
    RequeueOutcome requeueFailed(const ItemPtr& item, ErrorKind kind, uint64_t now_ms);

    /**
     * @brief Park an item whose send was skipped by an open circuit
     *
     * The retry budget is not touched. The item moves to a target the smart
     * selector considers usable, or else waits on its own target until the
     * circuit admits sends again.
     * @return the target now holding the item
     */
    TargetId holdForOpenCircuit(const ItemPtr& item, uint64_t now_ms);

    // Put an untouched item back on its own target (worker shutdown)
    void restore(const ItemPtr& item);

    // Block until something is pushed after `seen_wake_seq` or `max_wait` passes
    void waitForWork(TargetId target, uint64_t seen_wake_seq, std::chrono::milliseconds max_wait);

    // Locks and notifies every target so idle workers re-check their flags
    void wakeAll();

    size_t clearQueues();

    // Used by the rebalancer and reaper
    void recordRebalanced(size_t count);
    void discard(const std::vector<ItemPtr>& items, DeadLetterReason reason, uint64_t now_ms);

    QueueTotals totals() const;
    size_t pending() const { return pending_.load(std::memory_order_acquire); }
    size_t capacity() const { return config_.max_queue_size; }

    void setAdaptive(bool enabled) { adaptive_.store(enabled, std::memory_order_release); }
    bool adaptiveEnabled() const { return adaptive_.load(std::memory_order_acquire); }

    TargetRegistry& registry() { return registry_; }
    const TargetRegistry& registry() const { return registry_; }
    SelectionEngine& selection() { return selection_; }

    // Backoff in ms for the given retry count (>= 1)
    uint64_t requeueDelayMs(uint32_t retry_count) const;

private:
    TargetId chooseTarget(const SubmitHints& hints, uint64_t now_ms);
    std::vector<TargetId> retryExclusions(TargetId failing, uint32_t retry_count, uint64_t now_ms) const;
    void pushTo(TargetId target, const ItemPtr& item);
    void releasePending(size_t count);

    QueueConfig config_;
    TargetRegistry& registry_;
    SelectionEngine& selection_;
    const CircuitBreaker& breaker_;
    DeadLetterQueue& dead_letters_;
    const DispatchStateManager& state_;

    std::atomic<bool> adaptive_;
    std::atomic<size_t> pending_{0};
    std::atomic<uint64_t> sequence_{0};

    std::atomic<uint64_t> enqueued_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> expired_{0};
    std::atomic<uint64_t> requeued_{0};
    std::atomic<uint64_t> rebalanced_{0};
};

} // namespace Relay
