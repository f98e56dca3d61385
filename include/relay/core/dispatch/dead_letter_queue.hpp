#pragma once

#include <relay/core/dispatch/types.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace Relay {

enum class DeadLetterReason : uint8_t {
    RETRIES_EXHAUSTED = 0,  // requeue budget spent
    EXPIRED = 1,            // older than max age when reached at dequeue
    REAPED = 2              // removed by the background reaper
};

const char* toString(DeadLetterReason reason);

struct DeadLetter {
    ItemPtr item;
    DeadLetterReason reason = DeadLetterReason::RETRIES_EXHAUSTED;
    TargetId last_target = 0;
    uint64_t recorded_ms = 0;
    std::string detail;
};

/**
 * @class DeadLetterQueue
 * @brief Record of items the engine gave up on.
 *
 * Keeps the most recent `capacity` entries for inspection plus cumulative
 * counts per reason. Nothing is ever redelivered from here.
 */
class DeadLetterQueue {
public:
    explicit DeadLetterQueue(size_t capacity = 1000);
    ~DeadLetterQueue() = default;

    void push(ItemPtr item, DeadLetterReason reason, uint64_t now_ms, std::string detail = {});
    void pushBatch(const std::vector<ItemPtr>& items, DeadLetterReason reason, uint64_t now_ms);

    size_t totalDropped() const {
        return total_.load(std::memory_order_relaxed);
    }

    size_t totalFor(DeadLetterReason reason) const {
        return by_reason_[static_cast<size_t>(reason)].load(std::memory_order_relaxed);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * @brief Recent entries, newest first
     */
    std::vector<DeadLetter> recent(size_t max_count = 100) const;

    // Drops stored entries; cumulative counters are kept
    void clear();

private:
    void storeLocked(DeadLetter entry);

    const size_t capacity_;
    std::atomic<size_t> total_{0};
    std::array<std::atomic<size_t>, 3> by_reason_{};
    mutable std::mutex mutex_;
    std::deque<DeadLetter> stored_;
};

} // namespace Relay
