#include <relay/core/dispatch/dead_letter_queue.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace Relay {

const char* toString(DeadLetterReason reason) {
    switch (reason) {
        case DeadLetterReason::RETRIES_EXHAUSTED: return "RETRIES_EXHAUSTED";
        case DeadLetterReason::EXPIRED:           return "EXPIRED";
        case DeadLetterReason::REAPED:            return "REAPED";
        default:                                  return "UNKNOWN";
    }
}

DeadLetterQueue::DeadLetterQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {
    spdlog::debug("[DeadLetterQueue] Initialized (max stored: {})", capacity_);
}

void DeadLetterQueue::storeLocked(DeadLetter entry) {
    if (stored_.size() >= capacity_) {
        stored_.pop_front();
    }
    stored_.push_back(std::move(entry));
}

void DeadLetterQueue::push(ItemPtr item, DeadLetterReason reason, uint64_t now_ms, std::string detail) {
    if (!item) return;

    total_.fetch_add(1, std::memory_order_relaxed);
    by_reason_[static_cast<size_t>(reason)].fetch_add(1, std::memory_order_relaxed);

    const uint64_t id = item->payload.id;
    const TargetId target = item->target;
    const uint32_t retries = item->retry_count;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        DeadLetter entry;
        entry.item = std::move(item);
        entry.reason = reason;
        entry.last_target = target;
        entry.recorded_ms = now_ms;
        entry.detail = std::move(detail);
        storeLocked(std::move(entry));
    }

    spdlog::error("[DLQ] Gave up on message id={} target={} retries={} reason={} (total: {})",
                  id, target, retries, toString(reason),
                  total_.load(std::memory_order_relaxed));
}

void DeadLetterQueue::pushBatch(const std::vector<ItemPtr>& items, DeadLetterReason reason, uint64_t now_ms) {
    size_t stored = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& item : items) {
            if (!item) continue;
            DeadLetter entry;
            entry.item = item;
            entry.reason = reason;
            entry.last_target = item->target;
            entry.recorded_ms = now_ms;
            storeLocked(std::move(entry));
            ++stored;
        }
    }
    if (stored == 0) return;

    total_.fetch_add(stored, std::memory_order_relaxed);
    by_reason_[static_cast<size_t>(reason)].fetch_add(stored, std::memory_order_relaxed);

    spdlog::warn("[DLQ] Dropped batch of {} messages reason={} (total: {})",
                 stored, toString(reason), total_.load(std::memory_order_relaxed));
}

std::vector<DeadLetter> DeadLetterQueue::recent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DeadLetter> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

void DeadLetterQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    spdlog::info("[DLQ] Buffer cleared (total dropped remains: {})",
                 total_.load(std::memory_order_relaxed));
}

} // namespace Relay
