#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/dispatch/priority_classifier.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <mutex>

namespace Relay {

const char* toString(DequeueStatus status) {
    switch (status) {
        case DequeueStatus::ITEM:          return "ITEM";
        case DequeueStatus::EMPTY:         return "EMPTY";
        case DequeueStatus::RATE_LIMITED:  return "RATE_LIMITED";
        default:                           return "UNKNOWN";
    }
}

QueueManager::QueueManager(const DispatchConfig& config,
                           TargetRegistry& registry,
                           SelectionEngine& selection,
                           const CircuitBreaker& breaker,
                           DeadLetterQueue& dead_letters,
                           const DispatchStateManager& state)
    : config_(config.queue),
      registry_(registry),
      selection_(selection),
      breaker_(breaker),
      dead_letters_(dead_letters),
      state_(state),
      adaptive_(config.adaptive_enabled) {
    spdlog::info("[QueueManager] Initialized: {} targets, cap {}, item retries {}, max age {}s",
                 registry_.size(), config_.max_queue_size, config_.item_max_retries,
                 config_.max_item_age_s);
}

// ============================================================================
// SUBMIT
// ============================================================================

bool QueueManager::submit(Payload payload, const SubmitHints& hints, uint64_t now_ms) {
    if (!state_.allowsSubmit()) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[QueueManager] Rejected message id={}: engine is draining", payload.id);
        return false;
    }
    if (registry_.size() == 0) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    // Reserve a slot first so concurrent submitters cannot overshoot the cap
    size_t prev = pending_.fetch_add(1, std::memory_order_acq_rel);
    if (prev >= config_.max_queue_size) {
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        uint64_t rejected = rejected_.fetch_add(1, std::memory_order_relaxed) + 1;
        // One warning per thousand keeps a flood from drowning the log
        if (rejected % 1000 == 1) {
            spdlog::warn("[QueueManager] Queue full ({}), rejecting message id={} (total rejected: {})",
                         config_.max_queue_size, payload.id, rejected);
        }
        return false;
    }

    auto item = std::make_shared<QueuedItem>();
    item->payload = std::move(payload);
    item->priority = PriorityClassifier::classify(hints);
    item->estimated_cost_s = PriorityClassifier::estimateCost(hints);
    item->timestamp_ms = now_ms;
    item->submitted_ms = now_ms;
    item->sequence = sequence_.fetch_add(1, std::memory_order_relaxed);
    item->max_retries = config_.item_max_retries;
    item->target = chooseTarget(hints, now_ms);

    pushTo(item->target, item);
    enqueued_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("[QueueManager] Queued message id={} priority={} target={} cost={:.2f}s",
                  item->payload.id, toString(item->priority), item->target, item->estimated_cost_s);
    return true;
}

TargetId QueueManager::chooseTarget(const SubmitHints& hints, uint64_t now_ms) {
    if (hints.preferred_target && registry_.contains(*hints.preferred_target)) {
        auto snap = registry_.snapshot(*hints.preferred_target, now_ms);
        if (!snap.rate_limited && snap.metrics.consecutive_failures <= config_.preferred_max_failures) {
            return snap.id;
        }
        spdlog::debug("[QueueManager] Preferred target {} unavailable (rate limited: {}, failures: {})",
                      snap.name, snap.rate_limited, snap.metrics.consecutive_failures);
    }
    return selection_.select({}, now_ms);
}

void QueueManager::pushTo(TargetId target, const ItemPtr& item) {
    TargetState& t = registry_.at(target);
    {
        std::lock_guard<std::mutex> lock(t.mutex);
        item->target = target;
        t.queues.push(item);
        t.wake_seq++;
    }
    t.available.notify_one();
}

// ============================================================================
// DEQUEUE
// ============================================================================

DequeueResult QueueManager::dequeue(TargetId target, uint64_t now_ms) {
    TargetState& t = registry_.at(target);
    const uint64_t max_age_ms = static_cast<uint64_t>(config_.max_item_age_s) * 1000;

    DequeueResult result;
    std::vector<ItemPtr> expired;
    std::vector<ItemPtr> exhausted;
    {
        std::lock_guard<std::mutex> lock(t.mutex);
        result.wake_seq = t.wake_seq;

        if (t.isRateLimited(now_ms)) {
            result.status = DequeueStatus::RATE_LIMITED;
            return result;
        }

        ItemPtr picked;
        for (auto p : PRIORITIES_HIGH_TO_LOW) {
            ItemHeap& heap = t.queues.heap(p);
            while (!heap.empty()) {
                const ItemPtr& top = heap.top();
                if (Clock::elapsed_ms(top->submitted_ms, now_ms) > max_age_ms) {
                    expired.push_back(heap.pop());
                    continue;
                }
                if (top->retry_count >= top->max_retries) {
                    exhausted.push_back(heap.pop());
                    continue;
                }
                if (top->timestamp_ms > now_ms) {
                    // Heap is time-ordered within a class: nothing else here is due
                    if (result.next_due_ms == 0 || top->timestamp_ms < result.next_due_ms) {
                        result.next_due_ms = top->timestamp_ms;
                    }
                    break;
                }
                picked = heap.pop();
                break;
            }
            if (picked) break;
        }

        if (picked) {
            if (!registry_.rateLimiter().tryAcquire(t, now_ms)) {
                t.queues.push(picked);
                result.status = DequeueStatus::RATE_LIMITED;
            } else {
                registry_.rateLimiter().record(t, now_ms);
                t.metrics.current_load++;
                result.status = DequeueStatus::ITEM;
                result.item = std::move(picked);
            }
        }
    }

    if (!expired.empty()) {
        expired_.fetch_add(expired.size(), std::memory_order_relaxed);
        releasePending(expired.size());
        dead_letters_.pushBatch(expired, DeadLetterReason::EXPIRED, now_ms);
    }
    if (!exhausted.empty()) {
        failed_.fetch_add(exhausted.size(), std::memory_order_relaxed);
        releasePending(exhausted.size());
        dead_letters_.pushBatch(exhausted, DeadLetterReason::RETRIES_EXHAUSTED, now_ms);
    }
    return result;
}

void QueueManager::waitForWork(TargetId target, uint64_t seen_wake_seq, std::chrono::milliseconds max_wait) {
    TargetState& t = registry_.at(target);
    std::unique_lock<std::mutex> lock(t.mutex);
    t.available.wait_for(lock, max_wait, [&t, seen_wake_seq] { return t.wake_seq != seen_wake_seq; });
}

void QueueManager::wakeAll() {
    for (TargetId id = 0; id < registry_.size(); ++id) {
        TargetState& t = registry_.at(id);
        {
            std::lock_guard<std::mutex> lock(t.mutex);
            t.wake_seq++;
        }
        t.available.notify_all();
    }
}

// ============================================================================
// ACK & REQUEUE
// ============================================================================

void QueueManager::ack(const ItemPtr& item, bool success, double processing_s, ErrorKind kind,
                       uint64_t now_ms) {
    if (!item || !registry_.contains(item->target)) return;

    TargetState& t = registry_.at(item->target);
    {
        std::lock_guard<std::mutex> lock(t.mutex);
        auto& m = t.metrics;
        if (m.current_load > 0) m.current_load--;

        if (!success && (kind == ErrorKind::CIRCUIT_OPEN || kind == ErrorKind::CANCELLED
                         || kind == ErrorKind::RATE_LIMITED)) {
            return;
        }

        m.messages_processed++;
        if (success) {
            m.consecutive_failures = 0;
            t.recordProcessingTime(processing_s);
            m.success_rate = std::min(1.0, std::max(0.0,
                static_cast<double>(m.messages_processed - std::min(m.error_count, m.messages_processed))
                / static_cast<double>(m.messages_processed)));
        } else {
            m.error_count++;
            m.consecutive_failures++;
            m.success_rate = std::max(0.5, m.success_rate * 0.9);
            switch (kind) {
                case ErrorKind::NETWORK:  m.network_errors++; break;
                case ErrorKind::TIMEOUT:  m.timeouts++; break;
                default:                  m.other_errors++; break;
            }
            breaker_.onFailureLocked(t, now_ms);
        }
    }

    if (success) {
        processed_.fetch_add(1, std::memory_order_relaxed);
        releasePending(1);
    }
}

uint64_t QueueManager::requeueDelayMs(uint32_t retry_count) const {
    if (retry_count == 0) return 0;
    double units = std::pow(config_.requeue_backoff_factor, static_cast<double>(retry_count - 1));
    units = std::min(units, static_cast<double>(config_.requeue_max_delay));
    return static_cast<uint64_t>(units * static_cast<double>(config_.requeue_delay_unit_ms));
}

std::vector<TargetId> QueueManager::retryExclusions(TargetId failing, uint32_t retry_count,
                                                    uint64_t now_ms) const {
    std::vector<TargetId> excluded{failing};
    if (retry_count > 2) {
        for (const auto& s : registry_.snapshots(now_ms)) {
            if (s.id == failing) continue;
            if (s.metrics.consecutive_failures > 0 || s.rate_limited) {
                excluded.push_back(s.id);
            }
        }
    }
    return excluded;
}

RequeueOutcome QueueManager::requeueFailed(const ItemPtr& item, ErrorKind kind, uint64_t now_ms) {
    const TargetId failing = item->target;
    item->retry_count++;

    if (item->retry_count >= item->max_retries) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        releasePending(1);
        dead_letters_.push(item, DeadLetterReason::RETRIES_EXHAUSTED, now_ms,
                           std::string("last error: ") + toString(kind));
        return RequeueOutcome::DEAD_LETTERED;
    }

    item->timestamp_ms = now_ms + requeueDelayMs(item->retry_count);
    if (kind != ErrorKind::RATE_LIMITED) {
        item->priority = demote(item->priority);
    }

    auto excluded = retryExclusions(failing, item->retry_count, now_ms);
    TargetId next = selection_.select(SelectionStrategy::SMART, excluded, now_ms);

    pushTo(next, item);
    requeued_.fetch_add(1, std::memory_order_relaxed);

    spdlog::warn("[QueueManager] Requeued message id={} retry {}/{} after {}: target {} -> {}, "
                 "priority {}, due in {}ms",
                 item->payload.id, item->retry_count, item->max_retries, toString(kind),
                 failing, next, toString(item->priority), item->timestamp_ms - now_ms);
    return RequeueOutcome::REQUEUED;
}

TargetId QueueManager::holdForOpenCircuit(const ItemPtr& item, uint64_t now_ms) {
    const TargetId blocked = item->target;
    uint64_t reopens_at = now_ms;
    {
        TargetState& t = registry_.at(blocked);
        std::lock_guard<std::mutex> lock(t.mutex);
        reopens_at = breaker_.reopensAtLocked(t, now_ms);
    }

    TargetId next = selection_.select(SelectionStrategy::SMART, {blocked}, now_ms);
    if (next != blocked && !registry_.snapshot(next, now_ms).circuit_open) {
        pushTo(next, item);
        spdlog::debug("[QueueManager] Circuit open on target {}, moved message id={} to target {}",
                      blocked, item->payload.id, next);
        return next;
    }

    item->timestamp_ms = reopens_at;
    pushTo(blocked, item);
    spdlog::debug("[QueueManager] Circuit open on target {}, holding message id={} for {}ms",
                  blocked, item->payload.id, reopens_at - now_ms);
    return blocked;
}

void QueueManager::restore(const ItemPtr& item) {
    if (!item || !registry_.contains(item->target)) return;
    pushTo(item->target, item);
}

// ============================================================================
// MAINTENANCE HOOKS
// ============================================================================

size_t QueueManager::clearQueues() {
    size_t cleared = 0;
    for (TargetId id = 0; id < registry_.size(); ++id) {
        TargetState& t = registry_.at(id);
        std::lock_guard<std::mutex> lock(t.mutex);
        cleared += t.queues.drain().size();
    }
    releasePending(cleared);
    spdlog::warn("[QueueManager] Cleared {} queued messages", cleared);
    return cleared;
}

void QueueManager::recordRebalanced(size_t count) {
    rebalanced_.fetch_add(count, std::memory_order_relaxed);
}

void QueueManager::discard(const std::vector<ItemPtr>& items, DeadLetterReason reason, uint64_t now_ms) {
    if (items.empty()) return;
    if (reason == DeadLetterReason::RETRIES_EXHAUSTED) {
        failed_.fetch_add(items.size(), std::memory_order_relaxed);
    } else {
        expired_.fetch_add(items.size(), std::memory_order_relaxed);
    }
    releasePending(items.size());
    dead_letters_.pushBatch(items, reason, now_ms);
}

void QueueManager::releasePending(size_t count) {
    size_t current = pending_.load(std::memory_order_acquire);
    size_t next;
    do {
        next = current >= count ? current - count : 0;
    } while (!pending_.compare_exchange_weak(current, next, std::memory_order_acq_rel));
}

QueueTotals QueueManager::totals() const {
    QueueTotals t;
    t.enqueued = enqueued_.load(std::memory_order_relaxed);
    t.processed = processed_.load(std::memory_order_relaxed);
    t.failed = failed_.load(std::memory_order_relaxed);
    t.rejected = rejected_.load(std::memory_order_relaxed);
    t.expired = expired_.load(std::memory_order_relaxed);
    t.requeued = requeued_.load(std::memory_order_relaxed);
    t.rebalanced = rebalanced_.load(std::memory_order_relaxed);
    t.pending = pending_.load(std::memory_order_acquire);
    return t;
}

} // namespace Relay
