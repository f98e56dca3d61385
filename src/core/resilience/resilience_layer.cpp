#include <relay/core/resilience/resilience_layer.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <future>
#include <memory>

namespace Relay {

ResilienceLayer::ResilienceLayer(const ResilienceConfig& config,
                                 TargetRegistry& registry,
                                 const CircuitBreaker& breaker,
                                 ThreadPool& send_pool,
                                 SendFunction send,
                                 uint64_t seed)
    : config_(config),
      registry_(registry),
      breaker_(breaker),
      send_pool_(send_pool),
      send_(std::move(send)),
      rng_(seed != 0 ? seed : std::random_device{}()) {}

uint64_t ResilienceLayer::backoffDelayMs(uint32_t attempt) const {
    if (attempt == 0) return 0;
    uint32_t shift = std::min<uint32_t>(attempt - 1, 20);
    return static_cast<uint64_t>(config_.base_delay_ms) << shift;
}

uint64_t ResilienceLayer::jitterMs() {
    if (config_.jitter_max_ms == 0) return 0;
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<uint64_t> dist(0, config_.jitter_max_ms);
    return dist(rng_);
}

DeliveryResult ResilienceLayer::deliver(TargetId target, const ItemPtr& item, uint64_t deadline_ms) {
    DeliveryResult result;
    TargetState& t = registry_.at(target);
    ErrorKind last_kind = ErrorKind::NONE;

    while (result.attempts < config_.max_attempts) {
        if (stop_.stopped()) {
            result.kind = ErrorKind::CANCELLED;
            result.message = "engine stopping";
            return result;
        }

        uint64_t now = Clock::now_ms();
        if (now >= deadline_ms) {
            // Ran out of time while the remote side kept asking us to wait
            result.kind = last_kind == ErrorKind::RATE_LIMITED ? ErrorKind::RATE_LIMITED : ErrorKind::TIMEOUT;
            result.message = "message deadline exceeded";
            return result;
        }

        if (!breaker_.allowRequest(t, now)) {
            result.kind = ErrorKind::CIRCUIT_OPEN;
            result.message = "circuit open for " + t.name;
            spdlog::debug("[Resilience] Skipping message id={} on {}: circuit open",
                          item->payload.id, t.name);
            return result;
        }

        auto timeout = std::chrono::milliseconds(
            std::min<uint64_t>(config_.send_timeout_ms, deadline_ms - now));
        SendResult r = invoke(target, item, timeout);

        if (r.ok) {
            result.ok = true;
            result.kind = ErrorKind::NONE;
            result.attempts++;
            return result;
        }

        if (r.kind == ErrorKind::CANCELLED) {
            result.kind = ErrorKind::CANCELLED;
            result.message = r.message;
            return result;
        }

        if (r.retry_after) {
            last_kind = ErrorKind::RATE_LIMITED;
            result.retry_after_waits++;
            result.message = r.message;
            now = Clock::now_ms();
            noteRetryAfter(target, *r.retry_after, now);

            auto wait = std::min<uint64_t>(r.retry_after->count(), Clock::elapsed_ms(now, deadline_ms));
            spdlog::warn("[Resilience] {} asked to retry after {}ms (message id={})",
                         t.name, r.retry_after->count(), item->payload.id);
            if (!stop_.sleepFor(std::chrono::milliseconds(wait))) {
                result.kind = ErrorKind::CANCELLED;
                return result;
            }
            continue;
        }

        result.attempts++;
        last_kind = r.kind == ErrorKind::NONE ? ErrorKind::OTHER : r.kind;
        result.kind = last_kind;
        result.message = r.message;

        if (result.attempts >= config_.max_attempts) {
            break;
        }

        uint64_t delay = backoffDelayMs(result.attempts) + jitterMs();
        now = Clock::now_ms();
        delay = std::min(delay, Clock::elapsed_ms(now, deadline_ms));
        spdlog::warn("[Resilience] {} attempt {}/{} failed ({}: {}), retrying in {}ms",
                     t.name, result.attempts, config_.max_attempts, toString(last_kind),
                     r.message, delay);
        if (!stop_.sleepFor(std::chrono::milliseconds(delay))) {
            result.kind = ErrorKind::CANCELLED;
            return result;
        }
    }

    spdlog::warn("[Resilience] {} gave up on message id={} after {} attempts ({})",
                 t.name, item->payload.id, result.attempts, toString(result.kind));
    return result;
}

SendResult ResilienceLayer::invoke(TargetId target, const ItemPtr& item, std::chrono::milliseconds timeout) {
    // The task may outlive this call on timeout, so it owns copies of everything
    auto promise = std::make_shared<std::promise<SendResult>>();
    std::future<SendResult> future = promise->get_future();
    SendFunction send = send_;
    ItemPtr held = item;

    bool queued = send_pool_.submit([promise, send, target, held]() {
        try {
            promise->set_value(send(target, held->payload));
        } catch (const std::exception& e) {
            promise->set_value(SendResult::failure(ErrorKind::OTHER, e.what()));
        }
    });
    if (!queued) {
        return SendResult::failure(ErrorKind::CANCELLED, "send pool stopped");
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return SendResult::failure(ErrorKind::TIMEOUT,
                                   "send exceeded " + std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

void ResilienceLayer::noteRetryAfter(TargetId target, std::chrono::milliseconds delay, uint64_t now_ms) {
    TargetState& t = registry_.at(target);
    std::lock_guard<std::mutex> lock(t.mutex);
    uint64_t until = now_ms + static_cast<uint64_t>(delay.count());
    t.metrics.rate_limit_until_ms = std::max(t.metrics.rate_limit_until_ms, until);
    t.metrics.retry_after_signals++;
}

} // namespace Relay
