#include <relay/core/resilience/circuit_breaker.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace Relay {

bool CircuitBreaker::allowRequest(TargetState& target, uint64_t now_ms) const {
    std::lock_guard<std::mutex> lock(target.mutex);
    return allowRequestLocked(target, now_ms);
}

bool CircuitBreaker::allowRequestLocked(TargetState& target, uint64_t now_ms) const {
    auto& c = target.circuit;
    if (!c.open) {
        return true;
    }
    if (now_ms >= c.closes_at_ms) {
        c.open = false;
        target.metrics.consecutive_failures = 0;
        spdlog::info("[CircuitBreaker] {} circuit closed after {}ms cooldown",
                     target.name, now_ms - c.opened_at_ms);
        return true;
    }
    return false;
}

bool CircuitBreaker::onFailureLocked(TargetState& target, uint64_t now_ms) const {
    auto& c = target.circuit;
    if (c.open || target.metrics.consecutive_failures < threshold_) {
        return false;
    }
    c.open = true;
    c.opened_at_ms = now_ms;
    c.closes_at_ms = now_ms + timeout_ms_ + 1;
    c.open_count++;
    spdlog::error("[CircuitBreaker] {} circuit OPEN after {} consecutive failures (cooldown {}ms)",
                  target.name, target.metrics.consecutive_failures, timeout_ms_);
    return true;
}

bool CircuitBreaker::isOpen(const TargetState& target) const {
    std::lock_guard<std::mutex> lock(target.mutex);
    return target.circuit.open;
}

uint64_t CircuitBreaker::reopensAtLocked(const TargetState& target, uint64_t now_ms) const {
    const auto& c = target.circuit;
    return c.open ? std::max(now_ms, c.closes_at_ms) : now_ms;
}

} // namespace Relay
