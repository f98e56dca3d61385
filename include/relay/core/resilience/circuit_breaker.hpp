#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <cstdint>

namespace Relay {

/**
 * @class CircuitBreaker
 * @brief Per-target open/closed switch driven by consecutive failures.
 *
 *   CLOSED --(consecutive_failures >= threshold)--> OPEN
 *   OPEN   --(now - opened_at > timeout)----------> CLOSED, failures reset
 *
 * State lives in TargetState::circuit; this class only holds the policy.
 * Methods with the Locked suffix expect the target lock to be held.
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(const ResilienceConfig& config)
        : threshold_(config.circuit_threshold),
          timeout_ms_(static_cast<uint64_t>(config.circuit_timeout_s) * 1000) {}

    /**
     * @brief May a send to this target go ahead now?
     *
     * Closes an expired circuit as a side effect.
     */
    bool allowRequest(TargetState& target, uint64_t now_ms) const;
    bool allowRequestLocked(TargetState& target, uint64_t now_ms) const;

    /**
     * @brief Evaluate the circuit after a failure has been counted
     * @return true if this call opened the circuit
     */
    bool onFailureLocked(TargetState& target, uint64_t now_ms) const;

    bool isOpen(const TargetState& target) const;

    // When an open circuit admits sends again; now_ms if it is closed
    uint64_t reopensAtLocked(const TargetState& target, uint64_t now_ms) const;

    uint32_t threshold() const { return threshold_; }
    uint64_t timeoutMs() const { return timeout_ms_; }

private:
    uint32_t threshold_;
    uint64_t timeout_ms_;
};

} // namespace Relay
