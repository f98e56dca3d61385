#pragma once

#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/target_registry.hpp>
#include <relay/core/dispatch/types.hpp>
#include <relay/core/resilience/circuit_breaker.hpp>
#include <relay/core/utils/stop_signal.hpp>
#include <relay/core/utils/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace Relay {

struct DeliveryResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::NONE;   // kind of the last failure
    uint32_t attempts = 0;              // remote calls made
    uint32_t retry_after_waits = 0;
    std::string message;
};

/**
 * @class ResilienceLayer
 * @brief Retry loop around the external send function.
 *
 * For one item:
 *   - circuit open           -> CIRCUIT_OPEN immediately, no remote call
 *   - send ok                -> done
 *   - explicit retry-after   -> cool the target down, sleep, retry without
 *                               spending an attempt
 *   - any other failure      -> sleep base * 2^(attempt-1) + jitter, retry
 *                               until max_attempts
 *
 * Each remote call runs on the send pool and is abandoned after
 * send_timeout_ms (TIMEOUT). The whole loop is bounded by the caller's
 * deadline. cancel() cuts every sleep short.
 */
class ResilienceLayer {
public:
    ResilienceLayer(const ResilienceConfig& config,
                    TargetRegistry& registry,
                    const CircuitBreaker& breaker,
                    ThreadPool& send_pool,
                    SendFunction send,
                    uint64_t seed = 0);

    ResilienceLayer(const ResilienceLayer&) = delete;
    ResilienceLayer& operator=(const ResilienceLayer&) = delete;

    DeliveryResult deliver(TargetId target, const ItemPtr& item, uint64_t deadline_ms);

    void cancel() { stop_.trigger(); }
    void reset() { stop_.reset(); }
    bool cancelled() const { return stop_.stopped(); }

    // base * 2^(attempt-1), no jitter
    uint64_t backoffDelayMs(uint32_t attempt) const;

private:
    SendResult invoke(TargetId target, const ItemPtr& item, std::chrono::milliseconds timeout);
    void noteRetryAfter(TargetId target, std::chrono::milliseconds delay, uint64_t now_ms);
    uint64_t jitterMs();

    ResilienceConfig config_;
    TargetRegistry& registry_;
    const CircuitBreaker& breaker_;
    ThreadPool& send_pool_;
    SendFunction send_;
    StopSignal stop_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace Relay
