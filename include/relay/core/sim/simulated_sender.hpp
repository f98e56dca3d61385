#pragma once

#include <relay/core/config/app_config.hpp>
#include <relay/core/dispatch/types.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace Relay {

/**
 * @class SimulatedSender
 * @brief Stand-in for the protocol client when running relaycore_app.
 *
 * Sleeps for the configured latency, then succeeds, fails with NETWORK or
 * answers with a retry-after, according to the configured probabilities.
 * Copies share state, so the SendFunction built by asSendFunction() keeps
 * counting into this instance.
 */
class SimulatedSender {
public:
    explicit SimulatedSender(const AppConfig::SimulatorConfig& config);

    SendResult send(TargetId target, const Payload& payload);

    SendFunction asSendFunction();

    uint64_t calls() const { return state_->calls.load(std::memory_order_relaxed); }
    uint64_t failures() const { return state_->failures.load(std::memory_order_relaxed); }
    uint64_t retryAfters() const { return state_->retry_afters.load(std::memory_order_relaxed); }

private:
    struct State {
        AppConfig::SimulatorConfig config;
        std::mutex rng_mutex;
        std::mt19937_64 rng;
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> retry_afters{0};
    };

    std::shared_ptr<State> state_;
};

} // namespace Relay
