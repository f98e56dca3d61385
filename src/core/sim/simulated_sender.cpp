#include <relay/core/sim/simulated_sender.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <thread>

namespace Relay {

SimulatedSender::SimulatedSender(const AppConfig::SimulatorConfig& config)
    : state_(std::make_shared<State>()) {
    state_->config = config;
    state_->rng.seed(config.seed != 0 ? config.seed : std::random_device{}());
    spdlog::info("[Simulator] failure {:.0f}%, retry-after {:.0f}% ({}ms), latency {}ms",
                 config.failure_rate * 100.0, config.retry_after_rate * 100.0,
                 config.retry_after_ms, config.latency_ms);
}

SendResult SimulatedSender::send(TargetId target, const Payload& payload) {
    State& s = *state_;
    s.calls.fetch_add(1, std::memory_order_relaxed);

    if (s.config.latency_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(s.config.latency_ms));
    }

    double roll;
    {
        std::lock_guard<std::mutex> lock(s.rng_mutex);
        roll = std::uniform_real_distribution<double>(0.0, 1.0)(s.rng);
    }

    if (roll < s.config.failure_rate) {
        s.failures.fetch_add(1, std::memory_order_relaxed);
        return SendResult::failure(ErrorKind::NETWORK,
                                   "simulated network error on target " + std::to_string(target));
    }
    if (roll < s.config.failure_rate + s.config.retry_after_rate) {
        s.retry_afters.fetch_add(1, std::memory_order_relaxed);
        return SendResult::retryAfter(std::chrono::milliseconds(s.config.retry_after_ms),
                                      "simulated flood wait");
    }

    spdlog::debug("[Simulator] target {} <- message id={} ({} bytes)",
                  target, payload.id, payload.body.size());
    return SendResult::success();
}

SendFunction SimulatedSender::asSendFunction() {
    SimulatedSender self = *this;
    return [self](TargetId target, const Payload& payload) mutable {
        return self.send(target, payload);
    };
}

} // namespace Relay
