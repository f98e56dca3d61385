#include <relay/core/dispatch/dispatch_engine.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace Relay {

namespace {

size_t sendThreads(const DispatchConfig& config) {
    if (config.resilience.send_threads > 0) {
        return config.resilience.send_threads;
    }
    return std::max<size_t>(2, config.targets.size() * 2);
}

} // namespace

DispatchEngine::DispatchEngine(const DispatchConfig& config, SendFunction send, uint64_t seed)
    : config_(config),
      registry_(config.targets, config.rate),
      selection_(registry_, config.strategy),
      breaker_(config.resilience),
      dead_letters_(config.maintenance.dead_letter_capacity),
      queues_(config, registry_, selection_, breaker_, dead_letters_, state_),
      send_pool_(sendThreads(config)),
      resilience_(config.resilience, registry_, breaker_, send_pool_, std::move(send), seed),
      started_ms_(Clock::now_ms()) {
    workers_.reserve(registry_.size());
    for (TargetId id = 0; id < registry_.size(); ++id) {
        workers_.push_back(std::make_unique<TargetWorker>(
            id, queues_, resilience_, state_, config_.workers, &latency_));
    }

    monitor_ = std::make_unique<HealthMonitor>(
        queues_, std::chrono::milliseconds(config_.maintenance.monitor_interval_ms),
        [this]() { return stats(); });
    rebalancer_ = std::make_unique<Rebalancer>(queues_, config_.maintenance);
    reaper_ = std::make_unique<Reaper>(queues_, config_.maintenance);

    spdlog::info("[DispatchEngine] Initialized: {} targets, strategy {}, adaptive {}, {} send threads",
                 registry_.size(), toString(config_.strategy),
                 config_.adaptive_enabled ? "on" : "off", send_pool_.size());
}

DispatchEngine::~DispatchEngine() noexcept {
    stop();
}

void DispatchEngine::start() {
    if (stopped_.load(std::memory_order_acquire)) {
        spdlog::warn("[DispatchEngine] Cannot restart a stopped engine");
        return;
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    started_ms_ = Clock::now_ms();
    resilience_.reset();
    for (auto& w : workers_) {
        w->start();
    }
    monitor_->start();
    rebalancer_->start();
    reaper_->start();
    spdlog::info("[DispatchEngine] Started {} workers", workers_.size());
}

void DispatchEngine::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    stopped_.store(true, std::memory_order_release);
    spdlog::info("[DispatchEngine] Shutting down...");

    monitor_->stop();
    rebalancer_->stop();
    reaper_->stop();

    resilience_.cancel();
    for (auto& w : workers_) {
        w->requestStop();
    }
    queues_.wakeAll();
    for (auto& w : workers_) {
        w->stop();
    }
    send_pool_.shutdown();

    spdlog::info("[DispatchEngine] Stopped ({} still pending)", queues_.pending());
}

bool DispatchEngine::submit(Payload payload, const SubmitHints& hints) {
    return queues_.submit(std::move(payload), hints, Clock::now_ms());
}

void DispatchEngine::configure(SelectionStrategy strategy, bool adaptive_enabled) {
    selection_.setStrategy(strategy);
    queues_.setAdaptive(adaptive_enabled);
    spdlog::info("[DispatchEngine] Configured: strategy {}, adaptive {}",
                 toString(strategy), adaptive_enabled ? "on" : "off");
}

DispatchStats DispatchEngine::stats() const {
    const uint64_t now = Clock::now_ms();

    DispatchStats s;
    for (const auto& snap : registry_.snapshots(now)) {
        TargetStats t;
        t.target = snap;
        if (snap.id < workers_.size()) {
            t.worker = workers_[snap.id]->status(now);
        }
        s.targets.push_back(std::move(t));
    }

    s.totals = queues_.totals();
    s.uptime_s = Clock::elapsed_ms(started_ms_, now) / 1000;
    s.strategy = selection_.strategy();
    s.adaptive_enabled = queues_.adaptiveEnabled();
    s.state = state_.getState();
    s.dead_letters = dead_letters_.totalDropped();
    s.latency_p50_us = latency_.percentile(50);
    s.latency_p99_us = latency_.percentile(99);
    finalizeRates(s);
    return s;
}

void DispatchEngine::pause() {
    state_.setState(DispatchState::PAUSED);
}

void DispatchEngine::resume() {
    if (state_.setState(DispatchState::RUNNING)) {
        queues_.wakeAll();
    }
}

void DispatchEngine::drain() {
    if (state_.setState(DispatchState::DRAINING)) {
        queues_.wakeAll();
        spdlog::info("[DispatchEngine] Draining {} pending messages", queues_.pending());
    }
}

bool DispatchEngine::waitUntilIdle(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (queues_.pending() > 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

size_t DispatchEngine::clearQueues() {
    return queues_.clearQueues();
}

size_t DispatchEngine::rebalanceNow() {
    return rebalancer_->runOnce(Clock::now_ms(), true);
}

std::vector<DeadLetter> DispatchEngine::deadLetters(size_t max_count) const {
    return dead_letters_.recent(max_count);
}

} // namespace Relay
