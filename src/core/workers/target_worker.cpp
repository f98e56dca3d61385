#include <relay/core/workers/target_worker.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>

namespace Relay {

const char* toString(WorkerState state) {
    switch (state) {
        case WorkerState::STOPPED:     return "STOPPED";
        case WorkerState::IDLE:        return "IDLE";
        case WorkerState::DEQUEUING:   return "DEQUEUING";
        case WorkerState::PROCESSING:  return "PROCESSING";
        case WorkerState::RESTARTING:  return "RESTARTING";
        default:                       return "UNKNOWN";
    }
}

TargetWorker::TargetWorker(TargetId target,
                           QueueManager& queues,
                           ResilienceLayer& resilience,
                           const DispatchStateManager& state,
                           const WorkerConfig& config,
                           LatencyHistogram* latency)
    : target_(target),
      name_("Worker-" + std::to_string(target)),
      queues_(queues),
      resilience_(resilience),
      state_(state),
      config_(config),
      latency_(latency) {}

TargetWorker::~TargetWorker() noexcept {
    stop();
}

void TargetWorker::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    stop_.reset();
    uint64_t now = Clock::now_ms();
    touch(now);
    last_health_check_ms_.store(now, std::memory_order_relaxed);
    worker_state_.store(WorkerState::IDLE, std::memory_order_release);
    thread_ = std::thread(&TargetWorker::loop, this);
    spdlog::info("[{}] Started for target '{}'", name_, queues_.registry().at(target_).name);
}

void TargetWorker::requestStop() {
    running_.store(false, std::memory_order_release);
    stop_.trigger();
}

void TargetWorker::stop() {
    requestStop();
    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("[{}] Stopped after {} messages ({} restarts)",
                     name_, handled_.load(), restarts_.load());
    }
    worker_state_.store(WorkerState::STOPPED, std::memory_order_release);
}

WorkerStatus TargetWorker::status(uint64_t now_ms) const {
    WorkerStatus s;
    s.state = worker_state_.load(std::memory_order_acquire);
    s.restarts = restarts_.load(std::memory_order_relaxed);
    s.consecutive_errors = consecutive_errors_.load(std::memory_order_relaxed);
    s.items_handled = handled_.load(std::memory_order_relaxed);
    s.idle_for_ms = Clock::elapsed_ms(last_activity_ms_.load(std::memory_order_relaxed), now_ms);
    return s;
}

bool TargetWorker::checkHealth(uint64_t now_ms) {
    last_health_check_ms_.store(now_ms, std::memory_order_relaxed);
    uint64_t idle = Clock::elapsed_ms(last_activity_ms_.load(std::memory_order_relaxed), now_ms);
    if (idle > static_cast<uint64_t>(config_.stuck_threshold_s) * 1000) {
        spdlog::error("[{}] No activity for {}s, worker looks stuck", name_, idle / 1000);
        softRestart("stuck");
        return true;
    }
    return false;
}

void TargetWorker::softRestart(const std::string& reason) {
    worker_state_.store(WorkerState::RESTARTING, std::memory_order_release);
    uint64_t n = restarts_.fetch_add(1, std::memory_order_relaxed) + 1;
    spdlog::warn("[{}] Soft restart #{} ({})", name_, n, reason);

    consecutive_errors_.store(0, std::memory_order_relaxed);
    stop_.sleepFor(std::chrono::milliseconds(config_.restart_pause_ms));
    touch(Clock::now_ms());

    worker_state_.store(WorkerState::IDLE, std::memory_order_release);
    spdlog::info("[{}] Resumed", name_);
}

void TargetWorker::loop() {
    const auto poll = std::chrono::milliseconds(config_.idle_poll_ms);
    const auto rate_pause = std::chrono::milliseconds(config_.rate_limited_pause_ms);
    const uint64_t health_interval_ms = static_cast<uint64_t>(config_.health_check_interval_s) * 1000;

    while (running_.load(std::memory_order_acquire)) {
        uint64_t now = Clock::now_ms();

        if (health_interval_ms > 0
            && Clock::elapsed_ms(last_health_check_ms_.load(std::memory_order_relaxed), now) >= health_interval_ms) {
            checkHealth(now);
            continue;
        }

        if (!state_.allowsDequeue()) {
            worker_state_.store(WorkerState::IDLE, std::memory_order_release);
            touch(now);
            stop_.sleepFor(poll);
            continue;
        }

        worker_state_.store(WorkerState::DEQUEUING, std::memory_order_release);
        DequeueResult r = queues_.dequeue(target_, now);

        switch (r.status) {
            case DequeueStatus::ITEM:
                worker_state_.store(WorkerState::PROCESSING, std::memory_order_release);
                touch(now);
                process(r.item);
                worker_state_.store(WorkerState::IDLE, std::memory_order_release);
                break;

            case DequeueStatus::RATE_LIMITED:
                worker_state_.store(WorkerState::IDLE, std::memory_order_release);
                stop_.sleepFor(rate_pause);
                break;

            case DequeueStatus::EMPTY: {
                worker_state_.store(WorkerState::IDLE, std::memory_order_release);
                // An idle worker is not a stuck one
                if (Clock::elapsed_ms(last_activity_ms_.load(std::memory_order_relaxed), now)
                        > config_.idle_activity_ms) {
                    touch(now);
                }
                auto wait = poll;
                if (r.next_due_ms > now) {
                    wait = std::min(wait, std::chrono::milliseconds(r.next_due_ms - now));
                }
                if (running_.load(std::memory_order_acquire)) {
                    queues_.waitForWork(target_, r.wake_seq, wait);
                }
                break;
            }
        }
    }
}

void TargetWorker::process(const ItemPtr& item) {
    const uint64_t start_us = Clock::now_us();
    const uint64_t start_ms = start_us / 1000;
    const uint64_t deadline = start_ms + config_.message_timeout_ms;

    DeliveryResult d;
    try {
        d = resilience_.deliver(target_, item, deadline);
    } catch (const std::exception& e) {
        d.ok = false;
        d.kind = ErrorKind::OTHER;
        d.message = e.what();
        spdlog::error("[{}] Delivery of message id={} threw: {}", name_, item->payload.id, e.what());
    }

    const uint64_t elapsed_us = Clock::now_us() - start_us;
    const uint64_t now = Clock::now_ms();
    const double elapsed_s = static_cast<double>(elapsed_us) / 1e6;

    queues_.ack(item, d.ok, elapsed_s, d.kind, now);
    touch(now);
    handled_.fetch_add(1, std::memory_order_relaxed);

    if (d.ok) {
        consecutive_errors_.store(0, std::memory_order_relaxed);
        if (latency_) latency_->record(elapsed_us);
        spdlog::debug("[{}] Delivered message id={} in {:.3f}s ({} attempts)",
                      name_, item->payload.id, elapsed_s, d.attempts);
        return;
    }

    if (d.kind == ErrorKind::CANCELLED) {
        queues_.restore(item);
        return;
    }

    // A skipped send on an open circuit is not this worker misbehaving
    if (d.kind == ErrorKind::CIRCUIT_OPEN) {
        queues_.holdForOpenCircuit(item, now);
        return;
    }

    queues_.requeueFailed(item, d.kind, now);

    // Neither is a remote side that keeps asking us to wait
    if (d.kind == ErrorKind::RATE_LIMITED) {
        return;
    }

    uint32_t errors = consecutive_errors_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (errors >= config_.error_threshold) {
        spdlog::error("[{}] {} consecutive delivery failures", name_, errors);
        softRestart("error threshold");
    }
}

} // namespace Relay
