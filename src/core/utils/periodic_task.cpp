#include <relay/core/utils/periodic_task.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace Relay {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval)
    : name_(std::move(name)), interval_(interval) {}

PeriodicTask::~PeriodicTask() noexcept {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    stop_.reset();
    thread_ = std::thread(&PeriodicTask::loop, this);
    spdlog::info("[{}] Started (interval: {}ms)", name_, interval_.count());
}

void PeriodicTask::stop() {
    running_.store(false, std::memory_order_release);
    stop_.trigger();  // Wake up sleeping thread immediately
    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("[{}] Stopped", name_);
    }
}

void PeriodicTask::loop() {
    while (running_.load(std::memory_order_acquire)) {
        if (!stop_.sleepFor(interval_)) {
            break;
        }

        try {
            tick();
            ticks_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            // Keep the loop alive; the next tick starts from fresh state
            spdlog::error("[{}] Tick failed: {}", name_, e.what());
        }
    }
}

} // namespace Relay
