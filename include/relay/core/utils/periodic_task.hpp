#pragma once

#include <relay/core/utils/stop_signal.hpp>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace Relay {

/**
 * @class PeriodicTask
 * @brief Background thread that calls tick() on a fixed interval.
 *
 * Base for the health monitor, rebalancer and reaper. The sleep between
 * ticks is interruptible, so stop() returns as soon as the current tick ends.
 *
 * Derived classes must call stop() in their own destructor: the thread calls
 * the virtual tick() and must be joined before the derived part is destroyed.
 */
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval);
    virtual ~PeriodicTask() noexcept;

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    const std::string& name() const { return name_; }
    std::chrono::milliseconds interval() const { return interval_; }
    uint64_t tickCount() const { return ticks_.load(std::memory_order_relaxed); }

protected:
    virtual void tick() = 0;

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    StopSignal stop_;
    std::thread thread_;
};

} // namespace Relay
