#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Relay {

/**
 * @class StopSignal
 * @brief Shutdown flag with interruptible sleep.
 *
 * Backoff sleeps, retry-after waits and background loop intervals all go
 * through sleepFor() so that stop() wakes them immediately instead of
 * waiting for the full delay.
 */
class StopSignal {
public:
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(false, std::memory_order_release);
    }

    void trigger() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool stopped() const {
        return stopped_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for `duration` unless stopped first
     * @return true if the full duration elapsed, false if stopped
     */
    template <typename Rep, typename Period>
    bool sleepFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] {
            return stopped_.load(std::memory_order_acquire);
        });
    }

private:
    std::atomic<bool> stopped_{false};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace Relay
