#pragma once
#include <atomic>
#include <cstdint>

namespace Relay {

/**
 * Dispatch state - written by the engine's control calls, read by workers
 * and by submit() on every call.
 */
enum class DispatchState : uint8_t {
    RUNNING = 0,      // normal operation
    PAUSED = 1,       // workers stop dequeuing, submissions still accepted
    DRAINING = 2      // submissions rejected, workers empty what is queued
};

class DispatchStateManager {
public:
    DispatchStateManager() = default;
    ~DispatchStateManager() = default;

    /**
     * @return true if the state actually changed
     */
    bool setState(DispatchState newState);

    DispatchState getState() const {
        return state_.load(std::memory_order_acquire);
    }

    bool isRunning() const { return getState() == DispatchState::RUNNING; }
    bool isPaused() const { return getState() == DispatchState::PAUSED; }
    bool isDraining() const { return getState() == DispatchState::DRAINING; }

    // Workers may dequeue in RUNNING and DRAINING
    bool allowsDequeue() const { return !isPaused(); }
    bool allowsSubmit() const { return !isDraining(); }

    static const char* toString(DispatchState state);

private:
    std::atomic<DispatchState> state_{DispatchState::RUNNING};
};

} // namespace Relay
