#include <relay/core/control/dispatch_state.hpp>
#include <spdlog/spdlog.h>

namespace Relay {

bool DispatchStateManager::setState(DispatchState newState) {
    DispatchState oldState = state_.exchange(newState, std::memory_order_acq_rel);
    if (oldState == newState) {
        spdlog::debug("[Dispatch] State already {}, no change", toString(newState));
        return false;
    }
    spdlog::warn("[Dispatch] State transition: {} -> {}", toString(oldState), toString(newState));
    return true;
}

const char* DispatchStateManager::toString(DispatchState state) {
    switch (state) {
        case DispatchState::RUNNING:   return "RUNNING";
        case DispatchState::PAUSED:    return "PAUSED";
        case DispatchState::DRAINING:  return "DRAINING";
        default:                       return "UNKNOWN";
    }
}

} // namespace Relay
