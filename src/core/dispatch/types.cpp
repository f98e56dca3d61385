#include <relay/core/dispatch/types.hpp>

namespace Relay {

const char* toString(MessagePriority p) {
    switch (p) {
        case MessagePriority::LOW:     return "LOW";
        case MessagePriority::NORMAL:  return "NORMAL";
        case MessagePriority::HIGH:    return "HIGH";
        case MessagePriority::URGENT:  return "URGENT";
        default:                       return "UNKNOWN";
    }
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:          return "NONE";
        case ErrorKind::NETWORK:       return "NETWORK";
        case ErrorKind::TIMEOUT:       return "TIMEOUT";
        case ErrorKind::RATE_LIMITED:  return "RATE_LIMITED";
        case ErrorKind::CIRCUIT_OPEN:  return "CIRCUIT_OPEN";
        case ErrorKind::CANCELLED:     return "CANCELLED";
        case ErrorKind::OTHER:         return "OTHER";
        default:                       return "UNKNOWN";
    }
}

const char* toString(SelectionStrategy s) {
    switch (s) {
        case SelectionStrategy::ROUND_ROBIN:   return "round_robin";
        case SelectionStrategy::LEAST_LOADED:  return "least_loaded";
        case SelectionStrategy::SMART:         return "smart";
        default:                               return "unknown";
    }
}

std::optional<SelectionStrategy> parseSelectionStrategy(const std::string& name) {
    if (name == "round_robin")   return SelectionStrategy::ROUND_ROBIN;
    if (name == "least_loaded")  return SelectionStrategy::LEAST_LOADED;
    if (name == "smart")         return SelectionStrategy::SMART;
    return std::nullopt;
}

} // namespace Relay
