#include <relay/core/dispatch/priority_classifier.hpp>
#include <algorithm>

namespace Relay {

MessagePriority PriorityClassifier::classify(const SubmitHints& hints) {
    if (hints.priority) {
        return *hints.priority;
    }
    if (hints.is_reply || hints.has_media) {
        return MessagePriority::HIGH;
    }
    if (hints.text_length < SHORT_TEXT) {
        return MessagePriority::NORMAL;
    }
    if (hints.text_length > LONG_TEXT) {
        return MessagePriority::LOW;
    }
    return MessagePriority::NORMAL;
}

double PriorityClassifier::estimateCost(const SubmitHints& hints) {
    double cost = 0.5;
    cost += static_cast<double>(hints.text_length) / 10000.0;
    if (hints.has_media) cost += 2.0;
    if (hints.is_reply) cost += 0.5;
    return std::min(cost, MAX_COST_S);
}

} // namespace Relay
