#pragma once

#include <relay/core/dispatch/types.hpp>

namespace Relay {

/**
 * @class PriorityClassifier
 * @brief Maps submission hints to a priority class and a cost estimate.
 *
 * Rules, first match wins:
 *   explicit override          -> that priority (only way to get URGENT)
 *   reply or media             -> HIGH
 *   text shorter than 100      -> NORMAL
 *   text longer than 1000      -> LOW
 *   otherwise                  -> NORMAL
 */
class PriorityClassifier {
public:
    static constexpr size_t SHORT_TEXT = 100;
    static constexpr size_t LONG_TEXT = 1000;
    static constexpr double MAX_COST_S = 10.0;

    static MessagePriority classify(const SubmitHints& hints);

    // 0.5s base + length/10000 + 2.0 for media + 0.5 for a reply, capped at 10s
    static double estimateCost(const SubmitHints& hints);
};

} // namespace Relay
