// ============================================================================
// MONOTONIC CLOCK
// ============================================================================
// All dispatch timestamps are milliseconds on steady_clock. Components take
// `now_ms` as an argument so the same code path runs under test with a fixed
// time and in production with Clock::now_ms().
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace Relay {

class Clock {
public:
    static inline uint64_t now_ms() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }

    static inline uint64_t now_us() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Elapsed milliseconds, clamped at 0 for timestamps in the future
    static inline uint64_t elapsed_ms(uint64_t since_ms, uint64_t now_ms) {
        return now_ms > since_ms ? now_ms - since_ms : 0;
    }
};

} // namespace Relay
