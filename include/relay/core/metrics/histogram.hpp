#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <spdlog/spdlog.h>

namespace Relay {

/**
 * @brief Send latency histogram with log2 buckets
 *
 * Bucket i covers [2^i, 2^(i+1)) microseconds, bucket 0 also holds 0 and 1.
 * record() is lock-free; percentiles are estimated from cumulative bucket
 * counts and reported as the bucket's upper bound.
 */
class LatencyHistogram {
public:
    // 2^39 us is roughly six days; anything slower lands in the last bucket
    static constexpr size_t NUM_BUCKETS = 40;

    void record(uint64_t latency_us) {
        buckets_[bucketFor(latency_us)].fetch_add(1, std::memory_order_relaxed);
        total_count_.fetch_add(1, std::memory_order_relaxed);
        uint64_t prev = max_us_.load(std::memory_order_relaxed);
        while (latency_us > prev
               && !max_us_.compare_exchange_weak(prev, latency_us, std::memory_order_relaxed)) {
        }
    }

    uint64_t count() const {
        return total_count_.load(std::memory_order_relaxed);
    }

    uint64_t bucketCount(size_t bucket) const {
        if (bucket >= NUM_BUCKETS) return 0;
        return buckets_[bucket].load(std::memory_order_relaxed);
    }

    uint64_t maxValue() const {
        return max_us_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Upper bound of the bucket holding the given percentile (0-100)
     */
    uint64_t percentile(double pct) const {
        uint64_t total = count();
        if (total == 0) return 0;

        pct = std::min(100.0, std::max(0.0, pct));
        uint64_t rank = static_cast<uint64_t>(pct / 100.0 * static_cast<double>(total));
        if (rank == 0) rank = 1;

        uint64_t seen = 0;
        for (size_t b = 0; b < NUM_BUCKETS; ++b) {
            seen += bucketCount(b);
            if (seen >= rank) {
                return std::min(bucketMax(b), maxValue());
            }
        }
        return maxValue();
    }

    void log(const std::string& label) const {
        if (count() == 0) {
            spdlog::info("[Latency] {}: no samples", label);
            return;
        }
        spdlog::info("[Latency] {}: n={} p50<={}us p99<={}us p99.9<={}us max={}us",
                     label, count(), percentile(50), percentile(99), percentile(99.9), maxValue());
    }

    void reset() {
        for (auto& b : buckets_) {
            b.store(0, std::memory_order_relaxed);
        }
        total_count_.store(0, std::memory_order_relaxed);
        max_us_.store(0, std::memory_order_relaxed);
    }

    static size_t bucketFor(uint64_t latency_us) {
        if (latency_us <= 1) return 0;
        int msb = 63 - __builtin_clzll(latency_us);
        return std::min(static_cast<size_t>(msb), NUM_BUCKETS - 1);
    }

    static uint64_t bucketMax(size_t bucket) {
        if (bucket >= NUM_BUCKETS - 1) return UINT64_MAX;
        return (1ULL << (bucket + 1)) - 1;
    }

private:
    std::array<std::atomic<uint64_t>, NUM_BUCKETS> buckets_{};
    std::atomic<uint64_t> total_count_{0};
    std::atomic<uint64_t> max_us_{0};
};

} // namespace Relay
