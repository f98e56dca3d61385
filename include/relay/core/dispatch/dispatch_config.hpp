#pragma once

#include <relay/core/dispatch/types.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Relay {

/**
 * @struct TargetConfig
 * @brief Initial rate-limit settings of one output channel.
 *
 * messages_per_second / burst_limit / recovery_time_s drift at runtime when
 * adaptive adjustment is enabled (see RateLimiter::adapt).
 */
struct TargetConfig {
    std::string name;
    double messages_per_second = 20.0;
    uint32_t burst_limit = 40;
    double recovery_time_s = 5.0;
    bool adaptive = true;
};

// Queue bounds, item retry budget and requeue backoff
struct QueueConfig {
    size_t max_queue_size = 50000;          // aggregate across all targets
    uint32_t item_max_retries = 3;
    uint32_t max_item_age_s = 300;          // older items are discarded at dequeue
    double requeue_backoff_factor = 2.0;    // delay = factor^(retry-1) units
    uint32_t requeue_max_delay = 30;        // in delay units
    uint32_t requeue_delay_unit_ms = 1000;
    uint32_t preferred_max_failures = 5;    // preferred target ignored above this
};

// Sliding window used by the rate limiter
struct RateWindowConfig {
    uint32_t window_ms = 60000;
    size_t tracker_capacity = 60;
};

struct ResilienceConfig {
    uint32_t max_attempts = 3;              // remote attempts per dequeued item
    uint32_t base_delay_ms = 1000;          // backoff = base * 2^(attempt-1)
    uint32_t jitter_max_ms = 1000;
    uint32_t circuit_threshold = 5;
    uint32_t circuit_timeout_s = 60;
    uint32_t send_timeout_ms = 30000;       // per remote attempt
    uint32_t send_threads = 0;              // 0 = two per target
};

struct WorkerConfig {
    uint32_t idle_poll_ms = 1000;           // dequeue wait when queues are empty
    uint32_t idle_activity_ms = 30000;      // empty waiting this long counts as activity
    uint32_t rate_limited_pause_ms = 500;
    uint32_t message_timeout_ms = 300000;   // whole-item deadline incl. retries
    uint32_t health_check_interval_s = 60;
    uint32_t stuck_threshold_s = 180;
    uint32_t error_threshold = 5;
    uint32_t restart_pause_ms = 1000;
};

struct MaintenanceConfig {
    uint32_t monitor_interval_ms = 10000;
    uint32_t rebalance_interval_ms = 10000;
    uint32_t reaper_interval_ms = 60000;
    uint32_t retention_s = 300;
    size_t rebalance_min_gap = 10;
    size_t rebalance_max_move = 20;
    uint32_t dead_letter_capacity = 1000;
};

/**
 * @struct DispatchConfig
 * @brief Complete, validated configuration of the dispatch engine.
 *
 * Defaults are applied here at construction; ConfigLoader overrides them from
 * YAML and rejects out-of-range values before the engine ever sees them.
 */
struct DispatchConfig {
    std::vector<TargetConfig> targets;
    SelectionStrategy strategy = SelectionStrategy::SMART;
    bool adaptive_enabled = true;

    QueueConfig queue;
    RateWindowConfig rate;
    ResilienceConfig resilience;
    WorkerConfig workers;
    MaintenanceConfig maintenance;
};

} // namespace Relay
