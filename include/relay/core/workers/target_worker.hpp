#pragma once

#include <relay/core/control/dispatch_state.hpp>
#include <relay/core/dispatch/dispatch_config.hpp>
#include <relay/core/dispatch/queue_manager.hpp>
#include <relay/core/metrics/histogram.hpp>
#include <relay/core/resilience/resilience_layer.hpp>
#include <relay/core/utils/stop_signal.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace Relay {

enum class WorkerState : uint8_t {
    STOPPED = 0,
    IDLE = 1,
    DEQUEUING = 2,
    PROCESSING = 3,
    RESTARTING = 4
};

const char* toString(WorkerState state);

struct WorkerStatus {
    WorkerState state = WorkerState::STOPPED;
    uint64_t restarts = 0;
    uint32_t consecutive_errors = 0;
    uint64_t items_handled = 0;
    uint64_t idle_for_ms = 0;       // since last activity
};

/**
 * @class TargetWorker
 * @brief The single consumer of one target's queues.
 *
 * Loop: check health -> honour pause -> dequeue -> deliver -> ack/requeue.
 * A soft restart (counters reset, short pause, resume) happens when the
 * worker has seen no activity for stuck_threshold_s or after
 * error_threshold consecutive failed deliveries.
 */
class TargetWorker {
public:
    TargetWorker(TargetId target,
                 QueueManager& queues,
                 ResilienceLayer& resilience,
                 const DispatchStateManager& state,
                 const WorkerConfig& config,
                 LatencyHistogram* latency = nullptr);
    ~TargetWorker() noexcept;

    TargetWorker(const TargetWorker&) = delete;
    TargetWorker& operator=(const TargetWorker&) = delete;

    void start();
    void stop();

    // Clears the running flag without joining
    void requestStop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }
    TargetId target() const { return target_; }
    const std::string& name() const { return name_; }

    WorkerStatus status(uint64_t now_ms) const;

    /**
     * @brief Self-health check, run from the worker loop
     * @return true if a soft restart was performed
     */
    bool checkHealth(uint64_t now_ms);

private:
    void loop();
    void process(const ItemPtr& item);
    void softRestart(const std::string& reason);
    void touch(uint64_t now_ms) { last_activity_ms_.store(now_ms, std::memory_order_relaxed); }

    const TargetId target_;
    const std::string name_;
    QueueManager& queues_;
    ResilienceLayer& resilience_;
    const DispatchStateManager& state_;
    WorkerConfig config_;
    LatencyHistogram* latency_;

    std::atomic<bool> running_{false};
    std::atomic<WorkerState> worker_state_{WorkerState::STOPPED};
    std::atomic<uint64_t> last_activity_ms_{0};
    std::atomic<uint64_t> last_health_check_ms_{0};
    std::atomic<uint32_t> consecutive_errors_{0};
    std::atomic<uint64_t> restarts_{0};
    std::atomic<uint64_t> handled_{0};

    StopSignal stop_;
    std::thread thread_;
};

} // namespace Relay
