#include <relay/core/maintenance/reaper.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <mutex>

namespace Relay {

Reaper::Reaper(QueueManager& queues, const MaintenanceConfig& config)
    : PeriodicTask("Reaper", std::chrono::milliseconds(config.reaper_interval_ms)),
      queues_(queues),
      retention_ms_(static_cast<uint64_t>(config.retention_s) * 1000) {}

Reaper::~Reaper() noexcept {
    stop();
}

void Reaper::tick() {
    runOnce(Clock::now_ms());
}

size_t Reaper::runOnce(uint64_t now_ms) {
    auto& registry = queues_.registry();
    if (registry.size() == 0) return 0;

    TargetId id = cursor_ % registry.size();
    cursor_ = (id + 1) % registry.size();

    const uint64_t retention = retention_ms_;
    auto stale = [now_ms, retention](const ItemPtr& item) {
        return Clock::elapsed_ms(item->submitted_ms, now_ms) > retention
            && item->retry_count >= item->max_retries;
    };

    std::vector<ItemPtr> removed;
    TargetState& t = registry.at(id);
    {
        std::lock_guard<std::mutex> lock(t.mutex);
        for (auto priority : PRIORITIES_HIGH_TO_LOW) {
            auto r = t.queues.heap(priority).removeIf(stale);
            removed.insert(removed.end(), r.begin(), r.end());
        }
    }

    if (!removed.empty()) {
        queues_.discard(removed, DeadLetterReason::REAPED, now_ms);
        spdlog::info("[Reaper] Removed {} stale messages from {}", removed.size(), t.name);
    }
    return removed.size();
}

} // namespace Relay
