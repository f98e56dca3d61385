#include <relay/core/dispatch/dispatch_stats.hpp>
#include <spdlog/spdlog.h>

namespace Relay {

void finalizeRates(DispatchStats& stats) {
    const auto& t = stats.totals;
    stats.success_rate_pct = t.enqueued > 0
        ? static_cast<double>(t.processed) * 100.0 / static_cast<double>(t.enqueued)
        : 0.0;
    stats.processing_rate = stats.uptime_s > 0
        ? static_cast<double>(t.processed) / static_cast<double>(stats.uptime_s)
        : 0.0;
}

bool isHealthy(const TargetStats& t) {
    return !t.target.circuit_open && !t.target.rate_limited
        && t.target.metrics.consecutive_failures < 3;
}

void logReport(const DispatchStats& stats, const char* title) {
    bool all_healthy = true;
    for (const auto& t : stats.targets) {
        if (!isHealthy(t)) all_healthy = false;
    }
    auto level = all_healthy ? spdlog::level::info : spdlog::level::warn;

    spdlog::log(level, "╔══════════════════════════════════════════════════════════════════════════╗");
    spdlog::log(level, "║ {:^72} ║", title);
    spdlog::log(level, "╠══════════════════════════════════════════════════════════════════════════╣");

    int healthy = 0;
    for (const auto& t : stats.targets) {
        const auto& s = t.target;
        const char* mark = isHealthy(t) ? "✓" : "✗";
        if (isHealthy(t)) healthy++;
        spdlog::log(level, "║ [{}] {:12} │ Q: {:5} │ Proc: {:7} │ OK: {:5.1f}% │ {:5.2f}s │ Fail: {:2} ║",
                    mark, s.name, s.queued, s.metrics.messages_processed,
                    s.metrics.success_rate * 100.0, s.metrics.avg_processing_time_s,
                    s.metrics.consecutive_failures);
        spdlog::log(level, "║     {:12} │ {:10} │ {:4.1f}/s burst {:2} │ {}{}  restarts {:<3}      ║",
                    "", toString(t.worker.state), s.limits.messages_per_second, s.limits.burst_limit,
                    s.circuit_open ? "CIRCUIT OPEN " : "",
                    s.rate_limited ? "RATE LIMITED" : "", t.worker.restarts);
    }

    const auto& tot = stats.totals;
    spdlog::log(level, "╠══════════════════════════════════════════════════════════════════════════╣");
    spdlog::log(level, "║ State: {:9} │ Strategy: {:12} │ Adaptive: {:3} │ Uptime: {:6}s  ║",
                DispatchStateManager::toString(stats.state), toString(stats.strategy),
                stats.adaptive_enabled ? "on" : "off", stats.uptime_s);
    spdlog::log(level, "║ Enqueued: {:8} │ Delivered: {:8} │ Failed: {:6} │ Pending: {:6} ║",
                tot.enqueued, tot.processed, tot.failed, tot.pending);
    spdlog::log(level, "║ Rejected: {:8} │ Expired: {:6} │ Requeued: {:6} │ Rebalanced: {:6} ║",
                tot.rejected, tot.expired, tot.requeued, tot.rebalanced);
    spdlog::log(level, "║ Success: {:5.1f}% │ Rate: {:6.2f} msg/s │ p50 {:7}us │ p99 {:8}us   ║",
                stats.success_rate_pct, stats.processing_rate,
                stats.latency_p50_us, stats.latency_p99_us);
    spdlog::log(level, "║ AGGREGATE: {} OK, {} ALERTS │ Dead letters: {:6}                         ║",
                healthy, static_cast<int>(stats.targets.size()) - healthy, stats.dead_letters);
    spdlog::log(level, "╚══════════════════════════════════════════════════════════════════════════╝");
}

} // namespace Relay
