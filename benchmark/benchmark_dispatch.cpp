// ============================================================================
// BENCHMARK: DISPATCH ENGINE THROUGHPUT
// ============================================================================
// Test scenarios:
// 1. Submit + dequeue on the queue manager (single thread, no sends)
// 2. Concurrent submit from several producer threads
// 3. End to end through the engine with a no-op send function
// ============================================================================

#include <relay/core/dispatch/dispatch_engine.hpp>
#include <relay/core/utils/clock.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace Relay;

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
    double ops_per_sec;
    double ns_per_op;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    std::cout << std::left << std::setw(30) << r.name
              << std::right << std::setw(12) << r.total_ops << " ops"
              << std::setw(14) << std::fixed << std::setprecision(0) << r.ops_per_sec << " ops/s"
              << std::setw(10) << std::setprecision(1) << r.ns_per_op << " ns/op"
              << std::endl;
}

BenchmarkResult make_result(const std::string& name, uint64_t ops,
                            std::chrono::steady_clock::time_point start) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    uint64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
    BenchmarkResult r;
    r.name = name;
    r.total_ops = ops;
    r.elapsed_ns = ns;
    r.ops_per_sec = ns > 0 ? static_cast<double>(ops) * 1e9 / static_cast<double>(ns) : 0.0;
    r.ns_per_op = ops > 0 ? static_cast<double>(ns) / static_cast<double>(ops) : 0.0;
    return r;
}

// Limits high enough that the rate limiter never defers
DispatchConfig benchConfig(size_t targets) {
    DispatchConfig config;
    for (size_t i = 0; i < targets; ++i) {
        TargetConfig t;
        t.name = "bench-" + std::to_string(i);
        t.burst_limit = 1000000;
        config.targets.push_back(t);
    }
    config.rate.tracker_capacity = 1000000;
    config.queue.max_queue_size = 2000000;
    config.resilience.jitter_max_ms = 0;
    config.workers.idle_poll_ms = 1;
    return config;
}

struct QueueBench {
    DispatchConfig config;
    DispatchStateManager state;
    TargetRegistry registry;
    SelectionEngine selection;
    CircuitBreaker breaker;
    DeadLetterQueue dead_letters;
    QueueManager queues;

    explicit QueueBench(DispatchConfig c, SelectionStrategy strategy)
        : config(std::move(c)),
          registry(config.targets, config.rate),
          selection(registry, strategy),
          breaker(config.resilience),
          dead_letters(config.maintenance.dead_letter_capacity),
          queues(config, registry, selection, breaker, dead_letters, state) {}
};

// ============================================================================
// SCENARIO 1: SUBMIT + DEQUEUE
// ============================================================================

void bench_submit_dequeue(SelectionStrategy strategy, uint64_t count) {
    QueueBench bench(benchConfig(4), strategy);
    const uint64_t now = Clock::now_ms();

    auto start = std::chrono::steady_clock::now();
    uint64_t accepted = 0;
    for (uint64_t i = 0; i < count; ++i) {
        Payload p;
        p.id = i;
        SubmitHints hints;
        hints.is_reply = (i % 7 == 0);
        hints.text_length = static_cast<size_t>(i % 1500);
        if (bench.queues.submit(std::move(p), hints, now)) {
            accepted++;
        }
    }
    print_result(make_result(std::string("submit ") + toString(strategy), accepted, start));

    start = std::chrono::steady_clock::now();
    uint64_t dequeued = 0;
    for (TargetId id = 0; id < bench.registry.size(); ++id) {
        while (true) {
            auto r = bench.queues.dequeue(id, now);
            if (r.status != DequeueStatus::ITEM) break;
            bench.queues.ack(r.item, true, 0.001, ErrorKind::NONE, now);
            dequeued++;
        }
    }
    print_result(make_result(std::string("dequeue+ack ") + toString(strategy), dequeued, start));
}

// ============================================================================
// SCENARIO 2: CONCURRENT SUBMIT
// ============================================================================

void bench_concurrent_submit(size_t producers, uint64_t per_producer) {
    QueueBench bench(benchConfig(4), SelectionStrategy::SMART);
    std::atomic<uint64_t> accepted{0};

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    for (size_t t = 0; t < producers; ++t) {
        threads.emplace_back([&bench, &accepted, t, per_producer]() {
            for (uint64_t i = 0; i < per_producer; ++i) {
                Payload p;
                p.id = t * per_producer + i;
                if (bench.queues.submit(std::move(p), {}, Clock::now_ms())) {
                    accepted.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    print_result(make_result("submit x" + std::to_string(producers) + " threads",
                             accepted.load(), start));
}

// ============================================================================
// SCENARIO 3: END TO END
// ============================================================================

void bench_engine(uint64_t count) {
    std::atomic<uint64_t> sent{0};
    DispatchEngine engine(benchConfig(4), [&sent](TargetId, const Payload&) {
        sent.fetch_add(1, std::memory_order_relaxed);
        return SendResult::success();
    });
    engine.start();

    auto start = std::chrono::steady_clock::now();
    uint64_t accepted = 0;
    for (uint64_t i = 0; i < count; ++i) {
        Payload p;
        p.id = i;
        if (engine.submit(std::move(p))) {
            accepted++;
        }
    }
    bool idle = engine.waitUntilIdle(std::chrono::seconds(60));
    print_result(make_result("engine end-to-end", sent.load(), start));
    engine.stop();

    auto stats = engine.stats();
    std::cout << "  delivered " << stats.totals.processed << "/" << accepted
              << (idle ? "" : " (timed out)")
              << ", latency p50 " << stats.latency_p50_us << "us"
              << ", p99 " << stats.latency_p99_us << "us" << std::endl;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    print_header("QUEUE MANAGER SUBMIT / DEQUEUE (4 targets)");
    bench_submit_dequeue(SelectionStrategy::ROUND_ROBIN, 200000);
    bench_submit_dequeue(SelectionStrategy::LEAST_LOADED, 200000);
    bench_submit_dequeue(SelectionStrategy::SMART, 200000);

    print_header("CONCURRENT SUBMIT");
    bench_concurrent_submit(1, 100000);
    bench_concurrent_submit(4, 100000);
    bench_concurrent_submit(8, 100000);

    print_header("ENGINE END-TO-END (no-op send)");
    bench_engine(20000);

    return 0;
}
