#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace Relay {

/**
 * @class ThreadPool
 * @brief Fixed-size pool that runs external send calls for the workers.
 *
 * Workers hand the send call to the pool and wait on a future with a
 * deadline, so a hung remote call cannot block a worker past its timeout.
 * An abandoned call keeps its pool thread until it returns.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    // Returns false once shutdown() has been called
    bool submit(std::function<void()> task);

    size_t getPendingTasks() const;
    size_t size() const { return workers.size(); }

    // Stop accepting tasks, drain the queue and join all threads
    void shutdown();

private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace Relay
