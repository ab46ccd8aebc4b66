#pragma once
#include <vector>
#include <thread>
#include <atomic>
#include <queue>
#include <functional>
#include <condition_variable>
#include <mutex>

namespace FlightLock {

class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once the pool is shut down
    void submit(std::function<void()> task);
    size_t getPendingTasks() const;
    size_t size() const { return workers.size(); }

    // Drains queued tasks, then joins workers. Idempotent.
    void shutdown();
private:
    void workerLoop();

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;  // mutable for const getPendingTasks
    std::condition_variable condition;
    std::atomic<bool> isRunning;
};

} // namespace FlightLock
