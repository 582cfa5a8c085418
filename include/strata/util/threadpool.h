// STRATA - Thread Pool
// Copyright (c) 2024 STRATA Developers
// MIT License
//
// Fixed-size worker pool with a bounded FIFO queue. Results and exceptions
// are delivered through std::future.

#ifndef STRATA_UTIL_THREADPOOL_H
#define STRATA_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace strata {
namespace util {

/**
 * A thread pool for executing tasks asynchronously.
 *
 * Tasks must not block on other tasks of the same pool. Shutdown() lets
 * queued tasks finish before joining the workers.
 */
class ThreadPool {
public:
    struct Config {
        size_t numThreads{0};        // 0 = hardware concurrency
        size_t maxQueueSize{10000};  // Submit throws once this many are pending
        std::string name{"pool"};
    };

    ThreadPool();
    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Drains the queue and joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is empty and no task is executing
    void WaitAll();

    /// Stop accepting tasks, run what is queued, join workers
    void Shutdown();

    bool IsRunning() const { return running_.load(); }
    size_t ThreadCount() const { return workers_.size(); }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return activeTasks_.load(); }
    const std::string& Name() const { return config_.name; }

    /**
     * Submit a callable for execution.
     * @return Future for the result; an exception thrown by the task is
     *         rethrown from future::get()
     * @throws std::runtime_error if the pool is shut down or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        using ReturnType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load()) {
                throw std::runtime_error("ThreadPool " + config_.name + " not running");
            }
            if (tasks_.size() >= config_.maxQueueSize) {
                throw std::runtime_error("ThreadPool " + config_.name + " queue full");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable idleCondition_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};

    void Start();
    void WorkerLoop();
};

} // namespace util
} // namespace strata

#endif // STRATA_UTIL_THREADPOOL_H
