// STRATA - Thread Pool Implementation
// Copyright (c) 2024 STRATA Developers
// MIT License

#include "strata/util/threadpool.h"

namespace strata {
namespace util {

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    Start();
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }

    running_.store(true);
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::WaitAll() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            if (tasks_.empty()) {
                // Not running and nothing left to drain
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            activeTasks_.fetch_add(1);
        }

        // packaged_task stores any exception in the future
        task();

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        idleCondition_.notify_all();
    }
}

} // namespace util
} // namespace strata
