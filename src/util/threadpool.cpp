// VEIL - Thread Pool
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/util/threadpool.h"

namespace veil {
namespace util {

ThreadPool::ThreadPool(size_t numThreads)
    : threadCount_(numThreads != 0 ? numThreads
                                   : std::max<size_t>(2, std::thread::hardware_concurrency())) {
    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("ThreadPool is shut down");
        }
        queue_.push_back(std::move(job));
    }
    hasWork_.notify_one();
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && busy_ == 0; });
}

void ThreadPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    hasWork_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
    workers_.clear();
}

bool ThreadPool::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void ThreadPool::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        hasWork_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            return;
        }
        std::function<void()> job = std::move(queue_.front());
        queue_.pop_front();
        ++busy_;

        lock.unlock();
        // Jobs wrap packaged_tasks, so failures land in their futures
        job();
        lock.lock();

        if (--busy_ == 0 && queue_.empty()) {
            idle_.notify_all();
        }
    }
}

} // namespace util
} // namespace veil
