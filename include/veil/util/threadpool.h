// VEIL - Thread Pool
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Fixed-size worker pool with future-based result retrieval. Used for the
// data-parallel parts of the coinbase puzzle. Exceptions thrown by a task
// surface from its future.

#ifndef VEIL_UTIL_THREADPOOL_H
#define VEIL_UTIL_THREADPOOL_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

namespace veil {
namespace util {

class ThreadPool {
public:
    /// numThreads == 0 picks the hardware concurrency
    explicit ThreadPool(size_t numThreads = 0);

    /// Runs the remaining queue and joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Block until the queue is empty and no task is running
    void Wait();

    /// Stop accepting tasks; queued tasks still run before the workers exit
    void Shutdown();

    bool IsRunning() const;
    size_t ThreadCount() const { return threadCount_; }
    size_t PendingTasks() const;

    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(fn, std::move(bound));
            });
        std::future<R> result = task->get_future();
        Enqueue([task]() { (*task)(); });
        return result;
    }

private:
    size_t threadCount_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    size_t busy_{0};
    bool stopping_{false};

    mutable std::mutex mutex_;
    std::condition_variable hasWork_;
    std::condition_variable idle_;

    void Enqueue(std::function<void()> job);
    void WorkerLoop();
};

/// Split [begin, begin + count) into at most ThreadCount() contiguous chunks
/// and run fn(first, last) for each. Futures come back in range order.
template<typename Func>
auto MapChunks(uint64_t begin, uint64_t count, ThreadPool& pool, Func fn)
    -> std::vector<std::future<std::invoke_result_t<Func&, uint64_t, uint64_t>>> {
    std::vector<std::future<std::invoke_result_t<Func&, uint64_t, uint64_t>>> futures;
    if (count == 0) {
        return futures;
    }
    uint64_t parts = std::max<uint64_t>(1, pool.ThreadCount());
    uint64_t chunk = (count + parts - 1) / parts;
    for (uint64_t offset = 0; offset < count; offset += chunk) {
        uint64_t first = begin + offset;
        uint64_t last = begin + std::min(count, offset + chunk);
        futures.push_back(pool.Submit(fn, first, last));
    }
    return futures;
}

} // namespace util
} // namespace veil

#endif // VEIL_UTIL_THREADPOOL_H
