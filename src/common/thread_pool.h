#pragma once

/// @file thread_pool.h
/// @brief Fixed-size worker pool used for per-feature test evaluation

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace driftwatch {

/// @brief Runs independent feature tests on a fixed set of worker threads
///
/// Tasks start in submission order. Queued work is drained before the
/// destructor returns.
class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0: hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue a callable and return a future for its result
    ///
    /// An exception thrown by the callable is rethrown from the future.
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Run every task and collect the results in input order
    template <typename R>
    std::vector<R> RunInOrder(const std::vector<std::function<R()>>& tasks);

    size_t Size() const { return workers_.size(); }

private:
    void Enqueue(std::function<void()> job);
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;

    std::mutex mutex_;
    std::condition_variable work_available_;
    bool shutting_down_ = false;
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using Result = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<Result()>>(
        [f = std::forward<F>(f), ... args = std::forward<Args>(args)]() mutable {
            return std::invoke(f, args...);
        });
    std::future<Result> future = task->get_future();
    Enqueue([task]() { (*task)(); });
    return future;
}

template <typename R>
std::vector<R> ThreadPool::RunInOrder(const std::vector<std::function<R()>>& tasks) {
    std::vector<std::future<R>> futures;
    futures.reserve(tasks.size());
    for (const auto& task : tasks) {
        futures.push_back(Submit(task));
    }

    std::vector<R> results;
    results.reserve(futures.size());
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace driftwatch
