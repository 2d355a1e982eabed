#pragma once

/// @file thread_pool.h
/// @brief Worker pool used to evaluate independent chunk statistics in parallel

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace driftwatch {

/// @brief Fixed-size thread pool
///
/// Tasks submitted to the pool must only read shared state. Calculators give
/// every task its own output slot, so no locking is needed around results.
class ThreadPool {
public:
    /// @brief Create a thread pool with the specified number of threads
    /// @param num_threads Number of worker threads (default: hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Destructor - drains the queue and joins all workers
    ~ThreadPool();

    // Non-copyable and non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task for execution
    /// @param f Callable to execute
    /// @param args Arguments to pass to the callable
    /// @return Future containing the result
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    /// @brief Run fn(i) for every i in [0, count) and block until all finished
    ///
    /// Exceptions thrown by a task are rethrown on the calling thread.
    template <typename F>
    void ParallelFor(size_t count, F&& fn);

    /// @brief Get the number of worker threads
    size_t Size() const { return workers_.size(); }

    /// @brief Wait for all submitted tasks to complete
    void Wait();

    /// @brief Check if the pool is stopped
    bool IsStopped() const { return stop_.load(std::memory_order_acquire); }

private:
    void WorkerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
};

// Template implementations

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

template <typename F>
void ThreadPool::ParallelFor(size_t count, F&& fn) {
    std::vector<std::future<void>> futures;
    futures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        futures.push_back(Submit([&fn, i]() { fn(i); }));
    }
    // Every task references fn, so all of them must finish before rethrowing
    std::exception_ptr first_error;
    for (auto& future : futures) {
        try {
            future.get();
        } catch (...) {
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace driftwatch
