#pragma once

/// @file include/icscore/thread_pool.hpp
/// @brief Fixed-size worker pool used to score tickers and backtest periods
///        in parallel.
///
/// Tasks are queued under a mutex and picked up by `size()` workers waiting
/// on a condition variable.  `submit()` returns a `std::future`; an exception
/// thrown by a task is stored in its future and rethrown by `get()`.
///
/// The destructor drains the queue and joins every worker.

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace icscore {

class ThreadPool {
public:
    /// Start `threads` workers; 0 means hardware concurrency (at least 1).
    explicit ThreadPool(std::size_t threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue `fn` and return a future for its result.
    template <typename Fn>
    [[nodiscard]] auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("ThreadPool: submit after shutdown");
            }
            queue_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    bool                              stopping_ = false;
};

}  // namespace icscore
