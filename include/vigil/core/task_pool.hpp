#pragma once

/** \file task_pool.hpp
 *  \brief Worker pool for time-boxed backend calls and background tasks.
 *
 * Centralized FIFO task queue. Futures returned by submit() never block in
 * their destructor, so a caller may stop waiting on a slow task and move on;
 * the task still runs to completion on the worker that picked it up.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace vigil::core {

class TaskPool {
public:
    /** \brief Construct pool with specified number of workers.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency / 2)
     */
    explicit TaskPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }

        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~TaskPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /** \brief Submit task to the pool.
     *
     * \param func Callable to execute
     * \return Future for task result
     * \throws std::runtime_error when the pool is stopping
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using return_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::forward<Func>(func));
        auto future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Task pool is stopped");
            }
            // Track pending tasks so wait_all() waits for completion, not just queue drain
            pending_.fetch_add(1, std::memory_order_relaxed);
            tasks_.emplace_back([this, task] {
                (*task)();
                auto rem = pending_.fetch_sub(1, std::memory_order_relaxed) - 1;
                if (rem == 0) {
                    std::unique_lock<std::mutex> lk(queue_mutex_);
                    cv_.notify_all();
                }
            });
        }

        cv_.notify_one();
        return future;
    }

    /** \brief Get number of worker threads. */
    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

    /** \brief Tasks submitted but not yet finished. */
    [[nodiscard]] auto pending() const noexcept -> std::size_t {
        return pending_.load(std::memory_order_relaxed);
    }

    /** \brief Request cooperative stop. New submissions fail; workers exit when the queue drains. */
    auto request_stop() noexcept -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_.store(true, std::memory_order_relaxed);
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto stopping() const noexcept -> bool { return stop_.load(std::memory_order_relaxed); }

    /** \brief Wait for all submitted tasks to complete. */
    auto wait_all() -> void {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this] { return pending_.load(std::memory_order_relaxed) == 0; });
    }

private:
    auto worker_loop() -> void {
        #if defined(__linux__)
          pthread_setname_np(pthread_self(), "vigil-worker");
        #endif
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
            }

            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<std::size_t> pending_{0};
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_;
};

} // namespace vigil::core
