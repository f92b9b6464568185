/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool with cooperative cancellation.
 *
 * The pool size is the run's concurrency cap: each worker runs one
 * conversion (one blocking wait on one transcoder process) at a time.
 */

#ifndef AUDIOBATCH_THREAD_POOL_HPP
#define AUDIOBATCH_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread instances. Each task receives the stop
 * token of the worker running it, so request_stop() reaches tasks that are
 * already executing (the transcoder invocation polls it) as well as
 * discarding the ones still queued.
 */
class ThreadPool {
public:
    /**
     * @brief Constructs the thread pool and starts worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    /**
     * @brief Stops the workers and joins them. Tasks still queued are dropped.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task accepting a `std::stop_token`.
     * @return A future for the task's result. Discarded tasks leave the
     * future with a broken promise.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks until every enqueued task has finished or been discarded.
     */
    void wait_idle();

    /**
     * @brief Stops accepting work, discards queued tasks and signals the
     * stop token of running ones.
     * @return Number of queued tasks that were discarded.
     */
    std::size_t request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

    /// @return Tasks currently executing on a worker.
    [[nodiscard]] std::size_t active() const;

private:
    void worker_loop(const std::stop_token& st);

    mutable std::mutex queue_mutex_;        ///< Protects tasks_, stop_, pending_ and active_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies wait_idle() when pending_ reaches zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::size_t pending_{0};                ///< Tasks enqueued or running
    std::size_t active_{0};                 ///< Tasks running
    std::vector<std::jthread> workers_;
};

#endif // AUDIOBATCH_THREAD_POOL_HPP
