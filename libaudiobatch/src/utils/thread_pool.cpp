#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
    Logger::log(LogLevel::Debug, "Thread pool started with " + std::to_string(threads) + " workers", "pool");
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        std::function<void(std::stop_token)> task;
        {
            std::unique_lock lock(queue_mutex_);
            condition_.wait(lock, st, [this] {
                return stop_ || !tasks_.empty();
            });
            if ((stop_ && tasks_.empty()) || st.stop_requested())
                return;
            if (tasks_.empty())
                continue;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }
        struct PendingGuard {
            ThreadPool& pool;
            ~PendingGuard() {
                std::lock_guard lock(pool.queue_mutex_);
                if (pool.active_ > 0) --pool.active_;
                if (pool.pending_ > 0) --pool.pending_;
                pool.idle_cv_.notify_all();
            }
        } guard{*this};
        try {
            task(st);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(), "pool");
        }
    }
}

std::size_t ThreadPool::request_stop() {
    std::size_t discarded = 0;
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
            ++discarded;
            if (pending_ > 0) {
                --pending_;
            }
        }
    }
    idle_cv_.notify_all();
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    return discarded;
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 && tasks_.empty();
    });
}

std::size_t ThreadPool::active() const {
    std::lock_guard lock(queue_mutex_);
    return active_;
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}
