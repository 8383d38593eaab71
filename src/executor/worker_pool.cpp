/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

namespace sandbox_exec {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::post(Task task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return false;
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Drain before exiting: queued tasks still run, seeing stop requested.
            if (task_queue_.empty()) return;

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        ++active_tasks_;
        task(stop);
        --active_tasks_;
    }
}

size_t WorkerPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t WorkerPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace sandbox_exec
