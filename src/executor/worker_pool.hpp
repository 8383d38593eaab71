/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool with cooperative cancellation.
 *
 * Unlike a plain thread pool, shutdown() does not drop queued work: every
 * accepted task runs, with its stop_token already signalled, so it can
 * resolve itself quickly instead of silently disappearing.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace sandbox_exec {

class WorkerPool {
public:
    using Task = std::function<void(std::stop_token)>;

    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue a fire-and-forget task. Returns false once shutdown() has begun.
    bool post(Task task);

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Signal stop, run what is still queued, and join all workers. Idempotent.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    bool accepting_{true};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    return submit_cancellable([f = std::forward<F>(func)](std::stop_token) mutable {
        return f();
    });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> WorkerPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    bool accepted = post([p = promise, f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });

    if (!accepted) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("WorkerPool is shut down")));
    }
    return future;
}

}  // namespace sandbox_exec
