/**
 * @file concurrency_controller.hpp
 * @brief Bounded slot pool with a fail-fast FIFO wait queue.
 *
 * The single admission point of the engine: N slots, at most M waiters.
 * Slots are handed over directly from a releasing Ticket to the oldest
 * waiter, so a newcomer can never overtake the queue.
 */

#pragma once

#include "core/result.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>

namespace sandbox_exec {

class ConcurrencyController;

/**
 * @brief One held concurrency slot. Move-only; frees the slot on destruction.
 */
class Ticket {
public:
    Ticket() = default;
    ~Ticket() { release(); }

    Ticket(const Ticket&) = delete;
    Ticket& operator=(const Ticket&) = delete;
    Ticket(Ticket&& other) noexcept : controller_(other.controller_) { other.controller_ = nullptr; }
    Ticket& operator=(Ticket&& other) noexcept;

    /// Free the slot now; later calls are no-ops.
    void release() noexcept;

    [[nodiscard]] bool valid() const noexcept { return controller_ != nullptr; }

private:
    friend class ConcurrencyController;
    explicit Ticket(ConcurrencyController* controller) : controller_(controller) {}

    ConcurrencyController* controller_{nullptr};
};

/**
 * @brief A queue position (or an immediately granted slot) awaiting wait().
 *
 * Dropping an un-waited admission gives its position or slot back.
 */
class PendingAdmission {
public:
    PendingAdmission() = default;
    ~PendingAdmission() { abandon(); }

    PendingAdmission(const PendingAdmission&) = delete;
    PendingAdmission& operator=(const PendingAdmission&) = delete;
    PendingAdmission(PendingAdmission&& other) noexcept;
    PendingAdmission& operator=(PendingAdmission&& other) noexcept;

    /**
     * @brief Block until the slot is granted or @p stop is requested.
     *
     * Returns ErrorKind::Cancelled if stopped first; the queue position is
     * then given up. May be called once.
     */
    Result<Ticket> wait(std::stop_token stop = {});

    /// True if the slot was granted without queueing.
    [[nodiscard]] bool granted_immediately() const noexcept { return immediate_; }

private:
    friend class ConcurrencyController;
    struct Waiter {
        bool granted{false};
    };

    PendingAdmission(ConcurrencyController* controller, std::shared_ptr<Waiter> waiter, bool immediate)
        : controller_(controller), waiter_(std::move(waiter)), immediate_(immediate) {}

    void abandon() noexcept;

    ConcurrencyController* controller_{nullptr};
    std::shared_ptr<Waiter> waiter_;
    bool immediate_{false};
};

class ConcurrencyController {
public:
    ConcurrencyController(size_t max_concurrent, size_t max_queue_depth);
    ~ConcurrencyController() = default;

    ConcurrencyController(const ConcurrencyController&) = delete;
    ConcurrencyController& operator=(const ConcurrencyController&) = delete;

    /**
     * @brief Reserve a slot or a queue position without blocking.
     *
     * Fails with ResourceExhausted when all slots are busy and the wait queue
     * already holds max_queue_depth waiters.
     */
    Result<PendingAdmission> request();

    /// request() followed by wait(): blocks while queued.
    Result<Ticket> admit(std::stop_token stop = {});

    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] size_t queue_depth() const;
    [[nodiscard]] size_t capacity() const noexcept { return max_concurrent_; }
    [[nodiscard]] size_t queue_capacity() const noexcept { return max_queue_depth_; }

private:
    friend class Ticket;
    friend class PendingAdmission;
    using Waiter = PendingAdmission::Waiter;

    void release_slot() noexcept;
    void cancel_waiter(const std::shared_ptr<Waiter>& waiter) noexcept;
    Result<Ticket> wait_for(const std::shared_ptr<Waiter>& waiter, std::stop_token stop);

    const size_t max_concurrent_;
    const size_t max_queue_depth_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    size_t active_{0};
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

}  // namespace sandbox_exec
