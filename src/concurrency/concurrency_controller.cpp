/**
 * @file concurrency_controller.cpp
 * @brief ConcurrencyController, Ticket and PendingAdmission implementation.
 */

#include "concurrency/concurrency_controller.hpp"

#include <algorithm>
#include <utility>

namespace sandbox_exec {

// ── Ticket ───────────────────────────────────

Ticket& Ticket::operator=(Ticket&& other) noexcept {
    if (this != &other) {
        release();
        controller_ = other.controller_;
        other.controller_ = nullptr;
    }
    return *this;
}

void Ticket::release() noexcept {
    if (controller_) {
        controller_->release_slot();
        controller_ = nullptr;
    }
}

// ── PendingAdmission ─────────────────────────

PendingAdmission::PendingAdmission(PendingAdmission&& other) noexcept
    : controller_(other.controller_)
    , waiter_(std::move(other.waiter_))
    , immediate_(other.immediate_) {
    other.controller_ = nullptr;
}

PendingAdmission& PendingAdmission::operator=(PendingAdmission&& other) noexcept {
    if (this != &other) {
        abandon();
        controller_ = other.controller_;
        waiter_ = std::move(other.waiter_);
        immediate_ = other.immediate_;
        other.controller_ = nullptr;
    }
    return *this;
}

Result<Ticket> PendingAdmission::wait(std::stop_token stop) {
    if (!controller_ || !waiter_) {
        return Error{ErrorKind::Internal, "Admission already consumed"};
    }
    auto* controller = std::exchange(controller_, nullptr);
    auto waiter = std::move(waiter_);
    return controller->wait_for(waiter, std::move(stop));
}

void PendingAdmission::abandon() noexcept {
    if (controller_ && waiter_) {
        controller_->cancel_waiter(waiter_);
    }
    controller_ = nullptr;
    waiter_.reset();
}

// ── ConcurrencyController ────────────────────

ConcurrencyController::ConcurrencyController(size_t max_concurrent, size_t max_queue_depth)
    : max_concurrent_(std::max<size_t>(max_concurrent, 1))
    , max_queue_depth_(max_queue_depth) {}

Result<PendingAdmission> ConcurrencyController::request() {
    std::lock_guard lock(mutex_);
    auto waiter = std::make_shared<Waiter>();

    if (active_ < max_concurrent_ && waiters_.empty()) {
        ++active_;
        waiter->granted = true;
        return PendingAdmission(this, std::move(waiter), true);
    }
    if (waiters_.size() < max_queue_depth_) {
        waiters_.push_back(waiter);
        return PendingAdmission(this, std::move(waiter), false);
    }
    return Error{ErrorKind::ResourceExhausted,
                 "All " + std::to_string(max_concurrent_) + " slots busy and "
                 + std::to_string(max_queue_depth_) + " waiters queued"};
}

Result<Ticket> ConcurrencyController::admit(std::stop_token stop) {
    auto pending = request();
    if (!pending) {
        return pending.error();
    }
    return pending->wait(std::move(stop));
}

Result<Ticket> ConcurrencyController::wait_for(const std::shared_ptr<Waiter>& waiter,
                                               std::stop_token stop) {
    std::unique_lock lock(mutex_);
    if (cv_.wait(lock, stop, [&waiter] { return waiter->granted; })) {
        return Ticket(this);
    }

    // Stopped before the hand-off reached us: leave the queue.
    auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
    if (it != waiters_.end()) waiters_.erase(it);
    return Error{ErrorKind::Cancelled, "Admission wait cancelled"};
}

void ConcurrencyController::release_slot() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (!waiters_.empty()) {
            // Hand the slot straight to the oldest waiter; active_ is unchanged.
            waiters_.front()->granted = true;
            waiters_.pop_front();
        } else if (active_ > 0) {
            --active_;
        }
    }
    cv_.notify_all();
}

void ConcurrencyController::cancel_waiter(const std::shared_ptr<Waiter>& waiter) noexcept {
    bool held_slot = false;
    {
        std::lock_guard lock(mutex_);
        if (waiter->granted) {
            held_slot = true;
        } else {
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end()) waiters_.erase(it);
        }
    }
    if (held_slot) release_slot();
}

size_t ConcurrencyController::active_count() const {
    std::lock_guard lock(mutex_);
    return active_;
}

size_t ConcurrencyController::queue_depth() const {
    std::lock_guard lock(mutex_);
    return waiters_.size();
}

}  // namespace sandbox_exec
