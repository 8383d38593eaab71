/**
 * @file cancellation_manager.cpp
 * @brief CancellationManager implementation.
 */

#include "cancellation/cancellation_manager.hpp"

#include <csignal>

namespace sandbox_exec {

CancellationManager::CancellationManager(ExecutionRegistry& registry, Logger logger)
    : registry_(registry)
    , logger_(std::move(logger)) {}

std::stop_token CancellationManager::attach(const ExecutionId& id) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[id];
    return entry.source.get_token();
}

void CancellationManager::bind_sandbox(const ExecutionId& id, SandboxHandle* handle) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) it->second.sandbox = handle;
}

void CancellationManager::unbind_sandbox(const ExecutionId& id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end()) it->second.sandbox = nullptr;
}

void CancellationManager::detach(const ExecutionId& id) {
    std::lock_guard lock(mutex_);
    entries_.erase(id);
}

void CancellationManager::interrupt(const ExecutionId& id, bool signal_sandbox) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return;

    // The handle stays valid while bound; unbind takes the same lock.
    if (signal_sandbox && it->second.sandbox) {
        it->second.sandbox->kill(SIGTERM);
    }
    it->second.source.request_stop();
}

Result<CancelOutcome> CancellationManager::cancel(const ExecutionId& id) {
    // Bounded: each pass either claims or observes a state strictly later
    // than the previous one (Queued → Running → terminal).
    for (int attempt = 0; attempt < 3; ++attempt) {
        auto status = registry_.status_of(id);
        if (!status) {
            return make_error<CancelOutcome>(ErrorKind::NotFound, "Unknown execution: " + id);
        }

        if (is_terminal(*status)) break;

        const bool running = *status == ExecutionStatus::Running;
        Completion completion{
            .status = ExecutionStatus::Cancelled,
            .exit_code = std::nullopt,
            .term_signal = std::nullopt,
            .error_kind = ErrorKind::Cancelled,
            .error_message = running ? "Cancelled while running" : "Cancelled while queued"
        };

        if (registry_.finish(id, std::move(completion))) {
            interrupt(id, running);
            logger_.info("Cancelled " + id + (running ? " (running)" : " (queued)"));

            auto snap = registry_.snapshot(id);
            if (!snap) return snap.error();
            return CancelOutcome{std::move(*snap), false};
        }
    }

    auto snap = registry_.snapshot(id);
    if (!snap) return snap.error();
    logger_.debug("Cancel of " + id + " found it already "
                  + std::string(to_string(snap->status)));
    return CancelOutcome{std::move(*snap), true};
}

size_t CancellationManager::cancel_all() {
    size_t claimed = 0;
    for (const auto& id : registry_.active_ids()) {
        auto outcome = cancel(id);
        if (outcome && !outcome->already_terminal) ++claimed;
    }
    return claimed;
}

size_t CancellationManager::tracked() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace sandbox_exec
