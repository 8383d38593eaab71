/**
 * @file mock_sandbox.cpp
 * @brief MockSandboxManager implementation.
 */

#include "sandbox/mock_sandbox.hpp"

#include <algorithm>
#include <csignal>

namespace sandbox_exec {

// ── MockSandboxHandle ────────────────────────

MockSandboxHandle::MockSandboxHandle(pid_t pid, SandboxScript script,
                                     std::shared_ptr<MockSignalLog> signals)
    : pid_(pid)
    , script_(std::move(script))
    , started_(std::chrono::steady_clock::now())
    , workspace_("/mock/sandbox/" + std::to_string(pid))
    , signals_(std::move(signals)) {}

void MockSandboxHandle::settle_locked() {
    if (exit_ || script_.hang) return;
    if (std::chrono::steady_clock::now() >= started_ + script_.run_time) {
        exit_ = ExitStatus{script_.exit_code, std::nullopt, script_.usage};
    }
}

bool MockSandboxHandle::read_output(Duration wait, const OutputSink& sink) {
    std::unique_lock lock(mutex_);
    if (!output_sent_) {
        output_sent_ = true;
        if (!script_.output.empty()) {
            lock.unlock();
            sink(script_.output);
            return true;
        }
    }

    settle_locked();
    if (exit_) return false;

    auto until = std::chrono::steady_clock::now() + wait;
    if (!script_.hang) until = std::min(until, started_ + script_.run_time);
    cv_.wait_until(lock, until, [this] { return exit_.has_value(); });
    settle_locked();
    return true;
}

std::optional<ExitStatus> MockSandboxHandle::try_wait() {
    std::lock_guard lock(mutex_);
    settle_locked();
    return exit_;
}

ExitStatus MockSandboxHandle::wait() {
    std::unique_lock lock(mutex_);
    if (script_.hang) {
        cv_.wait(lock, [this] { return exit_.has_value(); });
    } else {
        cv_.wait_until(lock, started_ + script_.run_time, [this] { return exit_.has_value(); });
        settle_locked();
    }
    return *exit_;
}

void MockSandboxHandle::kill(int signal) noexcept {
    {
        std::lock_guard lock(mutex_);
        if (signal == SIGTERM) signals_->sigterm.fetch_add(1);
        if (signal == SIGKILL) signals_->sigkill.fetch_add(1);

        settle_locked();
        if (exit_ || released_) return;
        if (signal == SIGTERM && script_.ignore_sigterm) return;
        exit_ = ExitStatus{128 + signal, signal, script_.usage};
    }
    cv_.notify_all();
}

bool MockSandboxHandle::mark_released() noexcept {
    {
        std::lock_guard lock(mutex_);
        if (released_) return false;
        if (!exit_) exit_ = ExitStatus{128 + SIGKILL, SIGKILL, script_.usage};
        released_ = true;
    }
    cv_.notify_all();
    return true;
}

// ── MockSandboxManager ───────────────────────

MockSandboxManager::MockSandboxManager(SandboxScript default_script)
    : default_script_(std::move(default_script))
    , signals_(std::make_shared<MockSignalLog>()) {}

Result<std::unique_ptr<SandboxHandle>> MockSandboxManager::acquire(const SandboxSpec& spec) {
    SandboxScript script;
    {
        std::lock_guard lock(mutex_);
        auto it = scripts_.find(spec.code);
        script = it != scripts_.end() ? it->second : default_script_;
    }
    if (script.acquire_error) {
        return Error{ErrorKind::InternalSandboxError, *script.acquire_error};
    }

    acquired_.fetch_add(1);
    size_t now = active_.fetch_add(1) + 1;
    size_t peak = peak_.load();
    while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}

    return std::unique_ptr<SandboxHandle>(
        std::make_unique<MockSandboxHandle>(next_pid_.fetch_add(1), std::move(script), signals_));
}

void MockSandboxManager::release(SandboxHandle& handle) noexcept {
    auto* mock = dynamic_cast<MockSandboxHandle*>(&handle);
    if (mock && mock->mark_released()) {
        active_.fetch_sub(1);
    }
}

Result<void> MockSandboxManager::check_ready() const {
    std::lock_guard lock(mutex_);
    if (ready_error_) return Error{ErrorKind::InternalSandboxError, *ready_error_};
    return Result<void>{};
}

bool MockSandboxManager::runtime_available(const LanguageAdapter& adapter) const {
    std::lock_guard lock(mutex_);
    return !missing_runtimes_.contains(adapter.name);
}

void MockSandboxManager::set_default_script(SandboxScript script) {
    std::lock_guard lock(mutex_);
    default_script_ = std::move(script);
}

void MockSandboxManager::set_script(const std::string& code, SandboxScript script) {
    std::lock_guard lock(mutex_);
    scripts_[code] = std::move(script);
}

void MockSandboxManager::set_ready_error(std::optional<std::string> error) {
    std::lock_guard lock(mutex_);
    ready_error_ = std::move(error);
}

void MockSandboxManager::set_runtime_missing(const LanguageName& language) {
    std::lock_guard lock(mutex_);
    missing_runtimes_.insert(language);
}

}  // namespace sandbox_exec
