/**
 * @file sandbox.hpp
 * @brief Isolation backend contract: sandbox handles and their manager.
 *
 * Any backend (restricted subprocess, container, VM) must bound CPU,
 * wall-clock, memory and file writes per execution, and must tear the
 * environment down completely in release(). Virtual dispatch is used here
 * because a sandbox is acquired once per execution, far off the hot path.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "language/language_registry.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace sandbox_exec {

/**
 * @brief Everything a backend needs to materialize one sandbox.
 */
struct SandboxSpec {
    ExecutionId execution_id;
    LanguageAdapter adapter;
    std::string code;
    Duration timeout{0};
};

/**
 * @brief How a sandboxed process ended.
 *
 * exit_code follows the shell convention: 128 + signal for signalled exits.
 */
struct ExitStatus {
    int exit_code = 0;
    std::optional<int> term_signal;
    std::optional<ResourceUsage> usage;   ///< Absent when the backend cannot measure it

    [[nodiscard]] bool success() const noexcept { return exit_code == 0 && !term_signal; }

    /// Decode a waitpid() status word.
    [[nodiscard]] static ExitStatus from_wait_status(int status) noexcept;
};

using OutputSink = std::function<void(std::string_view chunk)>;

/**
 * @brief A live sandbox: one supervised process tree plus its private workspace.
 *
 * All members except kill() are called from the owning worker thread only.
 * kill() may be called concurrently (cancellation) until release().
 */
class SandboxHandle {
public:
    virtual ~SandboxHandle() = default;

    [[nodiscard]] virtual pid_t pid() const noexcept = 0;
    [[nodiscard]] virtual const std::filesystem::path& workspace() const noexcept = 0;

    /**
     * @brief Wait up to @p wait for stdout/stderr data and forward it to @p sink.
     * @return false once both streams have reached end-of-file.
     */
    virtual bool read_output(Duration wait, const OutputSink& sink) = 0;

    /// Non-blocking exit check; reaps the process the first time it has exited.
    virtual std::optional<ExitStatus> try_wait() = 0;

    /// Block until the process exits.
    virtual ExitStatus wait() = 0;

    /**
     * @brief Signal the sandboxed program. Safe after exit; a no-op after release.
     *
     * SIGKILL takes down every descendant, including ones that left the
     * program's process group or session.
     */
    virtual void kill(int signal) noexcept = 0;
};

/**
 * @brief Acquires and releases sandboxes.
 */
class ISandboxManager {
public:
    virtual ~ISandboxManager() = default;

    /**
     * @brief Materialize a workspace and start the adapter's run command.
     *
     * Fails with InternalSandboxError; on failure nothing is left behind.
     */
    virtual Result<std::unique_ptr<SandboxHandle>> acquire(const SandboxSpec& spec) = 0;

    /**
     * @brief Kill the process tree, reap it, and delete the workspace.
     *
     * Idempotent. Must never throw: it runs on every exit path.
     */
    virtual void release(SandboxHandle& handle) noexcept = 0;

    [[nodiscard]] virtual size_t active_count() const noexcept = 0;

    /// Backend-level readiness (e.g. workspace root writable).
    [[nodiscard]] virtual Result<void> check_ready() const = 0;

    /// Whether the adapter's runtime can be started by this backend.
    [[nodiscard]] virtual bool runtime_available(const LanguageAdapter& adapter) const = 0;
};

/**
 * @brief Scoped sandbox acquisition: releases the handle on destruction.
 */
class SandboxLease {
public:
    SandboxLease() = default;
    SandboxLease(ISandboxManager& manager, std::unique_ptr<SandboxHandle> handle)
        : manager_(&manager), handle_(std::move(handle)) {}
    ~SandboxLease() { reset(); }

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    SandboxLease(SandboxLease&& other) noexcept
        : manager_(other.manager_), handle_(std::move(other.handle_)) {}

    SandboxLease& operator=(SandboxLease&& other) noexcept {
        if (this != &other) {
            reset();
            manager_ = other.manager_;
            handle_ = std::move(other.handle_);
        }
        return *this;
    }

    /// Release now instead of at scope exit.
    void reset() noexcept {
        if (manager_ && handle_) {
            manager_->release(*handle_);
        }
        handle_.reset();
    }

    [[nodiscard]] SandboxHandle* get() const noexcept { return handle_.get(); }
    [[nodiscard]] SandboxHandle* operator->() const noexcept { return handle_.get(); }
    [[nodiscard]] explicit operator bool() const noexcept { return handle_ != nullptr; }

private:
    ISandboxManager* manager_{nullptr};
    std::unique_ptr<SandboxHandle> handle_;
};

}  // namespace sandbox_exec
