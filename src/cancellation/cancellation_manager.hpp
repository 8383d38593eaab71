/**
 * @file cancellation_manager.hpp
 * @brief Caller-initiated termination of queued and running executions.
 *
 * Each in-flight execution gets a stop_source when it is admitted. A worker
 * waits on the matching stop_token (slot wait, monitor loop) and binds its
 * sandbox while the process is live so cancel() can signal it directly.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "registry/execution_registry.hpp"
#include "sandbox/sandbox.hpp"

#include <mutex>
#include <stop_token>
#include <unordered_map>

namespace sandbox_exec {

/**
 * @brief Result of a cancel request.
 *
 * already_terminal is informational: the execution had finished (or
 * finished first in a race) and is reported with its real terminal status.
 */
struct CancelOutcome {
    Execution execution;
    bool already_terminal = false;
};

class CancellationManager {
public:
    CancellationManager(ExecutionRegistry& registry, Logger logger);

    CancellationManager(const CancellationManager&) = delete;
    CancellationManager& operator=(const CancellationManager&) = delete;

    /// Register an admitted execution; the token fires on cancel().
    std::stop_token attach(const ExecutionId& id);

    /// Make a live sandbox reachable for signalling. Must be unbound before release.
    void bind_sandbox(const ExecutionId& id, SandboxHandle* handle);
    void unbind_sandbox(const ExecutionId& id);

    /// Forget the execution once its worker is done.
    void detach(const ExecutionId& id);

    /**
     * @brief Cancel one execution.
     *
     * Queued executions move straight to Cancelled and never start. Running
     * executions are claimed as Cancelled and their process group receives
     * SIGTERM; the worker escalates to SIGKILL after the grace period.
     * Fails with NotFound for unknown ids.
     */
    Result<CancelOutcome> cancel(const ExecutionId& id);

    /// Cancel every execution still Queued or Running. Returns how many were claimed.
    size_t cancel_all();

    [[nodiscard]] size_t tracked() const;

private:
    struct Entry {
        std::stop_source source;
        SandboxHandle* sandbox = nullptr;
    };

    void interrupt(const ExecutionId& id, bool signal_sandbox);

    ExecutionRegistry& registry_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::unordered_map<ExecutionId, Entry> entries_;
};

}  // namespace sandbox_exec
