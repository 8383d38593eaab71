/**
 * @file execution_runner.hpp
 * @brief Drives one admitted execution from slot wait to terminal status.
 */

#pragma once

#include "cancellation/cancellation_manager.hpp"
#include "concurrency/concurrency_controller.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "language/language_registry.hpp"
#include "registry/execution_registry.hpp"
#include "sandbox/sandbox.hpp"

#include <functional>
#include <stop_token>
#include <string>

namespace sandbox_exec {

struct RunnerSettings {
    Duration poll_interval{25};        ///< Output/exit polling granularity
    Duration kill_grace{500};          ///< SIGTERM → SIGKILL on cancel
    Duration drain_timeout{500};       ///< Max wait for trailing output after exit
};

/**
 * @brief Everything a worker needs for one execution.
 *
 * Built by the engine at submit time; the admission is already reserved.
 */
struct ExecutionJob {
    ExecutionId id;
    LanguageAdapter adapter;
    std::string code;
    Duration timeout{0};
    PendingAdmission admission;
    std::stop_token cancel;
};

/**
 * @brief Worker-side execution lifecycle.
 *
 * Slot wait → mark_running → sandbox acquire → monitor (output, deadline,
 * cancellation) → terminal transition. The sandbox lease and the
 * concurrency ticket are released on every path, exceptions included.
 */
class ExecutionRunner {
public:
    using StartedCallback = std::function<void(const Execution&)>;

    ExecutionRunner(ExecutionRegistry& registry,
                    CancellationManager& cancellation,
                    ISandboxManager& sandboxes,
                    Logger logger,
                    RunnerSettings settings = {});

    void set_started_callback(StartedCallback callback) { on_started_ = std::move(callback); }

    /// Run @p job to completion. Never leaves the record non-terminal.
    void run(ExecutionJob& job);

    [[nodiscard]] const RunnerSettings& settings() const noexcept { return settings_; }

private:
    enum class MonitorOutcome { Exited, TimedOut, Cancelled };

    void run_admitted(ExecutionJob& job);
    void supervise(ExecutionJob& job, SandboxHandle& sandbox);
    void terminate_gracefully(SandboxHandle& sandbox);
    std::optional<ExitStatus> await_exit(SandboxHandle& sandbox, Duration limit);
    void drain_output(const ExecutionId& id, SandboxHandle& sandbox, bool& streams_open);
    void fail(const ExecutionId& id, ErrorKind kind, std::string message);

    ExecutionRegistry& registry_;
    CancellationManager& cancellation_;
    ISandboxManager& sandboxes_;
    Logger logger_;
    RunnerSettings settings_;
    StartedCallback on_started_;
};

}  // namespace sandbox_exec
