/**
 * @file execution_runner.cpp
 * @brief ExecutionRunner implementation.
 */

#include "executor/execution_runner.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <thread>

namespace sandbox_exec {

namespace {

using Clock = std::chrono::steady_clock;

/// Keeps the sandbox reachable by cancel() for exactly the lease's live span.
class SandboxBinding {
public:
    SandboxBinding(CancellationManager& cancellation, const ExecutionId& id, SandboxHandle* handle)
        : cancellation_(cancellation), id_(id) {
        cancellation_.bind_sandbox(id_, handle);
    }
    ~SandboxBinding() { cancellation_.unbind_sandbox(id_); }

    SandboxBinding(const SandboxBinding&) = delete;
    SandboxBinding& operator=(const SandboxBinding&) = delete;

private:
    CancellationManager& cancellation_;
    const ExecutionId& id_;
};

std::string describe_exit(const ExitStatus& exit) {
    if (exit.term_signal) {
        return "Process killed by signal " + std::to_string(*exit.term_signal);
    }
    return "Process exited with code " + std::to_string(exit.exit_code);
}

}  // namespace

ExecutionRunner::ExecutionRunner(ExecutionRegistry& registry,
                                 CancellationManager& cancellation,
                                 ISandboxManager& sandboxes,
                                 Logger logger,
                                 RunnerSettings settings)
    : registry_(registry)
    , cancellation_(cancellation)
    , sandboxes_(sandboxes)
    , logger_(std::move(logger))
    , settings_(settings) {}

void ExecutionRunner::run(ExecutionJob& job) {
    try {
        run_admitted(job);
    } catch (const std::exception& e) {
        logger_.error("Worker failure for " + job.id + ": " + e.what());
        fail(job.id, ErrorKind::InternalSandboxError, std::string{"Internal error: "} + e.what());
    }

    // A record must never be left non-terminal once its worker is gone.
    if (auto status = registry_.status_of(job.id); status && !is_terminal(*status)) {
        if (*status == ExecutionStatus::Queued) {
            registry_.finish(job.id, Completion{
                .status = ExecutionStatus::Cancelled,
                .exit_code = std::nullopt,
                .term_signal = std::nullopt,
                .error_kind = ErrorKind::Internal,
                .error_message = "Worker exited before the execution started"
            });
        } else {
            fail(job.id, ErrorKind::Internal, "Worker exited without a terminal status");
        }
    }
    cancellation_.detach(job.id);
}

void ExecutionRunner::run_admitted(ExecutionJob& job) {
    auto ticket = job.admission.wait(job.cancel);
    if (!ticket) {
        // Stopped while queued. cancel() normally claimed the record already.
        registry_.finish(job.id, Completion{
            .status = ExecutionStatus::Cancelled,
            .exit_code = std::nullopt,
            .term_signal = std::nullopt,
            .error_kind = ErrorKind::Cancelled,
            .error_message = ticket.error().message
        });
        return;
    }

    auto running = registry_.mark_running(job.id);
    if (!running) {
        logger_.debug("Skipping " + job.id + ": " + running.error().message);
        return;
    }
    if (on_started_) on_started_(*running);

    auto handle = sandboxes_.acquire(SandboxSpec{
        .execution_id = job.id,
        .adapter = job.adapter,
        .code = std::move(job.code),
        .timeout = job.timeout
    });
    if (!handle) {
        logger_.warn("Sandbox acquire failed for " + job.id + ": " + handle.error().message);
        fail(job.id, ErrorKind::InternalSandboxError, handle.error().message);
        return;
    }

    // Destruction order: binding, then lease, then ticket.
    SandboxLease lease(sandboxes_, std::move(*handle));
    SandboxBinding binding(cancellation_, job.id, lease.get());
    logger_.debug("Sandbox pid " + std::to_string(lease->pid()) + " started for " + job.id);

    supervise(job, *lease.get());
}

void ExecutionRunner::supervise(ExecutionJob& job, SandboxHandle& sandbox) {
    const auto deadline = Clock::now() + job.timeout;
    bool streams_open = true;
    std::optional<ExitStatus> exit;
    MonitorOutcome outcome = MonitorOutcome::Exited;

    auto sink = [this, &job](std::string_view chunk) {
        registry_.append_output(job.id, chunk);
    };

    while (true) {
        if (streams_open) {
            streams_open = sandbox.read_output(settings_.poll_interval, sink);
        } else {
            std::this_thread::sleep_for(settings_.poll_interval);
        }

        exit = sandbox.try_wait();
        if (exit) break;

        if (job.cancel.stop_requested()) {
            outcome = MonitorOutcome::Cancelled;
            break;
        }
        if (Clock::now() >= deadline) {
            outcome = MonitorOutcome::TimedOut;
            break;
        }
    }

    switch (outcome) {
        case MonitorOutcome::Cancelled: {
            terminate_gracefully(sandbox);
            auto stopped = await_exit(sandbox, settings_.kill_grace);
            registry_.finish(job.id, Completion{
                .status = ExecutionStatus::Cancelled,
                .exit_code = std::nullopt,
                .term_signal = std::nullopt,
                .error_kind = ErrorKind::Cancelled,
                .error_message = "Cancelled while running",
                .usage = stopped ? stopped->usage : std::nullopt
            });
            return;
        }

        case MonitorOutcome::TimedOut: {
            sandbox.kill(SIGKILL);
            auto killed = await_exit(sandbox, settings_.kill_grace);
            if (registry_.finish(job.id, Completion{
                    .status = ExecutionStatus::TimedOut,
                    .exit_code = std::nullopt,
                    .term_signal = SIGKILL,
                    .error_kind = ErrorKind::ExecutionTimeout,
                    .error_message = "Execution exceeded " + std::to_string(job.timeout.count()) + " ms",
                    .usage = killed ? killed->usage : std::nullopt
                })) {
                logger_.info("Execution " + job.id + " timed out");
            }
            return;
        }

        case MonitorOutcome::Exited:
            break;
    }

    drain_output(job.id, sandbox, streams_open);

    Completion completion;
    completion.exit_code = exit->exit_code;
    completion.term_signal = exit->term_signal;
    completion.usage = exit->usage;
    if (exit->success()) {
        completion.status = ExecutionStatus::Succeeded;
    } else {
        completion.status = ExecutionStatus::Failed;
        completion.error_kind = ErrorKind::ExecutionCrashed;
        completion.error_message = describe_exit(*exit);
    }
    if (!registry_.finish(job.id, std::move(completion))) {
        logger_.debug("Execution " + job.id + " was already terminal at exit");
    }
}

void ExecutionRunner::terminate_gracefully(SandboxHandle& sandbox) {
    sandbox.kill(SIGTERM);
    const auto grace_end = Clock::now() + settings_.kill_grace;
    while (Clock::now() < grace_end) {
        if (sandbox.try_wait()) return;
        std::this_thread::sleep_for(std::min(settings_.poll_interval, Duration{10}));
    }
    sandbox.kill(SIGKILL);
}

std::optional<ExitStatus> ExecutionRunner::await_exit(SandboxHandle& sandbox, Duration limit) {
    const auto give_up = Clock::now() + limit;
    while (true) {
        if (auto exit = sandbox.try_wait()) return exit;
        if (Clock::now() >= give_up) return std::nullopt;
        std::this_thread::sleep_for(std::min(settings_.poll_interval, Duration{10}));
    }
}

void ExecutionRunner::drain_output(const ExecutionId& id, SandboxHandle& sandbox,
                                   bool& streams_open) {
    // Background children may keep the pipes open; bound the wait.
    const auto drain_end = Clock::now() + settings_.drain_timeout;
    auto sink = [this, &id](std::string_view chunk) {
        registry_.append_output(id, chunk);
    };
    while (streams_open && Clock::now() < drain_end) {
        streams_open = sandbox.read_output(settings_.poll_interval, sink);
    }
}

void ExecutionRunner::fail(const ExecutionId& id, ErrorKind kind, std::string message) {
    registry_.finish(id, Completion{
        .status = ExecutionStatus::Failed,
        .exit_code = std::nullopt,
        .term_signal = std::nullopt,
        .error_kind = kind,
        .error_message = std::move(message)
    });
}

}  // namespace sandbox_exec
