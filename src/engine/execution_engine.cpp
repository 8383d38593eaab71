/**
 * @file execution_engine.cpp
 * @brief ExecutionEngine implementation.
 */

#include "engine/execution_engine.hpp"

#include "engine/request_validator.hpp"
#include "sandbox/process_sandbox.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace sandbox_exec {

namespace {

std::unique_ptr<ILogSink> sink_or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

size_t worker_count(const EngineConfig& engine) {
    // Never fewer workers than admitted + queued executions.
    const size_t needed = size_t{engine.max_concurrent} + engine.max_queue_depth;
    return std::max<size_t>({size_t{engine.worker_threads}, needed, 1});
}

RunnerSettings runner_settings(const LimitsConfig& limits) {
    RunnerSettings settings;
    settings.kill_grace = Duration{limits.kill_grace_ms};
    return settings;
}

}  // namespace

ExecutionEngine::ExecutionEngine(Options opts)
    : config_(std::move(opts.config))
    , logger_(sink_or_null(std::move(opts.log_sink)), opts.log_level, "engine")
    , languages_(LanguageRegistry::with_builtins(config_.languages))
    , sandboxes_(opts.sandbox_manager
                 ? std::move(opts.sandbox_manager)
                 : std::make_unique<ProcessSandboxManager>(config_.sandbox,
                                                           logger_.for_component("sandbox")))
    , registry_(config_.limits.output_cap_bytes)
    , concurrency_(config_.engine.max_concurrent, config_.engine.max_queue_depth)
    , cancellation_(registry_, logger_.for_component("cancellation"))
    , stats_(config_.stats.latency_window)
    , runner_(registry_, cancellation_, *sandboxes_, logger_.for_component("runner"),
              runner_settings(config_.limits))
    , observers_(std::move(opts.observers))
    , workers_(worker_count(config_.engine)) {

    registry_.set_terminal_listener([this](const Execution& execution) {
        on_terminal(execution);
    });
    runner_.set_started_callback([this](const Execution& execution) {
        notify_started(execution);
    });
    janitor_ = std::jthread([this](std::stop_token stop) { janitor_loop(stop); });

    logger_.info("ExecutionEngine started: max_concurrent="
                 + std::to_string(concurrency_.capacity())
                 + " max_queue_depth=" + std::to_string(concurrency_.queue_capacity())
                 + " workers=" + std::to_string(workers_.thread_count())
                 + " languages=" + std::to_string(languages_.size()));
}

ExecutionEngine::~ExecutionEngine() {
    shutdown();
}

// ── Execution ────────────────────────────────

Result<ExecutionId> ExecutionEngine::submit(const ExecutionRequest& request,
                                            const Identity& identity) {
    if (!running_.load()) {
        return make_error<ExecutionId>(ErrorKind::Internal, "Engine is shut down");
    }

    auto timeout = validate_request(request, config_.limits);
    if (!timeout) {
        logger_.debug("Rejected request: " + timeout.error().message);
        return timeout.error();
    }

    auto adapter = languages_.resolve(request.language);
    if (!adapter) {
        logger_.debug("Rejected request: " + adapter.error().message);
        return adapter.error();
    }

    auto admission = concurrency_.request();
    if (!admission) {
        stats_.record_rejected(request.language);
        logger_.warn("Admission refused for " + request.language + ": " + admission.error().message);
        return admission.error();
    }
    const bool immediate = admission->granted_immediately();

    auto id = registry_.create(request, identity, *timeout);
    auto job = std::make_shared<ExecutionJob>(ExecutionJob{
        .id = id,
        .adapter = std::move(*adapter),
        .code = request.code,
        .timeout = Duration{*timeout},
        .admission = std::move(*admission),
        .cancel = cancellation_.attach(id)
    });

    bool posted = workers_.post([this, job](std::stop_token pool_stop) {
        // Accepted just before shutdown: resolve without running anything.
        if (pool_stop.stop_requested()) {
            auto outcome = cancellation_.cancel(job->id);
            if (!outcome) logger_.warn("Shutdown cancel failed: " + outcome.error().message);
        }
        runner_.run(*job);
    });
    if (!posted) {
        registry_.finish(id, Completion{
            .status = ExecutionStatus::Cancelled,
            .exit_code = std::nullopt,
            .term_signal = std::nullopt,
            .error_kind = ErrorKind::Cancelled,
            .error_message = "Engine shutting down"
        });
        cancellation_.detach(id);
        return make_error<ExecutionId>(ErrorKind::Internal, "Engine is shutting down");
    }

    logger_.info("Admitted " + id + " language=" + request.language
                 + " owner=" + identity.owner_id
                 + (immediate ? " (slot granted)" : " (queued)"));
    return id;
}

Result<Execution> ExecutionEngine::execute(const ExecutionRequest& request,
                                           const Identity& identity) {
    auto id = submit(request, identity);
    if (!id) return id.error();
    return registry_.wait_terminal(*id);
}

Result<Execution> ExecutionEngine::status(const ExecutionId& id) const {
    return registry_.snapshot(id);
}

Result<Execution> ExecutionEngine::wait(const ExecutionId& id,
                                        std::optional<Duration> timeout) const {
    return registry_.wait_terminal(id, timeout);
}

Result<CancelOutcome> ExecutionEngine::cancel(const ExecutionId& id) {
    return cancellation_.cancel(id);
}

// ── Discovery / introspection ────────────────

std::vector<LanguageSummary> ExecutionEngine::list_languages() const {
    return languages_.list();
}

HealthReport ExecutionEngine::health() const {
    HealthReport report;
    report.active_count = concurrency_.active_count();
    report.queue_depth = concurrency_.queue_depth();
    report.capacity = concurrency_.capacity();
    report.queue_capacity = concurrency_.queue_capacity();
    report.tracked_executions = registry_.size();
    report.live_sandboxes = sandboxes_->active_count();

    if (!running_.load()) {
        report.issues.push_back("engine is shut down");
    }
    if (report.active_count >= report.capacity && report.queue_depth >= report.queue_capacity) {
        report.issues.push_back("at capacity: new submissions are rejected");
    }
    if (auto ready = sandboxes_->check_ready(); !ready) {
        report.issues.push_back(ready.error().message);
    }
    for (const auto& summary : languages_.list()) {
        if (!summary.enabled) continue;
        auto adapter = languages_.resolve(summary.name);
        if (adapter && !sandboxes_->runtime_available(*adapter)) {
            report.unavailable_languages.push_back(summary.name);
        }
    }
    if (!report.unavailable_languages.empty()) {
        report.issues.push_back(std::to_string(report.unavailable_languages.size())
                                + " enabled language runtime(s) not found");
    }

    report.state = report.issues.empty() ? HealthState::Ok : HealthState::Degraded;
    return report;
}

StatsSnapshot ExecutionEngine::stats() const {
    return stats_.snapshot();
}

std::vector<Execution> ExecutionEngine::executions_for(const std::string& owner_id) const {
    return registry_.executions_for(owner_id);
}

void ExecutionEngine::subscribe(std::shared_ptr<IExecutionObserver> observer) {
    if (!observer) return;
    std::lock_guard lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

// ── Notifications ────────────────────────────

std::vector<std::shared_ptr<IExecutionObserver>> ExecutionEngine::observers_snapshot() const {
    std::lock_guard lock(observers_mutex_);
    return observers_;
}

void ExecutionEngine::notify_started(const Execution& execution) {
    logger_.debug("Execution " + execution.id + " running");
    for (const auto& observer : observers_snapshot()) {
        try {
            observer->on_started(execution);
        } catch (const std::exception& e) {
            logger_.warn(std::string{"Observer on_started threw: "} + e.what());
        }
    }
}

void ExecutionEngine::on_terminal(const Execution& execution) {
    stats_.record_terminal(execution);

    std::string message = "Execution " + execution.id + " "
                        + std::string(to_string(execution.status))
                        + " in " + std::to_string(execution.duration().count()) + " ms";
    if (execution.exit_code) message += " exit=" + std::to_string(*execution.exit_code);
    if (execution.status == ExecutionStatus::Failed && execution.error_kind
        && *execution.error_kind == ErrorKind::InternalSandboxError) {
        logger_.error(message + ": " + execution.error_message);
    } else {
        logger_.info(message);
    }

    const bool succeeded = execution.status == ExecutionStatus::Succeeded;
    for (const auto& observer : observers_snapshot()) {
        try {
            if (succeeded) {
                observer->on_completed(execution);
            } else {
                observer->on_error(execution);
            }
        } catch (const std::exception& e) {
            logger_.warn(std::string{"Observer callback threw: "} + e.what());
        }
    }
}

// ── Lifecycle ────────────────────────────────

size_t ExecutionEngine::sweep_expired() {
    auto evicted = registry_.evict_expired(std::chrono::system_clock::now(),
                                           Duration{config_.engine.retention_ms});
    if (evicted > 0) {
        logger_.debug("Evicted " + std::to_string(evicted) + " expired execution(s)");
    }
    return evicted;
}

void ExecutionEngine::janitor_loop(std::stop_token stop) {
    const Duration interval{config_.engine.sweep_interval_ms};
    std::unique_lock lock(janitor_mutex_);
    while (!stop.stop_requested()) {
        janitor_cv_.wait_for(lock, stop, interval, [] { return false; });
        if (stop.stop_requested()) break;
        lock.unlock();
        sweep_expired();
        lock.lock();
    }
}

void ExecutionEngine::shutdown() {
    if (!running_.exchange(false)) return;

    logger_.info("ExecutionEngine shutting down...");
    janitor_.request_stop();
    if (janitor_.joinable()) janitor_.join();

    auto cancelled = cancellation_.cancel_all();
    workers_.shutdown();

    logger_.info("ExecutionEngine stopped (" + std::to_string(cancelled)
                 + " in-flight execution(s) cancelled)");
    logger_.flush();
}

}  // namespace sandbox_exec
