/**
 * @file execution_engine.hpp
 * @brief Top-level ExecutionEngine facade that ties all modules together.
 *
 * Provides a single entry point for:
 *   1. Submitting code for sandboxed execution (async or blocking)
 *   2. Querying and cancelling executions by id
 *   3. Language discovery, health and statistics
 *
 * The isolation backend is injected through ISandboxManager so tests can
 * substitute a fake; by default a ProcessSandboxManager is built from config.
 */

#pragma once

#include "cancellation/cancellation_manager.hpp"
#include "concurrency/concurrency_controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/observer.hpp"
#include "executor/execution_runner.hpp"
#include "executor/worker_pool.hpp"
#include "language/language_registry.hpp"
#include "registry/execution_registry.hpp"
#include "sandbox/sandbox.hpp"
#include "stats/stats_aggregator.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace sandbox_exec {

enum class HealthState : uint8_t { Ok, Degraded };

[[nodiscard]] constexpr std::string_view to_string(HealthState state) noexcept {
    return state == HealthState::Ok ? "ok" : "degraded";
}

/**
 * @brief Point-in-time view of engine capacity and readiness.
 */
struct HealthReport {
    HealthState state = HealthState::Ok;
    size_t active_count = 0;
    size_t queue_depth = 0;
    size_t capacity = 0;
    size_t queue_capacity = 0;
    size_t tracked_executions = 0;
    size_t live_sandboxes = 0;
    std::vector<LanguageName> unavailable_languages;
    std::vector<std::string> issues;
};

class ExecutionEngine {
public:
    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;
        LogLevel log_level = LogLevel::Info;
        std::unique_ptr<ISandboxManager> sandbox_manager;   ///< Null = ProcessSandboxManager
        std::vector<std::shared_ptr<IExecutionObserver>> observers;
    };

    explicit ExecutionEngine(Options opts);
    ~ExecutionEngine();

    // Non-copyable, non-movable
    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // ── Execution ────────────────────────────

    /**
     * @brief Validate, resolve and admit a request; returns the new id.
     *
     * Validation, UnsupportedLanguage and ResourceExhausted are returned
     * synchronously and leave no record behind.
     */
    Result<ExecutionId> submit(const ExecutionRequest& request, const Identity& identity);

    /// submit() and wait for the terminal snapshot.
    Result<Execution> execute(const ExecutionRequest& request, const Identity& identity);

    [[nodiscard]] Result<Execution> status(const ExecutionId& id) const;

    /// Block until @p id is terminal (or @p timeout elapses).
    Result<Execution> wait(const ExecutionId& id, std::optional<Duration> timeout = std::nullopt) const;

    Result<CancelOutcome> cancel(const ExecutionId& id);

    // ── Discovery / introspection ────────────

    [[nodiscard]] std::vector<LanguageSummary> list_languages() const;
    [[nodiscard]] HealthReport health() const;
    [[nodiscard]] StatsSnapshot stats() const;
    [[nodiscard]] std::vector<Execution> executions_for(const std::string& owner_id) const;

    void subscribe(std::shared_ptr<IExecutionObserver> observer);

    /// Stop the sweeper, cancel everything in flight and join workers. Idempotent.
    void shutdown();
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// Evict expired terminal records now; returns how many were dropped.
    size_t sweep_expired();

    // ── Accessors (for testing) ─────────────
    const Config& config() const { return config_; }
    Logger& logger() { return logger_; }
    const LanguageRegistry& languages() const { return languages_; }
    ConcurrencyController& concurrency() { return concurrency_; }
    ISandboxManager& sandboxes() { return *sandboxes_; }

private:
    void on_terminal(const Execution& execution);
    void notify_started(const Execution& execution);
    std::vector<std::shared_ptr<IExecutionObserver>> observers_snapshot() const;
    void janitor_loop(std::stop_token stop);

    Config config_;
    Logger logger_;
    LanguageRegistry languages_;
    std::unique_ptr<ISandboxManager> sandboxes_;

    ExecutionRegistry registry_;
    ConcurrencyController concurrency_;
    CancellationManager cancellation_;
    StatsAggregator stats_;
    ExecutionRunner runner_;

    mutable std::mutex observers_mutex_;
    std::vector<std::shared_ptr<IExecutionObserver>> observers_;

    std::atomic<bool> running_{true};
    std::mutex janitor_mutex_;
    std::condition_variable_any janitor_cv_;

    // Declared last: workers and the janitor must stop before anything above dies.
    WorkerPool workers_;
    std::jthread janitor_;
};

}  // namespace sandbox_exec
