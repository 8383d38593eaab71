/**
 * @file execution_registry.hpp
 * @brief Authoritative store of execution records.
 *
 * Records live here and nowhere else. Status is an atomic updated with
 * compare-and-set under a short per-record lock; the map itself is guarded
 * by a shared_mutex so status lookups never block each other.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/execution.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sandbox_exec {

/// Called once per execution, by the thread that won the terminal transition.
using TerminalListener = std::function<void(const Execution&)>;

class ExecutionRegistry {
public:
    explicit ExecutionRegistry(size_t output_cap_bytes);

    ExecutionRegistry(const ExecutionRegistry&) = delete;
    ExecutionRegistry& operator=(const ExecutionRegistry&) = delete;

    /// Install before the first create(); the listener runs outside all locks.
    void set_terminal_listener(TerminalListener listener);

    // ── Lifecycle ─────────────────────────────

    /// Create a Queued record with a fresh UUID v4 id.
    ExecutionId create(const ExecutionRequest& request, const Identity& identity,
                       uint32_t timeout_ms);

    /**
     * @brief Queued → Running. Stamps started_at.
     *
     * Fails with AlreadyTerminal if the record left Queued first (cancelled
     * while waiting for a slot), NotFound for unknown ids.
     */
    Result<Execution> mark_running(const ExecutionId& id);

    /**
     * @brief Claim a terminal status. First writer wins.
     *
     * Running may move to any terminal status; Queued only to Cancelled.
     * @return true if this call performed the transition.
     */
    bool finish(const ExecutionId& id, Completion completion);

    /**
     * @brief Append process output to a Running record.
     *
     * Output beyond the cap is dropped and the truncation marker appended
     * once. Returns false when the chunk was not (fully) stored.
     */
    bool append_output(const ExecutionId& id, std::string_view chunk);

    // ── Queries ───────────────────────────────

    [[nodiscard]] Result<Execution> snapshot(const ExecutionId& id) const;
    [[nodiscard]] std::optional<ExecutionStatus> status_of(const ExecutionId& id) const;

    /**
     * @brief Block until the record is terminal and the listener has run.
     *
     * With a timeout, returns the current (possibly non-terminal) snapshot
     * when it elapses.
     */
    Result<Execution> wait_terminal(const ExecutionId& id,
                                    std::optional<Duration> timeout = std::nullopt) const;

    /// Snapshots of one owner's executions, oldest first.
    [[nodiscard]] std::vector<Execution> executions_for(std::string_view owner_id) const;

    /// Ids of every Queued or Running record.
    [[nodiscard]] std::vector<ExecutionId> active_ids() const;

    // ── Retention ─────────────────────────────

    /// Drop terminal records that ended at least @p retention before @p now.
    size_t evict_expired(Timestamp now, Duration retention);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t output_cap() const noexcept { return output_cap_; }

private:
    struct Record {
        explicit Record(Execution initial) : status(initial.status), data(std::move(initial)) {}

        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::atomic<ExecutionStatus> status;
        Execution data;                 ///< Guarded by mutex; data.status mirrors status
        bool settled = false;           ///< Terminal and the listener has returned
    };

    std::shared_ptr<Record> find(const ExecutionId& id) const;
    ExecutionId next_id();

    const size_t output_cap_;
    TerminalListener listener_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<ExecutionId, std::shared_ptr<Record>> records_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

}  // namespace sandbox_exec
