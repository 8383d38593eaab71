/**
 * @file execution.hpp
 * @brief Execution request and execution snapshot value types.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_exec {

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

struct ExecutionOptions {
    std::optional<uint32_t> timeout_ms;    ///< Absent = limits.default_timeout_ms
    std::optional<std::string> project_id;
};

/**
 * @brief What a caller asks the engine to run.
 */
struct ExecutionRequest {
    LanguageName language;
    std::string code;
    ExecutionOptions options;
};

// ─────────────────────────────────────────────
// Execution snapshot
// ─────────────────────────────────────────────

/// Appended to the output when the cap was reached.
inline constexpr std::string_view kTruncationMarker = "\n...[output truncated]";

/**
 * @brief Point-in-time copy of one execution record.
 *
 * The registry owns the live record; everything outside it sees snapshots.
 */
struct Execution {
    ExecutionId id;
    LanguageName language;
    std::string owner_id;
    std::optional<std::string> project_id;
    ExecutionStatus status = ExecutionStatus::Queued;

    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> ended_at;

    std::string output;
    bool output_truncated = false;

    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::optional<ResourceUsage> usage;

    uint32_t timeout_ms = 0;

    /// ended_at - started_at, zero if the execution never ran.
    [[nodiscard]] Duration duration() const {
        if (!started_at || !ended_at) return Duration{0};
        return std::chrono::duration_cast<Duration>(*ended_at - *started_at);
    }

    [[nodiscard]] bool terminal() const noexcept { return is_terminal(status); }
};

/**
 * @brief Terminal outcome handed to ExecutionRegistry::finish().
 */
struct Completion {
    ExecutionStatus status = ExecutionStatus::Failed;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::optional<ErrorKind> error_kind;
    std::string error_message;
    std::optional<ResourceUsage> usage;
};

}  // namespace sandbox_exec
