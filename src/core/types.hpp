/**
 * @file types.hpp
 * @brief Fundamental types used throughout SandboxExec.
 *
 * Defines ExecutionId, ExecutionStatus, ErrorKind, Identity and other shared
 * vocabulary types. All types are designed for value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace sandbox_exec {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ExecutionId = std::string;
using LanguageName = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Caller identity attached by the authentication layer.
 *
 * The engine never invents an owner: callers without an authenticated
 * identity pass Identity::anonymous() explicitly.
 */
struct Identity {
    std::string owner_id;

    static constexpr std::string_view kAnonymousOwner = "anonymous";

    [[nodiscard]] static Identity anonymous() {
        return Identity{std::string{kAnonymousOwner}};
    }

    [[nodiscard]] bool is_anonymous() const noexcept {
        return owner_id == kAnonymousOwner;
    }
};

/**
 * @brief CPU time and peak memory of one sandboxed process tree.
 */
struct ResourceUsage {
    int64_t user_cpu_ms = 0;
    int64_t system_cpu_ms = 0;
    int64_t peak_memory_kb = 0;     ///< Largest resident set of any reaped process
};

// ─────────────────────────────────────────────
// Execution Status
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Queued,        ///< Admitted, waiting for a concurrency slot
    Running,       ///< Sandbox process is live
    Succeeded,     ///< Exited with code 0
    Failed,        ///< Non-zero exit, signal, or sandbox fault
    TimedOut,      ///< Killed at the wall-clock deadline
    Cancelled      ///< Cancelled by the caller
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Queued:    return "queued";
        case ExecutionStatus::Running:   return "running";
        case ExecutionStatus::Succeeded: return "succeeded";
        case ExecutionStatus::Failed:    return "failed";
        case ExecutionStatus::TimedOut:  return "timed_out";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::Succeeded
        || status == ExecutionStatus::Failed
        || status == ExecutionStatus::TimedOut
        || status == ExecutionStatus::Cancelled;
}

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Validation,            ///< Bad request shape or size; nothing allocated
    UnsupportedLanguage,   ///< Unknown or disabled language; nothing allocated
    ResourceExhausted,     ///< Wait queue full; no sandbox allocated
    ExecutionTimeout,      ///< Sandbox killed at the deadline
    ExecutionCrashed,      ///< Non-zero exit or fatal signal
    InternalSandboxError,  ///< Spawn or isolation failure
    NotFound,              ///< Unknown execution id
    AlreadyTerminal,       ///< Operation on a finished execution
    Cancelled,             ///< Wait abandoned because of cancellation
    Config,                ///< Invalid configuration
    Internal               ///< Anything else
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:           return "validation_error";
        case ErrorKind::UnsupportedLanguage:  return "unsupported_language";
        case ErrorKind::ResourceExhausted:    return "resource_exhausted";
        case ErrorKind::ExecutionTimeout:     return "execution_timeout";
        case ErrorKind::ExecutionCrashed:     return "execution_crashed";
        case ErrorKind::InternalSandboxError: return "internal_sandbox_error";
        case ErrorKind::NotFound:             return "not_found";
        case ErrorKind::AlreadyTerminal:      return "already_terminal";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::Config:               return "config_error";
        case ErrorKind::Internal:             return "internal_error";
    }
    return "unknown";
}

}  // namespace sandbox_exec
