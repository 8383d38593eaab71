/**
 * @file request_validator.hpp
 * @brief Shape and size checks applied before anything is allocated.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "registry/execution.hpp"

#include <cstddef>

namespace sandbox_exec {

inline constexpr size_t kMaxLanguageNameLength = 20;
inline constexpr size_t kMaxProjectIdLength = 100;

/**
 * @brief Validate a request against the configured limits.
 *
 * @return The effective timeout in milliseconds, or a Validation error.
 */
Result<uint32_t> validate_request(const ExecutionRequest& request, const LimitsConfig& limits);

}  // namespace sandbox_exec
