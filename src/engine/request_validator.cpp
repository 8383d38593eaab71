/**
 * @file request_validator.cpp
 * @brief Request validation.
 */

#include "engine/request_validator.hpp"

#include <algorithm>
#include <cctype>

namespace sandbox_exec {

namespace {

bool has_whitespace(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

}  // namespace

Result<uint32_t> validate_request(const ExecutionRequest& request, const LimitsConfig& limits) {
    const auto& lang = request.language;
    if (lang.empty() || lang.size() > kMaxLanguageNameLength) {
        return make_error<uint32_t>(ErrorKind::Validation,
            "language must be 1-" + std::to_string(kMaxLanguageNameLength) + " characters");
    }
    if (has_whitespace(lang)) {
        return make_error<uint32_t>(ErrorKind::Validation, "language must not contain whitespace");
    }

    if (request.code.empty()) {
        return make_error<uint32_t>(ErrorKind::Validation, "code must not be empty");
    }
    if (request.code.size() > limits.max_code_bytes) {
        return make_error<uint32_t>(ErrorKind::Validation,
            "code exceeds " + std::to_string(limits.max_code_bytes) + " bytes");
    }

    const auto& project = request.options.project_id;
    if (project && (project->empty() || project->size() > kMaxProjectIdLength)) {
        return make_error<uint32_t>(ErrorKind::Validation,
            "project_id must be 1-" + std::to_string(kMaxProjectIdLength) + " characters");
    }

    const uint32_t timeout = request.options.timeout_ms.value_or(limits.default_timeout_ms);
    if (timeout < limits.min_timeout_ms || timeout > limits.max_timeout_ms) {
        return make_error<uint32_t>(ErrorKind::Validation,
            "timeout_ms must be within [" + std::to_string(limits.min_timeout_ms) + ", "
            + std::to_string(limits.max_timeout_ms) + "]");
    }
    return timeout;
}

}  // namespace sandbox_exec
