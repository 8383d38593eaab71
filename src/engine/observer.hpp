/**
 * @file observer.hpp
 * @brief Subscriber interface for execution lifecycle notifications.
 */

#pragma once

#include "registry/execution.hpp"

namespace sandbox_exec {

/**
 * @brief Receives lifecycle notifications from the engine.
 *
 * Callbacks run on engine threads outside all engine locks and must not
 * block for long. Exceptions thrown from a callback are logged and dropped.
 *
 * on_completed fires for Succeeded; on_error for Failed, TimedOut and
 * Cancelled. Exactly one of the two fires per execution.
 */
class IExecutionObserver {
public:
    virtual ~IExecutionObserver() = default;

    virtual void on_started(const Execution& execution) = 0;
    virtual void on_completed(const Execution& execution) = 0;
    virtual void on_error(const Execution& execution) = 0;
};

}  // namespace sandbox_exec
