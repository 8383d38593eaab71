/**
 * @file event_recorder.hpp
 * @brief Execution lifecycle events written as NDJSON.
 */

#pragma once

#include "core/logger.hpp"
#include "engine/observer.hpp"

#include <memory>
#include <mutex>

namespace sandbox_exec {

/**
 * @brief Observer that appends one NDJSON event per lifecycle transition.
 *
 * Events: execution_started, execution_completed, execution_failed. Output
 * is never included, only its size and truncation flag.
 */
class EventRecorder final : public IExecutionObserver {
public:
    explicit EventRecorder(std::unique_ptr<ILogSink> sink);

    void on_started(const Execution& execution) override;
    void on_completed(const Execution& execution) override;
    void on_error(const Execution& execution) override;

    void flush();

private:
    void record_terminal(std::string_view event, const Execution& execution);
    void emit(std::string_view json_line);

    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
};

}  // namespace sandbox_exec
