/**
 * @file event_recorder.cpp
 * @brief EventRecorder implementation.
 */

#include "telemetry/event_recorder.hpp"

#include <chrono>
#include <sstream>

namespace sandbox_exec {

namespace {

int64_t epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

}  // namespace

EventRecorder::EventRecorder(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void EventRecorder::on_started(const Execution& execution) {
    std::ostringstream oss;
    oss << R"({"event":"execution_started")"
        << R"(,"id":")" << execution.id << "\""
        << R"(,"language":")" << json_escape(execution.language) << "\""
        << R"(,"owner":")" << json_escape(execution.owner_id) << "\""
        << R"(,"timeout_ms":)" << execution.timeout_ms;
    if (execution.started_at) {
        oss << R"(,"started_at_ms":)" << epoch_ms(*execution.started_at);
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::on_completed(const Execution& execution) {
    record_terminal("execution_completed", execution);
}

void EventRecorder::on_error(const Execution& execution) {
    record_terminal("execution_failed", execution);
}

void EventRecorder::record_terminal(std::string_view event, const Execution& execution) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"id":")" << execution.id << "\""
        << R"(,"language":")" << json_escape(execution.language) << "\""
        << R"(,"owner":")" << json_escape(execution.owner_id) << "\""
        << R"(,"status":")" << to_string(execution.status) << "\""
        << R"(,"duration_ms":)" << execution.duration().count()
        << R"(,"output_bytes":)" << execution.output.size()
        << R"(,"truncated":)" << (execution.output_truncated ? "true" : "false");
    if (execution.exit_code) {
        oss << R"(,"exit_code":)" << *execution.exit_code;
    }
    if (execution.error_kind) {
        oss << R"(,"error":")" << to_string(*execution.error_kind) << "\"";
    }
    if (execution.usage) {
        oss << R"(,"cpu_user_ms":)" << execution.usage->user_cpu_ms
            << R"(,"cpu_system_ms":)" << execution.usage->system_cpu_ms
            << R"(,"peak_memory_kb":)" << execution.usage->peak_memory_kb;
    }
    oss << "}";
    emit(oss.str());
}

void EventRecorder::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void EventRecorder::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace sandbox_exec
