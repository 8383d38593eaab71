/**
 * @file execution_registry.cpp
 * @brief ExecutionRegistry implementation.
 */

#include "registry/execution_registry.hpp"

#include <algorithm>
#include <cstdio>

namespace sandbox_exec {

namespace {

bool transition_allowed(ExecutionStatus from, ExecutionStatus to) {
    if (!is_terminal(to)) return false;
    if (from == ExecutionStatus::Running) return true;
    return from == ExecutionStatus::Queued && to == ExecutionStatus::Cancelled;
}

}  // namespace

ExecutionRegistry::ExecutionRegistry(size_t output_cap_bytes)
    : output_cap_(output_cap_bytes)
    , rng_(std::random_device{}()) {}

void ExecutionRegistry::set_terminal_listener(TerminalListener listener) {
    listener_ = std::move(listener);
}

// ── Lifecycle ────────────────────────────────

ExecutionId ExecutionRegistry::next_id() {
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard lock(rng_mutex_);
        hi = rng_();
        lo = rng_();
    }
    // RFC 4122 version 4, variant 10xx.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return ExecutionId{buf};
}

ExecutionId ExecutionRegistry::create(const ExecutionRequest& request,
                                      const Identity& identity,
                                      uint32_t timeout_ms) {
    Execution initial;
    initial.language = request.language;
    initial.owner_id = identity.owner_id;
    initial.project_id = request.options.project_id;
    initial.status = ExecutionStatus::Queued;
    initial.created_at = std::chrono::system_clock::now();
    initial.timeout_ms = timeout_ms;

    std::unique_lock lock(map_mutex_);
    ExecutionId id;
    do {
        id = next_id();
    } while (records_.contains(id));

    initial.id = id;
    records_.emplace(id, std::make_shared<Record>(std::move(initial)));
    return id;
}

Result<Execution> ExecutionRegistry::mark_running(const ExecutionId& id) {
    auto record = find(id);
    if (!record) {
        return make_error<Execution>(ErrorKind::NotFound, "Unknown execution: " + id);
    }

    std::lock_guard lock(record->mutex);
    auto expected = ExecutionStatus::Queued;
    if (!record->status.compare_exchange_strong(expected, ExecutionStatus::Running)) {
        return make_error<Execution>(ErrorKind::AlreadyTerminal,
            "Execution " + id + " is " + std::string(to_string(expected)));
    }
    record->data.status = ExecutionStatus::Running;
    record->data.started_at = std::chrono::system_clock::now();
    return record->data;
}

bool ExecutionRegistry::finish(const ExecutionId& id, Completion completion) {
    auto record = find(id);
    if (!record) return false;

    Execution final_state;
    {
        std::lock_guard lock(record->mutex);
        auto current = record->status.load();
        if (!transition_allowed(current, completion.status)) return false;
        if (!record->status.compare_exchange_strong(current, completion.status)) return false;

        auto& data = record->data;
        data.status = completion.status;
        data.ended_at = std::chrono::system_clock::now();
        data.exit_code = completion.exit_code;
        data.term_signal = completion.term_signal;
        data.error_kind = completion.error_kind;
        data.error_message = std::move(completion.error_message);
        data.usage = completion.usage;
        final_state = data;
    }

    // Waiters wake only after the listener has run, so they observe its effects.
    struct SettleOnExit {
        Record& record;
        ~SettleOnExit() {
            {
                std::lock_guard lock(record.mutex);
                record.settled = true;
            }
            record.cv.notify_all();
        }
    } settle{*record};

    if (listener_) listener_(final_state);
    return true;
}

bool ExecutionRegistry::append_output(const ExecutionId& id, std::string_view chunk) {
    auto record = find(id);
    if (!record) return false;

    std::lock_guard lock(record->mutex);
    if (record->status.load() != ExecutionStatus::Running) return false;

    auto& data = record->data;
    if (data.output_truncated) return false;

    const size_t room = output_cap_ > data.output.size() ? output_cap_ - data.output.size() : 0;
    if (chunk.size() <= room) {
        data.output.append(chunk);
        return true;
    }

    data.output.append(chunk.substr(0, room));
    data.output.append(kTruncationMarker);
    data.output_truncated = true;
    return false;
}

// ── Queries ──────────────────────────────────

std::shared_ptr<ExecutionRegistry::Record> ExecutionRegistry::find(const ExecutionId& id) const {
    std::shared_lock lock(map_mutex_);
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second;
}

Result<Execution> ExecutionRegistry::snapshot(const ExecutionId& id) const {
    auto record = find(id);
    if (!record) {
        return make_error<Execution>(ErrorKind::NotFound, "Unknown execution: " + id);
    }
    std::lock_guard lock(record->mutex);
    return record->data;
}

std::optional<ExecutionStatus> ExecutionRegistry::status_of(const ExecutionId& id) const {
    auto record = find(id);
    if (!record) return std::nullopt;
    return record->status.load();
}

Result<Execution> ExecutionRegistry::wait_terminal(const ExecutionId& id,
                                                   std::optional<Duration> timeout) const {
    auto record = find(id);
    if (!record) {
        return make_error<Execution>(ErrorKind::NotFound, "Unknown execution: " + id);
    }

    std::unique_lock lock(record->mutex);
    auto done = [&record] { return record->settled; };
    if (timeout) {
        record->cv.wait_for(lock, *timeout, done);
    } else {
        record->cv.wait(lock, done);
    }
    return record->data;
}

std::vector<Execution> ExecutionRegistry::executions_for(std::string_view owner_id) const {
    std::vector<std::shared_ptr<Record>> matching;
    {
        std::shared_lock lock(map_mutex_);
        for (const auto& [id, record] : records_) {
            // owner_id is immutable after create(), no record lock needed.
            if (record->data.owner_id == owner_id) matching.push_back(record);
        }
    }

    std::vector<Execution> result;
    result.reserve(matching.size());
    for (const auto& record : matching) {
        std::lock_guard lock(record->mutex);
        result.push_back(record->data);
    }
    std::sort(result.begin(), result.end(), [](const Execution& a, const Execution& b) {
        return a.created_at < b.created_at;
    });
    return result;
}

std::vector<ExecutionId> ExecutionRegistry::active_ids() const {
    std::shared_lock lock(map_mutex_);
    std::vector<ExecutionId> ids;
    for (const auto& [id, record] : records_) {
        if (!is_terminal(record->status.load())) ids.push_back(id);
    }
    return ids;
}

// ── Retention ────────────────────────────────

size_t ExecutionRegistry::evict_expired(Timestamp now, Duration retention) {
    std::unique_lock lock(map_mutex_);
    size_t evicted = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& record = it->second;
        bool expired = false;
        if (is_terminal(record->status.load())) {
            std::lock_guard record_lock(record->mutex);
            expired = record->data.ended_at && *record->data.ended_at + retention <= now;
        }
        if (expired) {
            it = records_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

size_t ExecutionRegistry::size() const {
    std::shared_lock lock(map_mutex_);
    return records_.size();
}

}  // namespace sandbox_exec
