/**
 * @file stats_aggregator.hpp
 * @brief Per-language outcome counters and rolling latency percentiles.
 */

#pragma once

#include "core/types.hpp"
#include "registry/execution.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace sandbox_exec {

struct LatencySummary {
    size_t samples = 0;
    Duration p50{0};
    Duration p95{0};
    Duration max{0};
};

struct LanguageStats {
    uint64_t attempts = 0;     ///< Executions that reached a terminal status
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t timed_out = 0;
    uint64_t cancelled = 0;
    uint64_t rejected = 0;     ///< Refused at admission (queue full)
    LatencySummary latency;
};

struct StatsSnapshot {
    std::map<LanguageName, LanguageStats> per_language;
    LanguageStats totals;
};

/**
 * @brief Thread-safe aggregator fed from the registry's terminal hook.
 *
 * record_terminal() is called once per execution by whichever thread won
 * the terminal transition, so counts are never doubled.
 */
class StatsAggregator {
public:
    explicit StatsAggregator(size_t latency_window = 1024);

    void record_terminal(const Execution& execution);
    void record_rejected(const LanguageName& language);

    [[nodiscard]] StatsSnapshot snapshot() const;

    void reset();

private:
    struct Window {
        std::vector<Duration> samples;
        size_t next = 0;               ///< Ring position once full
    };

    struct Bucket {
        LanguageStats counters;
        Window window;
    };

    void push_sample(Window& window, Duration sample);
    static LatencySummary summarize(std::vector<Duration> samples);

    const size_t window_size_;
    mutable std::mutex mutex_;
    std::map<LanguageName, Bucket> buckets_;
};

}  // namespace sandbox_exec
