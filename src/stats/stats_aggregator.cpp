/**
 * @file stats_aggregator.cpp
 * @brief StatsAggregator implementation.
 */

#include "stats/stats_aggregator.hpp"

#include <algorithm>

namespace sandbox_exec {

StatsAggregator::StatsAggregator(size_t latency_window)
    : window_size_(std::max<size_t>(latency_window, 1)) {}

void StatsAggregator::record_terminal(const Execution& execution) {
    std::lock_guard lock(mutex_);
    auto& bucket = buckets_[execution.language];
    auto& c = bucket.counters;

    ++c.attempts;
    switch (execution.status) {
        case ExecutionStatus::Succeeded: ++c.succeeded; break;
        case ExecutionStatus::Failed:    ++c.failed;    break;
        case ExecutionStatus::TimedOut:  ++c.timed_out; break;
        case ExecutionStatus::Cancelled: ++c.cancelled; break;
        default: break;
    }

    // Only executions that actually ran contribute latency.
    if (execution.started_at) {
        push_sample(bucket.window, execution.duration());
    }
}

void StatsAggregator::record_rejected(const LanguageName& language) {
    std::lock_guard lock(mutex_);
    ++buckets_[language].counters.rejected;
}

void StatsAggregator::push_sample(Window& window, Duration sample) {
    if (window.samples.size() < window_size_) {
        window.samples.push_back(sample);
        return;
    }
    window.samples[window.next] = sample;
    window.next = (window.next + 1) % window_size_;
}

LatencySummary StatsAggregator::summarize(std::vector<Duration> samples) {
    LatencySummary summary;
    summary.samples = samples.size();
    if (samples.empty()) return summary;

    // Nearest-rank percentile.
    auto rank = [&samples](double pct) {
        auto idx = static_cast<size_t>(pct * static_cast<double>(samples.size() - 1) + 0.5);
        std::nth_element(samples.begin(), samples.begin() + static_cast<long>(idx), samples.end());
        return samples[idx];
    };
    summary.p50 = rank(0.50);
    summary.p95 = rank(0.95);
    summary.max = *std::max_element(samples.begin(), samples.end());
    return summary;
}

StatsSnapshot StatsAggregator::snapshot() const {
    std::lock_guard lock(mutex_);
    StatsSnapshot snap;
    std::vector<Duration> all_samples;

    for (const auto& [language, bucket] : buckets_) {
        auto stats = bucket.counters;
        stats.latency = summarize(bucket.window.samples);
        snap.per_language.emplace(language, stats);

        auto& t = snap.totals;
        t.attempts += stats.attempts;
        t.succeeded += stats.succeeded;
        t.failed += stats.failed;
        t.timed_out += stats.timed_out;
        t.cancelled += stats.cancelled;
        t.rejected += stats.rejected;
        all_samples.insert(all_samples.end(),
                           bucket.window.samples.begin(), bucket.window.samples.end());
    }
    snap.totals.latency = summarize(std::move(all_samples));
    return snap;
}

void StatsAggregator::reset() {
    std::lock_guard lock(mutex_);
    buckets_.clear();
}

}  // namespace sandbox_exec
