/**
 * @file bench_admission.cpp
 * @brief Overhead benchmarks for admission, bookkeeping and sandbox startup.
 *
 * Measures the engine's own cost per execution: slot admission, registry
 * transitions, stats, worker hand-off, and a full submit-to-terminal round
 * trip with both the in-memory and the supervised process backend.
 *
 * Usage: ./bench_admission [--csv]
 */

#include "concurrency/concurrency_controller.hpp"
#include "core/config.hpp"
#include "engine/execution_engine.hpp"
#include "executor/worker_pool.hpp"
#include "registry/execution_registry.hpp"
#include "sandbox/mock_sandbox.hpp"
#include "stats/stats_aggregator.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace sandbox_exec;
using Clock = std::chrono::steady_clock;

// ─────────────────────────────────────────────
// Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double p50_us;
    double p99_us;
    size_t iterations;
    std::string note;
};

template <typename Fn>
BenchResult run_bench(const std::string& name, const std::string& category,
                      size_t iterations, Fn&& fn, const std::string& note = "") {
    for (size_t i = 0; i < std::min<size_t>(iterations / 10, 5); ++i) fn();

    std::vector<double> us;
    us.reserve(iterations);
    for (size_t i = 0; i < iterations; ++i) {
        auto t0 = Clock::now();
        fn();
        us.push_back(std::chrono::duration<double, std::micro>(Clock::now() - t0).count());
    }
    std::sort(us.begin(), us.end());

    const double n = static_cast<double>(iterations);
    const double mean = std::accumulate(us.begin(), us.end(), 0.0) / n;
    const double var = std::accumulate(us.begin(), us.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); }) / n;
    auto at = [&us](double q) {
        return us[std::min(static_cast<size_t>(q * static_cast<double>(us.size())), us.size() - 1)];
    };

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = std::sqrt(var),
        .min_us = us.front(), .p50_us = at(0.50), .p99_us = at(0.99),
        .iterations = iterations, .note = note
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,p50_us,p99_us,iterations,note\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << "," << r.min_us << ","
                      << r.p50_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.note << "\n";
        }
        return;
    }

    std::string category;
    for (const auto& r : results) {
        if (r.category != category) {
            category = r.category;
            std::cout << "\n== " << category << " ==\n"
                      << std::left << std::setw(36) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P50(us)"
                      << std::setw(11) << "P99(us)"
                      << "  Note\n"
                      << std::string(90, '-') << "\n";
        }
        std::cout << std::left << std::setw(36) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p50_us
                  << std::setw(11) << r.p99_us
                  << "  " << r.note << "\n";
    }
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_admission() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;

    ConcurrencyController free_slots(8, 16);
    R.push_back(run_bench("admit_release_free_slot", "Admission", N, [&] {
        auto ticket = free_slots.admit();
        (void)ticket;
    }));

    ConcurrencyController full(1, 1);
    auto holder = full.admit();
    auto waiting = full.request();
    R.push_back(run_bench("reject_when_queue_full", "Admission", N, [&] {
        auto r = full.request();
        (void)r;
    }, "fail-fast path"));

    ConcurrencyController handoff(1, 1);
    R.push_back(run_bench("queued_handoff", "Admission", 1000, [&] {
        auto first = handoff.admit();
        auto queued = handoff.request();
        std::thread releaser([t = std::move(*first)]() mutable { t.release(); });
        auto ticket = queued->wait();
        releaser.join();
    }, "cross-thread release"));

    return R;
}

std::vector<BenchResult> bench_registry() {
    std::vector<BenchResult> R;
    constexpr size_t N = 5000;
    ExecutionRegistry registry(64 * 1024);
    const ExecutionRequest request{.language = "python", .code = "print(1)", .options = {}};
    const Identity owner{"bench"};

    R.push_back(run_bench("create", "Registry", N, [&] {
        auto id = registry.create(request, owner, 1000);
        (void)id;
    }, "uuid v4 + insert"));

    R.push_back(run_bench("create_run_finish", "Registry", N, [&] {
        auto id = registry.create(request, owner, 1000);
        auto running = registry.mark_running(id);
        registry.finish(id, Completion{.status = ExecutionStatus::Succeeded});
    }, "full state machine"));

    auto id = registry.create(request, owner, 1000);
    auto running = registry.mark_running(id);
    const std::string chunk(256, 'o');
    R.push_back(run_bench("append_output_256B", "Registry", N, [&] {
        registry.append_output(id, chunk);
    }, "until cap, then dropped"));

    R.push_back(run_bench("snapshot", "Registry", N, [&] {
        auto s = registry.snapshot(id);
        (void)s;
    }, std::to_string(registry.size()) + " records"));

    R.push_back(run_bench("evict_sweep", "Registry", 50, [&] {
        auto n = registry.evict_expired(std::chrono::system_clock::now(), Duration{600000});
        (void)n;
    }, "nothing expired"));

    return R;
}

std::vector<BenchResult> bench_stats() {
    std::vector<BenchResult> R;
    StatsAggregator stats(1024);
    Execution e;
    e.status = ExecutionStatus::Succeeded;
    e.started_at = std::chrono::system_clock::now();
    e.ended_at = *e.started_at + Duration{42};

    const std::vector<std::string> languages{"python", "javascript", "shell", "go", "rust"};
    size_t i = 0;
    R.push_back(run_bench("record_terminal", "Stats", 10000, [&] {
        e.language = languages[i++ % languages.size()];
        stats.record_terminal(e);
    }));
    R.push_back(run_bench("snapshot", "Stats", 500, [&] {
        auto s = stats.snapshot();
        (void)s;
    }, "5 languages, full windows"));

    return R;
}

std::vector<BenchResult> bench_engine() {
    std::vector<BenchResult> R;

    WorkerPool pool(4);
    R.push_back(run_bench("worker_pool_handoff", "Engine", 2000, [&] {
        std::promise<void> done;
        auto f = done.get_future();
        pool.post([&done](std::stop_token) { done.set_value(); });
        f.wait();
    }));

    {
        ExecutionEngine::Options opts;
        opts.config.engine.max_concurrent = 4;
        opts.config.engine.max_queue_depth = 16;
        opts.sandbox_manager = std::make_unique<MockSandboxManager>(SandboxScript{.output = "ok\n"});
        ExecutionEngine engine(std::move(opts));
        const ExecutionRequest request{.language = "python", .code = "print('ok')", .options = {}};
        R.push_back(run_bench("execute_mock_sandbox", "Engine", 2000, [&] {
            auto r = engine.execute(request, Identity::anonymous());
            (void)r;
        }, "engine overhead only"));
    }

    {
        auto root = std::filesystem::temp_directory_path() / "sx_bench_sandboxes";
        ExecutionEngine::Options opts;
        opts.config.sandbox.root_dir = root;
        opts.config.sandbox.require_landlock = false;
        opts.config.limits.output_cap_bytes = 4096;
        ExecutionEngine engine(std::move(opts));
        const ExecutionRequest request{.language = "shell", .code = "true", .options = {}};
        R.push_back(run_bench("execute_process_sandbox", "Engine", 100, [&] {
            auto r = engine.execute(request, Identity::anonymous());
            (void)r;
        }, "supervisor + workspace"));
        engine.shutdown();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  SandboxExec Overhead Benchmarks\n"
                  << "  " << std::string(32, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&all](auto&& v) { all.insert(all.end(), v.begin(), v.end()); };

    append(bench_admission());
    append(bench_registry());
    append(bench_stats());
    append(bench_engine());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
