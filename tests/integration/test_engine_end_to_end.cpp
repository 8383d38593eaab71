/**
 * @file test_engine_end_to_end.cpp
 * @brief Integration tests running real programs through the full engine.
 *
 * Uses the supervised process backend without requiring Landlock. Shell
 * programs only need /bin/sh; the Python cases skip themselves when no
 * working interpreter is on PATH.
 */

#include "engine/execution_engine.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

#include <signal.h>
#include <unistd.h>

using namespace sandbox_exec;
using namespace std::chrono_literals;

namespace {

struct TallyObserver : IExecutionObserver {
    void on_started(const Execution&) override { ++started; }
    void on_completed(const Execution&) override { ++terminal; }
    void on_error(const Execution&) override { ++terminal; }

    std::atomic<int> started{0};
    std::atomic<int> terminal{0};
};

}  // namespace

class EngineIntegration : public ::testing::Test {
protected:
    std::filesystem::path root_;
    Config config_;
    std::unique_ptr<ExecutionEngine> engine_;

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path()
              / ("sx_integration_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root_);

        config_.engine.max_concurrent = 2;
        config_.engine.max_queue_depth = 8;
        config_.limits.min_timeout_ms = 100;
        config_.limits.default_timeout_ms = 10000;
        config_.limits.kill_grace_ms = 200;
        config_.sandbox.root_dir = root_ / "sandboxes";
        config_.sandbox.require_landlock = false;
    }

    void TearDown() override {
        engine_.reset();
        std::filesystem::remove_all(root_);
    }

    void start(std::vector<std::shared_ptr<IExecutionObserver>> observers = {}) {
        ExecutionEngine::Options opts;
        opts.config = config_;
        opts.log_sink = std::make_unique<NullSink>();
        opts.observers = std::move(observers);
        engine_ = std::make_unique<ExecutionEngine>(std::move(opts));
    }

    static ExecutionRequest shell(std::string code, std::optional<uint32_t> timeout_ms = std::nullopt) {
        ExecutionRequest request{.language = "shell", .code = std::move(code), .options = {}};
        request.options.timeout_ms = timeout_ms;
        return request;
    }

    bool wait_for_status(const ExecutionId& id, ExecutionStatus status) {
        auto deadline = std::chrono::steady_clock::now() + 10s;
        while (std::chrono::steady_clock::now() < deadline) {
            auto snap = engine_->status(id);
            if (snap && snap->status == status) return true;
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    size_t leftover_workspaces() const {
        const auto dir = config_.sandbox.root_dir;
        if (!std::filesystem::exists(dir)) return 0;
        size_t n = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir)) ++n;
        return n;
    }

    /// Skip unless a trivial Python program actually runs in a sandbox.
    void require_python() {
        auto smoke = engine_->execute(
            ExecutionRequest{.language = "python", .code = "print('ok')", .options = {}},
            Identity::anonymous());
        if (!smoke || smoke->status != ExecutionStatus::Succeeded) {
            GTEST_SKIP() << "python3 is not usable in the sandbox";
        }
    }
};

// ═══════════════════════════════════════════════
// Outcomes
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, ShellHelloWorld) {
    start();
    auto result = engine_->execute(shell("echo \"Hello, World!\""), Identity{"alice"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->status, ExecutionStatus::Succeeded);
    EXPECT_EQ(result->output, "Hello, World!\n");
    EXPECT_EQ(result->exit_code, 0);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(EngineIntegration, NonZeroExitIsFailedWithCode) {
    start();
    auto result = engine_->execute(shell("echo nope >&2; exit 42"), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->error_kind, ErrorKind::ExecutionCrashed);
    EXPECT_EQ(result->exit_code, 42);
    EXPECT_EQ(result->output, "nope\n");
}

TEST_F(EngineIntegration, InfiniteLoopTimesOut) {
    start();
    auto started = std::chrono::steady_clock::now();
    auto result = engine_->execute(shell("while :; do :; done", 300), Identity::anonymous());
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::TimedOut);
    EXPECT_EQ(result->error_kind, ErrorKind::ExecutionTimeout);
    EXPECT_GE(elapsed, 300ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(engine_->sandboxes().active_count(), 0u);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(EngineIntegration, BackgroundChildrenDieWithTheSandbox) {
    start();
    auto result = engine_->execute(shell("sleep 30 & sleep 30", 300), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::TimedOut);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(EngineIntegration, DetachedProcessDoesNotOutliveExecution) {
    start();
    auto result = engine_->execute(shell(
        "( sh -c 'read pid rest < /proc/self/stat; echo $pid > bg.pid; exec sleep 77'"
        " </dev/null >/dev/null 2>&1 & )\n"
        "while [ ! -s bg.pid ]; do sleep 0.05; done\n"
        "cat bg.pid\n"), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Succeeded);

    const pid_t pid = static_cast<pid_t>(std::strtol(result->output.c_str(), nullptr, 10));
    ASSERT_GT(pid, 0) << result->output;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    bool gone = false;
    while (!gone && std::chrono::steady_clock::now() < deadline) {
        gone = ::kill(pid, 0) == -1 && errno == ESRCH;
        if (!gone) std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(gone) << "pid " << pid << " outlived its execution";
}

// ═══════════════════════════════════════════════
// Resource limits
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, MemoryHogFails) {
    LanguageOverride cap;
    cap.memory_mb = 64;
    config_.languages.overrides["shell"] = cap;
    start();

    auto result = engine_->execute(
        shell("x=$(head -c 268435456 /dev/zero | tr '\\0' a); echo survived ${#x}", 20000),
        Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->output.find("survived"), std::string::npos) << result->output;
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(EngineIntegration, SuccessfulRunReportsResourceUsage) {
    start();
    auto result = engine_->execute(shell("echo measured"), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Succeeded);
    ASSERT_TRUE(result->usage.has_value());
    EXPECT_GT(result->usage->peak_memory_kb, 0);
}

TEST_F(EngineIntegration, LargeOutputIsTruncated) {
    config_.limits.output_cap_bytes = 1024;
    start();
    auto result = engine_->execute(shell("yes x | head -c 200000"), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Succeeded);
    EXPECT_TRUE(result->output_truncated);
    EXPECT_EQ(result->output.size(), 1024 + kTruncationMarker.size());
    EXPECT_TRUE(result->output.ends_with(kTruncationMarker));
}

// ═══════════════════════════════════════════════
// Admission
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, NeverExceedsConcurrencyBound) {
    start();
    std::atomic<bool> sampling{true};
    std::atomic<size_t> peak{0};
    std::jthread sampler([&] {
        while (sampling) {
            size_t now = engine_->sandboxes().active_count();
            if (now > peak) peak = now;
            std::this_thread::sleep_for(1ms);
        }
    });

    std::vector<ExecutionId> ids;
    for (int i = 0; i < 8; ++i) {
        auto id = engine_->submit(shell("sleep 0.2; echo done"), Identity::anonymous());
        ASSERT_TRUE(id.has_value()) << id.error().message;
        ids.push_back(*id);
    }
    for (const auto& id : ids) {
        auto done = engine_->wait(id);
        ASSERT_TRUE(done.has_value());
        EXPECT_EQ(done->status, ExecutionStatus::Succeeded);
    }
    sampling = false;

    EXPECT_LE(peak.load(), 2u);
    EXPECT_GE(peak.load(), 1u);
}

TEST_F(EngineIntegration, BackpressureRejectsOverflow) {
    config_.engine.max_concurrent = 1;
    config_.engine.max_queue_depth = 1;
    start();

    auto running = engine_->submit(shell("sleep 5"), Identity::anonymous());
    ASSERT_TRUE(running.has_value());
    auto queued = engine_->submit(shell("sleep 5"), Identity::anonymous());
    ASSERT_TRUE(queued.has_value());

    auto rejected = engine_->submit(shell("echo never"), Identity::anonymous());
    ASSERT_FALSE(rejected.has_value());
    EXPECT_TRUE(rejected.error().is(ErrorKind::ResourceExhausted));
    EXPECT_EQ(engine_->stats().per_language.at("shell").rejected, 1u);

    EXPECT_TRUE(engine_->cancel(*queued).has_value());
    EXPECT_TRUE(engine_->cancel(*running).has_value());
}

// ═══════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, CancelRunningStopsProcess) {
    start();
    auto id = engine_->submit(shell("echo begin; sleep 30"), Identity::anonymous());
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for_status(*id, ExecutionStatus::Running));
    std::this_thread::sleep_for(100ms);

    auto started = std::chrono::steady_clock::now();
    auto outcome = engine_->cancel(*id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->already_terminal);

    auto final_state = engine_->wait(*id);
    ASSERT_TRUE(final_state.has_value());
    EXPECT_EQ(final_state->status, ExecutionStatus::Cancelled);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (engine_->sandboxes().active_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(engine_->sandboxes().active_count(), 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST_F(EngineIntegration, CancelQueuedNeverStarts) {
    config_.engine.max_concurrent = 1;
    start();

    auto blocker = engine_->submit(shell("sleep 5"), Identity::anonymous());
    ASSERT_TRUE(blocker.has_value());
    ASSERT_TRUE(wait_for_status(*blocker, ExecutionStatus::Running));
    auto queued = engine_->submit(shell("echo should-not-run"), Identity::anonymous());
    ASSERT_TRUE(queued.has_value());

    auto outcome = engine_->cancel(*queued);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Cancelled);

    ASSERT_TRUE(engine_->cancel(*blocker).has_value());
    ASSERT_TRUE(engine_->wait(*blocker, 5000ms)->terminal());
    std::this_thread::sleep_for(100ms);

    auto snap = engine_->status(*queued);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->status, ExecutionStatus::Cancelled);
    EXPECT_FALSE(snap->started_at.has_value());
    EXPECT_TRUE(snap->output.empty());
}

TEST_F(EngineIntegration, CancelAfterCompletionIsAlreadyTerminal) {
    start();
    auto result = engine_->execute(shell("echo quick"), Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->status, ExecutionStatus::Succeeded);

    auto outcome = engine_->cancel(result->id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->already_terminal);
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Succeeded);
    EXPECT_EQ(outcome->execution.output, "quick\n");
}

TEST_F(EngineIntegration, RacingCancelYieldsSingleTerminal) {
    config_.engine.max_concurrent = 4;
    config_.engine.max_queue_depth = 32;
    auto tally = std::make_shared<TallyObserver>();
    start({tally});

    constexpr int kRuns = 24;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> delay_ms(0, 60);

    std::vector<ExecutionId> ids;
    std::vector<std::jthread> cancellers;
    for (int i = 0; i < kRuns; ++i) {
        auto id = engine_->submit(shell("sleep 0.03; echo finished"), Identity::anonymous());
        ASSERT_TRUE(id.has_value()) << id.error().message;
        ids.push_back(*id);
        cancellers.emplace_back([this, id = *id, delay = delay_ms(rng)] {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            auto outcome = engine_->cancel(id);
            EXPECT_TRUE(outcome.has_value());
        });
    }
    cancellers.clear();

    for (const auto& id : ids) {
        auto done = engine_->wait(id);
        ASSERT_TRUE(done.has_value());
        EXPECT_TRUE(done->status == ExecutionStatus::Succeeded
                    || done->status == ExecutionStatus::Cancelled)
            << to_string(done->status);
        if (done->status == ExecutionStatus::Succeeded) {
            EXPECT_EQ(done->output, "finished\n");
        }
    }

    auto stats = engine_->stats().per_language.at("shell");
    EXPECT_EQ(stats.attempts, static_cast<uint64_t>(kRuns));
    EXPECT_EQ(stats.succeeded + stats.cancelled, static_cast<uint64_t>(kRuns));
    EXPECT_EQ(tally->terminal.load(), kRuns);
}

TEST_F(EngineIntegration, JavascriptAllocationPastDataLimitFails) {
    start();
    const auto missing = engine_->health().unavailable_languages;
    if (std::find(missing.begin(), missing.end(), "javascript") != missing.end()) {
        GTEST_SKIP() << "node not installed";
    }

    auto result = engine_->execute(
        ExecutionRequest{.language = "javascript",
                         .code = "const b = Buffer.alloc(1200 * 1024 * 1024, 1);\n"
                                 "console.log('allocated', b.length);",
                         .options = {.timeout_ms = 30000, .project_id = std::nullopt}},
        Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Failed) << result->output;
    EXPECT_EQ(result->output.find("allocated"), std::string::npos) << result->output;
}

// ═══════════════════════════════════════════════
// Discovery and health
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, HealthAndLanguages) {
    start();
    auto health = engine_->health();
    EXPECT_EQ(health.capacity, 2u);
    EXPECT_EQ(health.active_count, 0u);
    // The shell runtime always exists.
    EXPECT_EQ(std::find(health.unavailable_languages.begin(), health.unavailable_languages.end(),
                        "shell"),
              health.unavailable_languages.end());

    auto languages = engine_->list_languages();
    EXPECT_GE(languages.size(), 10u);
}

// ═══════════════════════════════════════════════
// Python
// ═══════════════════════════════════════════════

TEST_F(EngineIntegration, PythonHelloWorld) {
    config_.sandbox.clean_environment = false;
    start();
    require_python();
    if (IsSkipped()) return;

    auto result = engine_->execute(
        ExecutionRequest{.language = "python", .code = "print('Hello, World!')", .options = {}},
        Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Succeeded);
    EXPECT_EQ(result->output, "Hello, World!\n");
}

TEST_F(EngineIntegration, PythonInfiniteLoopTimesOut) {
    config_.sandbox.clean_environment = false;
    start();
    require_python();
    if (IsSkipped()) return;

    ExecutionRequest request{.language = "python", .code = "while True:\n    pass\n", .options = {}};
    request.options.timeout_ms = 500;
    auto result = engine_->execute(request, Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::TimedOut);
    EXPECT_EQ(leftover_workspaces(), 0u);
}

TEST_F(EngineIntegration, PythonExceptionIsFailure) {
    config_.sandbox.clean_environment = false;
    start();
    require_python();
    if (IsSkipped()) return;

    auto result = engine_->execute(
        ExecutionRequest{.language = "python", .code = "raise ValueError('bad input')", .options = {}},
        Identity::anonymous());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, ExecutionStatus::Failed);
    EXPECT_EQ(result->exit_code, 1);
    EXPECT_NE(result->output.find("ValueError: bad input"), std::string::npos);
}
