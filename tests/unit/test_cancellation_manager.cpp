/**
 * @file test_cancellation_manager.cpp
 * @brief Unit tests for cancelling queued and running executions.
 */

#include "cancellation/cancellation_manager.hpp"
#include "sandbox/mock_sandbox.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <thread>
#include <vector>

using namespace sandbox_exec;

class CancellationManagerTest : public ::testing::Test {
protected:
    ExecutionRegistry registry_{1024};
    CancellationManager cancellation_{registry_, Logger(std::make_unique<NullSink>())};
    std::shared_ptr<MockSignalLog> signals_ = std::make_shared<MockSignalLog>();

    ExecutionId create() {
        ExecutionRequest request{.language = "shell", .code = "sleep 10", .options = {}};
        return registry_.create(request, Identity::anonymous(), 5000);
    }
};

TEST_F(CancellationManagerTest, UnknownIdIsNotFound) {
    auto outcome = cancellation_.cancel("missing");
    ASSERT_FALSE(outcome.has_value());
    EXPECT_TRUE(outcome.error().is(ErrorKind::NotFound));
}

TEST_F(CancellationManagerTest, CancelQueuedClaimsAndStops) {
    auto id = create();
    auto token = cancellation_.attach(id);

    auto outcome = cancellation_.cancel(id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->already_terminal);
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(outcome->execution.error_kind, ErrorKind::Cancelled);
    EXPECT_FALSE(outcome->execution.started_at.has_value());
    EXPECT_TRUE(token.stop_requested());

    // The worker can no longer start it.
    EXPECT_TRUE(registry_.mark_running(id).error().is(ErrorKind::AlreadyTerminal));
}

TEST_F(CancellationManagerTest, CancelRunningSignalsBoundSandbox) {
    auto id = create();
    auto token = cancellation_.attach(id);
    ASSERT_TRUE(registry_.mark_running(id).has_value());

    MockSandboxHandle handle(4242, SandboxScript{.hang = true}, signals_);
    cancellation_.bind_sandbox(id, &handle);

    auto outcome = cancellation_.cancel(id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->already_terminal);
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(signals_->sigterm.load(), 1u);
    EXPECT_TRUE(token.stop_requested());
    ASSERT_TRUE(handle.try_wait().has_value());
    EXPECT_EQ(handle.try_wait()->term_signal, SIGTERM);

    cancellation_.unbind_sandbox(id);
}

TEST_F(CancellationManagerTest, UnboundSandboxIsNotSignalled) {
    auto id = create();
    cancellation_.attach(id);
    ASSERT_TRUE(registry_.mark_running(id).has_value());

    MockSandboxHandle handle(4243, SandboxScript{.hang = true}, signals_);
    cancellation_.bind_sandbox(id, &handle);
    cancellation_.unbind_sandbox(id);

    ASSERT_TRUE(cancellation_.cancel(id).has_value());
    EXPECT_EQ(signals_->sigterm.load(), 0u);
}

TEST_F(CancellationManagerTest, CancelAfterCompletionReportsTerminalStatus) {
    auto id = create();
    ASSERT_TRUE(registry_.mark_running(id).has_value());
    ASSERT_TRUE(registry_.finish(id, Completion{.status = ExecutionStatus::Succeeded}));

    auto outcome = cancellation_.cancel(id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->already_terminal);
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Succeeded);
}

TEST_F(CancellationManagerTest, SecondCancelIsAlreadyTerminal) {
    auto id = create();
    ASSERT_FALSE(cancellation_.cancel(id)->already_terminal);
    auto again = cancellation_.cancel(id);
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->already_terminal);
    EXPECT_EQ(again->execution.status, ExecutionStatus::Cancelled);
}

TEST_F(CancellationManagerTest, ConcurrentCancelsClaimOnce) {
    auto id = create();
    cancellation_.attach(id);
    ASSERT_TRUE(registry_.mark_running(id).has_value());

    std::atomic<int> claimed{0};
    std::atomic<int> listener_calls{0};
    registry_.set_terminal_listener([&](const Execution&) { ++listener_calls; });

    std::vector<std::jthread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto outcome = cancellation_.cancel(id);
            if (outcome && !outcome->already_terminal) ++claimed;
        });
    }
    threads.clear();

    EXPECT_EQ(claimed.load(), 1);
    EXPECT_EQ(listener_calls.load(), 1);
}

TEST_F(CancellationManagerTest, CancelAllClaimsEveryActiveExecution) {
    auto queued = create();
    auto running = create();
    auto done = create();
    for (const auto& id : {queued, running, done}) cancellation_.attach(id);
    ASSERT_TRUE(registry_.mark_running(running).has_value());
    ASSERT_TRUE(registry_.mark_running(done).has_value());
    ASSERT_TRUE(registry_.finish(done, Completion{.status = ExecutionStatus::Succeeded}));

    EXPECT_EQ(cancellation_.cancel_all(), 2u);
    EXPECT_EQ(registry_.status_of(queued), ExecutionStatus::Cancelled);
    EXPECT_EQ(registry_.status_of(running), ExecutionStatus::Cancelled);
    EXPECT_EQ(registry_.status_of(done), ExecutionStatus::Succeeded);
}

TEST_F(CancellationManagerTest, DetachForgetsExecution) {
    auto id = create();
    cancellation_.attach(id);
    EXPECT_EQ(cancellation_.tracked(), 1u);
    cancellation_.detach(id);
    EXPECT_EQ(cancellation_.tracked(), 0u);

    // Still cancellable through the registry alone.
    auto outcome = cancellation_.cancel(id);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->execution.status, ExecutionStatus::Cancelled);
}
