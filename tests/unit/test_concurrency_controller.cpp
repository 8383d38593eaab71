/**
 * @file test_concurrency_controller.cpp
 * @brief Unit tests for slot admission, queueing and hand-off order.
 */

#include "concurrency/concurrency_controller.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace sandbox_exec;
using namespace std::chrono_literals;

namespace {

/// Spin until @p pred holds or a second passes.
template <typename Pred>
bool eventually(Pred pred) {
    auto deadline = std::chrono::steady_clock::now() + 1s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

}  // namespace

TEST(ConcurrencyControllerTest, GrantsImmediatelyWhileSlotsFree) {
    ConcurrencyController controller(2, 4);

    auto a = controller.request();
    auto b = controller.request();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->granted_immediately());
    EXPECT_TRUE(b->granted_immediately());
    EXPECT_EQ(controller.active_count(), 2u);
    EXPECT_EQ(controller.queue_depth(), 0u);

    auto ticket = a->wait();
    ASSERT_TRUE(ticket.has_value());
    EXPECT_TRUE(ticket->valid());
}

TEST(ConcurrencyControllerTest, QueuesWhenSlotsBusy) {
    ConcurrencyController controller(1, 2);
    auto held = controller.admit();
    ASSERT_TRUE(held.has_value());

    auto queued = controller.request();
    ASSERT_TRUE(queued.has_value());
    EXPECT_FALSE(queued->granted_immediately());
    EXPECT_EQ(controller.queue_depth(), 1u);
    EXPECT_EQ(controller.active_count(), 1u);
}

TEST(ConcurrencyControllerTest, RejectsWhenQueueFull) {
    ConcurrencyController controller(1, 1);
    auto held = controller.admit();
    auto queued = controller.request();
    ASSERT_TRUE(queued.has_value());

    auto overflow = controller.request();
    ASSERT_FALSE(overflow.has_value());
    EXPECT_TRUE(overflow.error().is(ErrorKind::ResourceExhausted));
    EXPECT_EQ(controller.queue_depth(), 1u);
}

TEST(ConcurrencyControllerTest, ZeroQueueDepthFailsFast) {
    ConcurrencyController controller(1, 0);
    auto held = controller.admit();
    ASSERT_TRUE(held.has_value());

    auto second = controller.request();
    ASSERT_FALSE(second.has_value());
    EXPECT_TRUE(second.error().is(ErrorKind::ResourceExhausted));
}

TEST(ConcurrencyControllerTest, TicketReleaseFreesSlot) {
    ConcurrencyController controller(1, 0);
    {
        auto ticket = controller.admit();
        ASSERT_TRUE(ticket.has_value());
        EXPECT_EQ(controller.active_count(), 1u);
    }
    EXPECT_EQ(controller.active_count(), 0u);
    EXPECT_TRUE(controller.request().has_value());
}

TEST(ConcurrencyControllerTest, ExplicitReleaseIsIdempotent) {
    ConcurrencyController controller(2, 0);
    auto ticket = controller.admit();
    ASSERT_TRUE(ticket.has_value());

    ticket->release();
    ticket->release();
    EXPECT_FALSE(ticket->valid());
    EXPECT_EQ(controller.active_count(), 0u);
}

TEST(ConcurrencyControllerTest, MovedTicketReleasesOnce) {
    ConcurrencyController controller(2, 0);
    auto first = controller.admit();
    auto second = controller.admit();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    Ticket moved = std::move(*first);
    EXPECT_FALSE(first->valid());
    moved = std::move(*second);   // releases the slot moved held
    EXPECT_EQ(controller.active_count(), 1u);
    moved.release();
    EXPECT_EQ(controller.active_count(), 0u);
}

TEST(ConcurrencyControllerTest, ReleaseHandsSlotToOldestWaiter) {
    ConcurrencyController controller(1, 3);
    auto held = controller.admit();
    ASSERT_TRUE(held.has_value());

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::jthread> waiters;
    for (int i = 0; i < 3; ++i) {
        auto pending = controller.request();
        ASSERT_TRUE(pending.has_value());
        waiters.emplace_back([&, i, p = std::move(*pending)]() mutable {
            auto ticket = p.wait();
            ASSERT_TRUE(ticket.has_value());
            {
                std::lock_guard lock(order_mutex);
                order.push_back(i);
            }
            std::this_thread::sleep_for(5ms);
        });
    }

    held->release();
    waiters.clear();   // join

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(controller.active_count(), 0u);
    EXPECT_EQ(controller.queue_depth(), 0u);
}

TEST(ConcurrencyControllerTest, NewcomerCannotOvertakeQueue) {
    ConcurrencyController controller(1, 2);
    auto held = controller.admit();
    auto queued = controller.request();
    ASSERT_TRUE(queued.has_value());

    held->release();
    // The freed slot went to the waiter, so a fresh request must queue.
    auto newcomer = controller.request();
    ASSERT_TRUE(newcomer.has_value());
    EXPECT_FALSE(newcomer->granted_immediately());
    EXPECT_EQ(controller.active_count(), 1u);

    auto ticket = queued->wait();
    ASSERT_TRUE(ticket.has_value());
}

TEST(ConcurrencyControllerTest, StopTokenCancelsWait) {
    ConcurrencyController controller(1, 1);
    auto held = controller.admit();
    auto pending = controller.request();
    ASSERT_TRUE(pending.has_value());

    std::stop_source source;
    std::atomic<bool> cancelled{false};
    std::jthread waiter([&] {
        auto ticket = pending->wait(source.get_token());
        cancelled = !ticket.has_value() && ticket.error().is(ErrorKind::Cancelled);
    });

    std::this_thread::sleep_for(20ms);
    source.request_stop();
    waiter.join();

    EXPECT_TRUE(cancelled.load());
    EXPECT_EQ(controller.queue_depth(), 0u);
    EXPECT_EQ(controller.active_count(), 1u);
}

TEST(ConcurrencyControllerTest, AbandonedQueuePositionIsReturned) {
    ConcurrencyController controller(1, 1);
    auto held = controller.admit();
    {
        auto pending = controller.request();
        ASSERT_TRUE(pending.has_value());
        EXPECT_EQ(controller.queue_depth(), 1u);
    }
    EXPECT_EQ(controller.queue_depth(), 0u);
    EXPECT_TRUE(controller.request().has_value());
}

TEST(ConcurrencyControllerTest, AbandonedGrantedSlotIsReturned) {
    ConcurrencyController controller(1, 1);
    {
        auto pending = controller.request();
        ASSERT_TRUE(pending.has_value());
        EXPECT_TRUE(pending->granted_immediately());
    }
    EXPECT_EQ(controller.active_count(), 0u);
}

TEST(ConcurrencyControllerTest, WaitTwiceIsAnError) {
    ConcurrencyController controller(1, 0);
    auto pending = controller.request();
    ASSERT_TRUE(pending.has_value());
    auto ticket = pending->wait();
    ASSERT_TRUE(ticket.has_value());

    auto again = pending->wait();
    EXPECT_FALSE(again.has_value());
}

TEST(ConcurrencyControllerTest, NeverExceedsCapacityUnderContention) {
    constexpr size_t kSlots = 3;
    ConcurrencyController controller(kSlots, 64);
    std::atomic<size_t> inside{0};
    std::atomic<size_t> peak{0};
    std::atomic<size_t> admitted{0};

    std::vector<std::jthread> threads;
    for (int i = 0; i < 24; ++i) {
        threads.emplace_back([&] {
            auto ticket = controller.admit();
            if (!ticket) return;
            ++admitted;
            size_t now = ++inside;
            size_t prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(2ms);
            --inside;
        });
    }
    threads.clear();

    EXPECT_EQ(admitted.load(), 24u);
    EXPECT_LE(peak.load(), kSlots);
    EXPECT_TRUE(eventually([&] { return controller.active_count() == 0; }));
}
