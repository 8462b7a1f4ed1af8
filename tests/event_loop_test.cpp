#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "scheduler/event_loop.hpp"

namespace filecron::scheduler {
namespace {

constexpr auto kWaitLimit = std::chrono::seconds(2);

TEST(EventLoopTest, PostedTasksRunInOrder) {
    EventLoop loop;
    loop.Start();

    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;
    for (int i = 0; i < 3; ++i) {
        loop.Post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    loop.Post([&done]() { done.set_value(); });

    ASSERT_EQ(done.get_future().wait_for(kWaitLimit), std::future_status::ready);
    loop.Stop();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(EventLoopTest, TimersFireInDueOrder) {
    EventLoop loop;
    loop.Start();

    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;
    const auto now = loop.Now();
    loop.ScheduleAt(now + std::chrono::milliseconds(80), [&]() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(2);
        }
        done.set_value();
    });
    loop.ScheduleAt(now + std::chrono::milliseconds(20), [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(1);
    });

    ASSERT_EQ(done.get_future().wait_for(kWaitLimit), std::future_status::ready);
    EXPECT_GE(loop.Now(), now + std::chrono::milliseconds(80));
    loop.Stop();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(EventLoopTest, PastDueTimerRunsPromptly) {
    EventLoop loop;
    loop.Start();
    std::promise<void> done;
    loop.ScheduleAt(loop.Now() - std::chrono::seconds(5), [&done]() { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(kWaitLimit), std::future_status::ready);
    loop.Stop();
}

TEST(EventLoopTest, CancelledTimerNeverRuns) {
    EventLoop loop;
    loop.Start();

    std::atomic<bool> fired{false};
    const auto id = loop.ScheduleAt(loop.Now() + std::chrono::milliseconds(50), [&fired]() { fired = true; });
    EXPECT_NE(id, 0u);
    EXPECT_EQ(loop.PendingTimers(), 1u);
    EXPECT_TRUE(loop.Cancel(id));
    EXPECT_FALSE(loop.Cancel(id));
    EXPECT_EQ(loop.PendingTimers(), 0u);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    loop.Stop();
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, OffloadedWorkCompletesOnTheLoopThread) {
    EventLoop loop;
    loop.Start();

    std::promise<std::thread::id> loop_thread;
    loop.Post([&loop_thread]() { loop_thread.set_value(std::this_thread::get_id()); });
    const auto loop_id = loop_thread.get_future().get();

    std::thread::id work_id;
    std::promise<std::thread::id> then_thread;
    loop.Offload([&work_id]() { work_id = std::this_thread::get_id(); },
                 [&then_thread]() { then_thread.set_value(std::this_thread::get_id()); });

    auto then_future = then_thread.get_future();
    ASSERT_EQ(then_future.wait_for(kWaitLimit), std::future_status::ready);
    EXPECT_EQ(then_future.get(), loop_id);
    EXPECT_NE(work_id, loop_id);
    loop.Stop();
}

TEST(EventLoopTest, StopFinishesInFlightCompletions) {
    EventLoop loop;
    loop.Start();

    std::atomic<bool> completed{false};
    loop.Offload([]() { std::this_thread::sleep_for(std::chrono::milliseconds(100)); },
                 [&completed]() { completed = true; });
    loop.Stop();

    EXPECT_TRUE(completed);
    EXPECT_FALSE(loop.IsRunning());
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopTheLoop) {
    EventLoop loop;
    loop.Start();

    std::promise<void> done;
    loop.Post([]() { throw std::runtime_error("boom"); });
    loop.Post([&done]() { done.set_value(); });

    EXPECT_EQ(done.get_future().wait_for(kWaitLimit), std::future_status::ready);
    loop.Stop();
}

TEST(EventLoopTest, StopDropsPendingTimers) {
    EventLoop loop;
    loop.Start();
    loop.ScheduleAt(loop.Now() + std::chrono::hours(1), []() {});
    loop.Stop();
    EXPECT_EQ(loop.PendingTimers(), 0u);
}

}  // namespace
}  // namespace filecron::scheduler
