#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "bus/event_log.hpp"
#include "bus/events.hpp"
#include "bus/message_bus.hpp"

namespace filecron::bus {
namespace {

ExecutionEvent MakeEvent(const std::string& task_id, EventStatus status = EventStatus::kSuccess) {
    ExecutionEvent event{};
    event.task_id = task_id;
    event.tool_name = "Echo (Timed)";
    event.status = status;
    event.content = "Timed task " + task_id + " executed successfully.\nTool response: hi";
    event.source = status == EventStatus::kSuccess ? kExecutorSource : kExecutorErrorSource;
    return event;
}

TEST(ExecutionEventTest, SerializesNotificationShape) {
    auto event = MakeEvent("t1");
    event.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1767232800123));

    const auto json = event.ToJson();
    EXPECT_EQ(json["type"], "task_log");
    EXPECT_EQ(json["timestamp_ms"], 1767232800123LL);
    EXPECT_EQ(json["data"]["task_id"], "t1");
    EXPECT_EQ(json["data"]["tool_name"], "Echo (Timed)");
    EXPECT_EQ(json["data"]["status"], "success");
    EXPECT_EQ(json["data"]["source"], "task_scheduler_executor");
    EXPECT_FALSE(json["data"].contains("details"));

    auto failed = MakeEvent("t2", EventStatus::kError);
    failed.details = "backend unavailable";
    const auto failed_json = failed.ToJson();
    EXPECT_EQ(failed_json["data"]["status"], "error");
    EXPECT_EQ(failed_json["data"]["details"], "backend unavailable");
    EXPECT_EQ(failed_json["data"]["source"], "task_scheduler_executor_error");
}

TEST(MessageBusTest, PublishQueuesUntilConsumed) {
    MessageBus bus;
    bus.Publish(MakeEvent("t1"));
    bus.Publish(MakeEvent("t2"));
    EXPECT_EQ(bus.Size(), 2u);

    ExecutionEvent event{};
    ASSERT_TRUE(bus.TryConsume(event, std::chrono::milliseconds(0)));
    EXPECT_EQ(event.task_id, "t1");
    ASSERT_TRUE(bus.TryConsume(event, std::chrono::milliseconds(0)));
    EXPECT_EQ(event.task_id, "t2");
    EXPECT_FALSE(bus.TryConsume(event, std::chrono::milliseconds(10)));
}

TEST(MessageBusTest, FailingSubscriberDoesNotStopDelivery) {
    MessageBus bus;
    std::vector<std::string> seen;
    bus.Subscribe([](const ExecutionEvent&) { throw std::runtime_error("sink down"); });
    bus.Subscribe([&seen](const ExecutionEvent& event) { seen.push_back(event.task_id); });

    bus.Publish(MakeEvent("t1"));
    bus.Publish(MakeEvent("t2"));
    EXPECT_EQ(bus.DrainPending(), 2u);
    EXPECT_EQ(seen, (std::vector<std::string>{"t1", "t2"}));
}

TEST(MessageBusTest, DispatchThreadDeliversAndDrainsOnStop) {
    MessageBus bus;
    std::promise<void> first;
    std::vector<std::string> seen;
    bus.Subscribe([&](const ExecutionEvent& event) {
        seen.push_back(event.task_id);
        if (seen.size() == 1) {
            first.set_value();
        }
    });

    bus.Start();
    std::thread dispatcher([&bus]() { bus.DispatchEvents(); });
    bus.Publish(MakeEvent("t1"));
    ASSERT_EQ(first.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);

    bus.Publish(MakeEvent("t2"));
    bus.Stop();
    dispatcher.join();

    EXPECT_EQ(seen, (std::vector<std::string>{"t1", "t2"}));
    EXPECT_EQ(bus.Size(), 0u);
}

TEST(MessageBusTest, StopBeforeTheDispatchThreadRunsStillReturns) {
    MessageBus bus;
    std::vector<std::string> seen;
    bus.Subscribe([&](const ExecutionEvent& event) { seen.push_back(event.task_id); });

    bus.Start();
    bus.Publish(MakeEvent("t1"));
    bus.Stop();

    auto done = std::async(std::launch::async, [&bus]() { bus.DispatchEvents(); });
    ASSERT_EQ(done.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    done.get();

    EXPECT_EQ(seen, (std::vector<std::string>{"t1"}));
    EXPECT_EQ(bus.Size(), 0u);
}

TEST(EventLogTest, KeepsOnlyTheMostRecentEvents) {
    EventLog log(2);
    log.Append(MakeEvent("t1"));
    log.Append(MakeEvent("t2"));
    log.Append(MakeEvent("t3"));

    const auto recent = log.Recent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].task_id, "t2");
    EXPECT_EQ(recent[1].task_id, "t3");
}

}  // namespace
}  // namespace filecron::bus
