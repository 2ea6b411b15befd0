/*
 * test_device_event_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for DeviceEventBus and EventQueue

**************************************************/

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "device/events/device_event_bus.hpp"
#include "device/events/event_queue.hpp"

using namespace hearth::device;
using namespace std::chrono_literals;

namespace {

auto lost(const std::string& id) -> DeviceEventPayload {
    return DeviceLostEvent{DeviceId(id)};
}

auto failed(const std::string& id) -> DeviceEventPayload {
    return DeviceErrorEvent{DeviceId(id), error::timeout("fetchState")};
}

auto changed(const std::string& id, bool power) -> DeviceEventPayload {
    DeviceState state;
    state.power = power;
    return DeviceStateChangedEvent{DeviceId(id), state};
}

}  // namespace

class DeviceEventBusTest : public ::testing::Test {
protected:
    DeviceEventBus bus_;
};

// ========== Delivery ==========

TEST_F(DeviceEventBusTest, Subscribe_ReceivesEventsInOrder) {
    std::vector<std::uint64_t> sequence;
    auto sub = bus_.subscribe(
        [&](const DeviceEvent& e) { sequence.push_back(e.sequenceNumber); });

    bus_.publish(lost("wiz:1"));
    bus_.publish(lost("wiz:2"));

    ASSERT_EQ(sequence.size(), 2U);
    EXPECT_LT(sequence[0], sequence[1]);
}

TEST_F(DeviceEventBusTest, TypeFilter_OnlyMatchingEvents) {
    int count = 0;
    auto sub = bus_.subscribe(DeviceEventType::DeviceLost,
                              [&](const DeviceEvent&) { ++count; });

    bus_.publish(changed("wiz:1", true));
    bus_.publish(lost("wiz:1"));

    EXPECT_EQ(count, 1);
}

TEST_F(DeviceEventBusTest, DeviceFilter_OnlyThatDevice) {
    std::vector<std::string> seen;
    auto sub = bus_.subscribeDevice(DeviceId("tuya:a"), [&](const DeviceEvent& e) {
        seen.push_back(e.deviceId().str());
    });

    bus_.publish(changed("tuya:a", true));
    bus_.publish(changed("tuya:b", true));

    ASSERT_EQ(seen.size(), 1U);
    EXPECT_EQ(seen[0], "tuya:a");
}

TEST_F(DeviceEventBusTest, NoReplay_LateSubscriberMissesEarlierEvents) {
    bus_.publish(lost("wiz:1"));
    int count = 0;
    auto sub = bus_.subscribe([&](const DeviceEvent&) { ++count; });
    EXPECT_EQ(count, 0);
}

// ========== Subscription lifetime ==========

TEST_F(DeviceEventBusTest, Subscription_EndsWithHandle) {
    int count = 0;
    {
        auto sub = bus_.subscribe([&](const DeviceEvent&) { ++count; });
        EXPECT_TRUE(sub.active());
        EXPECT_EQ(bus_.subscriberCount(), 1U);
        bus_.publish(lost("wiz:1"));
    }
    bus_.publish(lost("wiz:1"));
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus_.subscriberCount(), 0U);
}

TEST_F(DeviceEventBusTest, Subscription_MayOutliveBus) {
    EventSubscription sub;
    {
        DeviceEventBus bus;
        sub = bus.subscribe([](const DeviceEvent&) {});
        EXPECT_TRUE(sub.active());
    }
    EXPECT_FALSE(sub.active());
    sub.unsubscribe();
}

TEST_F(DeviceEventBusTest, Callback_MayUnsubscribeItself) {
    int count = 0;
    EventSubscription sub;
    sub = bus_.subscribe([&](const DeviceEvent&) {
        ++count;
        sub.unsubscribe();
    });

    bus_.publish(lost("wiz:1"));
    bus_.publish(lost("wiz:1"));
    EXPECT_EQ(count, 1);
}

TEST_F(DeviceEventBusTest, Unsubscribe_WaitsForRunningCallback) {
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    auto sub = bus_.subscribe([&](const DeviceEvent&) {
        started = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    std::thread publisher([this] { bus_.publish(lost("wiz:1")); });
    while (!started) {
        std::this_thread::sleep_for(1ms);
    }
    sub.unsubscribe();
    EXPECT_TRUE(finished);
    publisher.join();
}

TEST_F(DeviceEventBusTest, ThrowingCallback_DoesNotStopOthers) {
    int count = 0;
    auto bad = bus_.subscribe(
        [](const DeviceEvent&) { throw std::runtime_error("boom"); });
    auto good = bus_.subscribe([&](const DeviceEvent&) { ++count; });

    bus_.publish(lost("wiz:1"));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus_.getStatistics()["callbackErrors"], 1);
}

TEST_F(DeviceEventBusTest, Statistics_CountByType) {
    bus_.publish(lost("wiz:1"));
    bus_.publish(changed("wiz:1", false));
    bus_.publish(changed("wiz:1", true));

    auto stats = bus_.getStatistics();
    EXPECT_EQ(stats["published"], 3);
    EXPECT_EQ(stats["byType"]["DeviceStateChanged"], 2);

    bus_.resetStatistics();
    EXPECT_EQ(bus_.getStatistics()["published"], 0);
}

TEST_F(DeviceEventBusTest, EventJson_CarriesPayload) {
    std::optional<DeviceEvent> received;
    auto sub = bus_.subscribe([&](const DeviceEvent& e) { received = e; });
    bus_.publish(DeviceErrorEvent{DeviceId("tapo:x"),
                                  error::unreachable("10.0.0.4", "timeout")});

    ASSERT_TRUE(received.has_value());
    auto j = received->toJson();
    EXPECT_EQ(j["type"], "DeviceError");
    EXPECT_EQ(j["deviceId"], "tapo:x");
    EXPECT_TRUE(j.contains("error"));
}

// ========== EventQueue ==========

class EventQueueTest : public ::testing::Test {
protected:
    DeviceEventBus bus_;
};

TEST_F(EventQueueTest, Attach_QueuesPublishedEvents) {
    EventQueue queue;
    queue.attach(bus_);

    bus_.publish(lost("wiz:1"));
    bus_.publish(lost("wiz:2"));

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].deviceId().str(), "wiz:1");
    EXPECT_EQ(events[1].deviceId().str(), "wiz:2");
    EXPECT_EQ(queue.size(), 0U);
}

TEST_F(EventQueueTest, Full_KeepsLifecycleEvents) {
    EventQueue queue(2);
    queue.attach(bus_);

    bus_.publish(lost("wiz:1"));
    bus_.publish(lost("wiz:2"));
    bus_.publish(lost("wiz:3"));

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 3U);
    EXPECT_EQ(events[0].deviceId().str(), "wiz:1");
    EXPECT_EQ(events[2].deviceId().str(), "wiz:3");
    EXPECT_EQ(queue.droppedCount(), 0U);
}

TEST_F(EventQueueTest, Full_CoalescesStateChangesPerDevice) {
    EventQueue queue(2);
    queue.attach(bus_);

    bus_.publish(changed("wiz:a", false));
    bus_.publish(changed("wiz:b", false));
    bus_.publish(changed("wiz:a", true));

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].deviceId().str(), "wiz:b");
    EXPECT_EQ(events[1].deviceId().str(), "wiz:a");
    EXPECT_TRUE(events[1].as<DeviceStateChangedEvent>().state.power);
    EXPECT_EQ(queue.droppedCount(), 1U);
}

TEST_F(EventQueueTest, Full_StateChangeOfNewDeviceIsKept) {
    EventQueue queue(1);
    queue.attach(bus_);

    bus_.publish(changed("wiz:a", true));
    bus_.publish(changed("wiz:b", true));

    EXPECT_EQ(queue.size(), 2U);
    EXPECT_EQ(queue.droppedCount(), 0U);
}

TEST_F(EventQueueTest, Full_DropsOldestError) {
    EventQueue queue(2);
    queue.attach(bus_);

    bus_.publish(failed("wiz:1"));
    bus_.publish(lost("wiz:2"));
    bus_.publish(failed("wiz:3"));
    bus_.publish(failed("wiz:4"));

    auto events = queue.drain();
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].type(), DeviceEventType::DeviceLost);
    EXPECT_EQ(events[1].deviceId().str(), "wiz:4");
    EXPECT_EQ(queue.droppedCount(), 2U);
}

TEST_F(EventQueueTest, DestroyedDuringPublish_IsNotCalled) {
    auto slow = bus_.subscribe(
        [](const DeviceEvent&) { std::this_thread::sleep_for(200ms); });
    auto queue = std::make_unique<EventQueue>();
    queue->attach(bus_);

    std::thread publisher([this] { bus_.publish(lost("wiz:1")); });
    std::this_thread::sleep_for(50ms);
    queue.reset();
    publisher.join();

    EXPECT_EQ(bus_.getStatistics()["delivered"], 1);
    EXPECT_EQ(bus_.subscriberCount(), 1U);
}

TEST_F(EventQueueTest, WaitPop_WakesOnPublishFromAnotherThread) {
    EventQueue queue;
    queue.attach(bus_);

    std::thread publisher([this] {
        std::this_thread::sleep_for(20ms);
        bus_.publish(lost("wiz:9"));
    });
    auto event = queue.waitPop(2s);
    publisher.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type(), DeviceEventType::DeviceLost);
}

TEST_F(EventQueueTest, WaitPop_TimesOutWhenEmpty) {
    EventQueue queue;
    EXPECT_FALSE(queue.waitPop(10ms).has_value());
}

TEST_F(EventQueueTest, Close_StopsReceiving) {
    EventQueue queue;
    queue.attach(bus_);
    queue.close();

    bus_.publish(lost("wiz:1"));
    EXPECT_EQ(queue.size(), 0U);
    EXPECT_FALSE(queue.waitPop(1s).has_value());
}

TEST_F(EventQueueTest, DrainLimit_LeavesRest) {
    EventQueue queue;
    queue.attach(bus_);
    for (int i = 0; i < 5; ++i) {
        bus_.publish(lost("wiz:" + std::to_string(i)));
    }
    EXPECT_EQ(queue.drain(3).size(), 3U);
    EXPECT_EQ(queue.size(), 2U);
}
