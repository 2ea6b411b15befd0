/*
 * device_event_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device event bus for inter-component communication

**************************************************/

#ifndef HEARTH_DEVICE_EVENTS_DEVICE_EVENT_BUS_HPP
#define HEARTH_DEVICE_EVENTS_DEVICE_EVENT_BUS_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "device_event.hpp"

namespace hearth::device {

using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

using EventSubscriptionId = std::uint64_t;

class DeviceEventBus;

/**
 * @brief Subscription handle; unsubscribes when destroyed
 *
 * May outlive the bus it came from. Once unsubscribe() returns the callback
 * is not running on any other thread and will not be called again.
 */
class EventSubscription {
public:
    EventSubscription() = default;
    ~EventSubscription();

    EventSubscription(EventSubscription&& other) noexcept;
    EventSubscription& operator=(EventSubscription&& other) noexcept;

    EventSubscription(const EventSubscription&) = delete;
    EventSubscription& operator=(const EventSubscription&) = delete;

    [[nodiscard]] auto id() const -> EventSubscriptionId { return id_; }
    [[nodiscard]] auto active() const -> bool;

    void unsubscribe();

private:
    friend class DeviceEventBus;
    struct State;

    EventSubscription(std::weak_ptr<State> state, EventSubscriptionId id)
        : state_(std::move(state)), id_(id) {}

    std::weak_ptr<State> state_;
    EventSubscriptionId id_{0};
};

/**
 * @brief Publish/subscribe channel for device events, one per DeviceManager
 *
 * Events are delivered synchronously on the publishing thread, outside the
 * bus lock, so callbacks may subscribe or unsubscribe. Deliveries to one
 * subscriber are serialized. The bus keeps no
 * history; late subscribers miss earlier events. Presentation code should
 * not subscribe directly but through an EventQueue it drains itself.
 */
class DeviceEventBus {
public:
    DeviceEventBus();
    ~DeviceEventBus();

    DeviceEventBus(const DeviceEventBus&) = delete;
    DeviceEventBus& operator=(const DeviceEventBus&) = delete;

    // ==================== Event Publishing ====================

    /**
     * @brief Stamp the event with a sequence number and deliver it
     */
    void publish(DeviceEventPayload payload);

    // ==================== Event Subscription ====================

    /**
     * @brief Subscribe to all events
     */
    [[nodiscard]] auto subscribe(DeviceEventCallback callback)
        -> EventSubscription;

    /**
     * @brief Subscribe to one event type
     */
    [[nodiscard]] auto subscribe(DeviceEventType type,
                                 DeviceEventCallback callback)
        -> EventSubscription;

    /**
     * @brief Subscribe to events about one device
     */
    [[nodiscard]] auto subscribeDevice(const DeviceId& id,
                                       DeviceEventCallback callback)
        -> EventSubscription;

    [[nodiscard]] auto subscriberCount() const -> std::size_t;

    // ==================== Statistics ====================

    [[nodiscard]] auto getStatistics() const -> json;

    void resetStatistics();

private:
    auto addSubscription(std::optional<DeviceEventType> type,
                         std::optional<DeviceId> device,
                         DeviceEventCallback callback) -> EventSubscription;

    std::shared_ptr<EventSubscription::State> state_;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_EVENTS_DEVICE_EVENT_BUS_HPP
