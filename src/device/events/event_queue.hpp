/*
 * event_queue.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Event channel drained by the presentation thread

**************************************************/

#ifndef HEARTH_DEVICE_EVENTS_EVENT_QUEUE_HPP
#define HEARTH_DEVICE_EVENTS_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "device_event_bus.hpp"

namespace hearth::device {

/**
 * @brief FIFO of events, filled by the bus, drained by its owner
 *
 * Workers never call into presentation state; they only enqueue here. Past
 * capacity a state change replaces the queued state change of the same
 * device and errors are dropped oldest first. DeviceDiscovered and
 * DeviceLost are never dropped.
 */
class EventQueue {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    explicit EventQueue(std::size_t capacity = DEFAULT_CAPACITY);

    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /**
     * @brief Start receiving every event published on bus
     *
     * The subscription ends with the queue.
     */
    void attach(DeviceEventBus& bus);

    void push(const DeviceEvent& event);

    [[nodiscard]] auto tryPop() -> std::optional<DeviceEvent>;

    /**
     * @brief Wait up to timeout for one event
     */
    [[nodiscard]] auto waitPop(std::chrono::milliseconds timeout)
        -> std::optional<DeviceEvent>;

    /**
     * @brief Take up to maxEvents queued events without blocking
     */
    [[nodiscard]] auto drain(std::size_t maxEvents = SIZE_MAX)
        -> std::vector<DeviceEvent>;

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief Events discarded or replaced while over capacity
     */
    [[nodiscard]] auto droppedCount() const -> std::size_t;

    /**
     * @brief Wake waiters; later pushes are ignored
     */
    void close();

private:
    // Called with mutex_ held; false discards the incoming event
    auto makeRoom(const DeviceEvent& incoming) -> bool;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DeviceEvent> events_;
    std::size_t dropped_{0};
    bool closed_{false};
    EventSubscription subscription_;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_EVENTS_EVENT_QUEUE_HPP
