/*
 * event_queue.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Event channel drained by the presentation thread

**************************************************/

#include "event_queue.hpp"

#include <algorithm>
#include <iterator>

#include <spdlog/spdlog.h>

namespace hearth::device {

EventQueue::EventQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void EventQueue::attach(DeviceEventBus& bus) {
    subscription_ =
        bus.subscribe([this](const DeviceEvent& event) { push(event); });
}

void EventQueue::push(const DeviceEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (events_.size() >= capacity_ && !makeRoom(event)) {
            return;
        }
        events_.push_back(event);
    }
    cv_.notify_one();
}

auto EventQueue::makeRoom(const DeviceEvent& incoming) -> bool {
    auto eraseLast = [this](DeviceEventType type, const DeviceId* id) {
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->type() == type && (id == nullptr || it->deviceId() == *id)) {
                events_.erase(std::next(it).base());
                return true;
            }
        }
        return false;
    };
    auto eraseOldest = [this](DeviceEventType type) {
        auto it = std::find_if(events_.begin(), events_.end(),
                               [type](const DeviceEvent& e) {
                                   return e.type() == type;
                               });
        if (it == events_.end()) {
            return false;
        }
        events_.erase(it);
        return true;
    };

    bool accept = true;
    switch (incoming.type()) {
        case DeviceEventType::DeviceDiscovered:
        case DeviceEventType::DeviceLost:
            // The consumer's device list depends on every one of these
            return true;
        case DeviceEventType::DeviceStateChanged:
            // The newest state of a device replaces its queued one; with
            // nothing to replace the queue grows by one entry per device
            if (!eraseLast(DeviceEventType::DeviceStateChanged,
                           &incoming.deviceId()) &&
                !eraseOldest(DeviceEventType::DeviceError)) {
                return true;
            }
            break;
        case DeviceEventType::DeviceError:
            accept = eraseOldest(DeviceEventType::DeviceError);
            break;
    }

    if (dropped_++ == 0) {
        spdlog::warn("EventQueue: consumer is behind, coalescing state "
                     "changes and dropping errors (capacity {})",
                     capacity_);
    }
    return accept;
}

auto EventQueue::tryPop() -> std::optional<DeviceEvent> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto EventQueue::waitPop(std::chrono::milliseconds timeout)
    -> std::optional<DeviceEvent> {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto EventQueue::drain(std::size_t maxEvents) -> std::vector<DeviceEvent> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceEvent> out;
    while (!events_.empty() && out.size() < maxEvents) {
        out.push_back(std::move(events_.front()));
        events_.pop_front();
    }
    return out;
}

auto EventQueue::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

auto EventQueue::droppedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventQueue::close() {
    subscription_.unsubscribe();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

}  // namespace hearth::device
