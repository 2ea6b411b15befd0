/*
 * device_event_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device event bus for inter-component communication

**************************************************/

#include "device_event_bus.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace hearth::device {

namespace {

constexpr std::size_t kEventTypeCount = 4;

}  // namespace

struct EventSubscription::State {
    /**
     * @brief Callback guarded for the lifetime of its subscription
     *
     * The slot lock is held while the callback runs, so retiring a slot
     * waits for a delivery in progress on another thread. It is recursive
     * because a callback may unsubscribe itself or publish again.
     */
    struct Slot {
        std::recursive_mutex mutex;
        bool active = true;
        DeviceEventCallback callback;
    };

    struct Entry {
        EventSubscriptionId id;
        std::optional<DeviceEventType> type;
        std::optional<DeviceId> device;
        std::shared_ptr<Slot> slot;
    };

    mutable std::mutex mutex;
    std::vector<Entry> entries;
    EventSubscriptionId nextId{1};

    std::atomic<std::uint64_t> sequence{0};
    std::atomic<std::uint64_t> published{0};
    std::atomic<std::uint64_t> delivered{0};
    std::atomic<std::uint64_t> callbackErrors{0};
    std::array<std::atomic<std::uint64_t>, kEventTypeCount> perType{};

    void remove(EventSubscriptionId id) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = std::find_if(entries.begin(), entries.end(),
                                   [id](const Entry& e) { return e.id == id; });
            if (it == entries.end()) {
                return;
            }
            slot = std::move(it->slot);
            entries.erase(it);
        }
        // Blocks until a callback running on another thread has returned
        std::lock_guard<std::recursive_mutex> lock(slot->mutex);
        slot->active = false;
    }

    auto contains(EventSubscriptionId id) const -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : entries) {
            if (e.id == id) {
                return true;
            }
        }
        return false;
    }
};

// ==================== EventSubscription ====================

EventSubscription::~EventSubscription() { unsubscribe(); }

EventSubscription::EventSubscription(EventSubscription&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

EventSubscription& EventSubscription::operator=(
    EventSubscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

auto EventSubscription::active() const -> bool {
    auto state = state_.lock();
    return state && id_ != 0 && state->contains(id_);
}

void EventSubscription::unsubscribe() {
    if (auto state = state_.lock(); state && id_ != 0) {
        state->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

// ==================== DeviceEventBus ====================

DeviceEventBus::DeviceEventBus()
    : state_(std::make_shared<EventSubscription::State>()) {}

DeviceEventBus::~DeviceEventBus() = default;

void DeviceEventBus::publish(DeviceEventPayload payload) {
    DeviceEvent event(std::move(payload));
    event.sequenceNumber = ++state_->sequence;
    auto type = event.type();
    const auto& id = event.deviceId();

    state_->published++;
    state_->perType[static_cast<std::size_t>(type)]++;

    // Snapshot under the lock, deliver outside it
    std::vector<std::shared_ptr<EventSubscription::State::Slot>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        for (const auto& sub : state_->entries) {
            if (sub.type && *sub.type != type) {
                continue;
            }
            if (sub.device && *sub.device != id) {
                continue;
            }
            targets.push_back(sub.slot);
        }
    }

    spdlog::trace("DeviceEventBus: #{} {} for {} -> {} subscribers",
                  event.sequenceNumber, eventTypeToString(type), id.str(),
                  targets.size());

    for (const auto& slot : targets) {
        std::lock_guard<std::recursive_mutex> lock(slot->mutex);
        if (!slot->active) {
            continue;
        }
        try {
            slot->callback(event);
            state_->delivered++;
        } catch (const std::exception& e) {
            state_->callbackErrors++;
            spdlog::warn("DeviceEventBus: callback failed on {}: {}",
                         eventTypeToString(type), e.what());
        }
    }
}

auto DeviceEventBus::subscribe(DeviceEventCallback callback)
    -> EventSubscription {
    return addSubscription(std::nullopt, std::nullopt, std::move(callback));
}

auto DeviceEventBus::subscribe(DeviceEventType type,
                               DeviceEventCallback callback)
    -> EventSubscription {
    return addSubscription(type, std::nullopt, std::move(callback));
}

auto DeviceEventBus::subscribeDevice(const DeviceId& id,
                                     DeviceEventCallback callback)
    -> EventSubscription {
    return addSubscription(std::nullopt, id, std::move(callback));
}

auto DeviceEventBus::addSubscription(std::optional<DeviceEventType> type,
                                     std::optional<DeviceId> device,
                                     DeviceEventCallback callback)
    -> EventSubscription {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto id = state_->nextId++;
    auto slot = std::make_shared<EventSubscription::State::Slot>();
    slot->callback = std::move(callback);
    state_->entries.push_back({id, type, std::move(device), std::move(slot)});
    return EventSubscription(state_, id);
}

auto DeviceEventBus::subscriberCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->entries.size();
}

auto DeviceEventBus::getStatistics() const -> json {
    json j;
    j["published"] = state_->published.load();
    j["delivered"] = state_->delivered.load();
    j["callbackErrors"] = state_->callbackErrors.load();
    j["subscribers"] = subscriberCount();
    for (std::size_t i = 0; i < kEventTypeCount; ++i) {
        j["byType"][eventTypeToString(static_cast<DeviceEventType>(i))] =
            state_->perType[i].load();
    }
    return j;
}

void DeviceEventBus::resetStatistics() {
    state_->published = 0;
    state_->delivered = 0;
    state_->callbackErrors = 0;
    for (auto& counter : state_->perType) {
        counter = 0;
    }
}

}  // namespace hearth::device
