/*
 * device_event.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device lifecycle and state-change events

**************************************************/

#include "device_event.hpp"

namespace hearth::device {

auto eventTypeToString(DeviceEventType type) -> std::string {
    switch (type) {
        case DeviceEventType::DeviceDiscovered:
            return "DeviceDiscovered";
        case DeviceEventType::DeviceLost:
            return "DeviceLost";
        case DeviceEventType::DeviceStateChanged:
            return "DeviceStateChanged";
        case DeviceEventType::DeviceError:
            return "DeviceError";
    }
    return "Unknown";
}

auto DeviceEvent::type() const -> DeviceEventType {
    return static_cast<DeviceEventType>(payload.index());
}

auto DeviceEvent::deviceId() const -> const DeviceId& {
    return std::visit(
        [](const auto& e) -> const DeviceId& {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, DeviceDiscoveredEvent>) {
                return e.descriptor.id;
            } else {
                return e.id;
            }
        },
        payload);
}

auto DeviceEvent::toJson() const -> json {
    json j;
    j["type"] = eventTypeToString(type());
    j["deviceId"] = deviceId().str();
    j["sequenceNumber"] = sequenceNumber;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                         timestamp.time_since_epoch())
                         .count();
    std::visit(
        [&j](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, DeviceDiscoveredEvent>) {
                j["descriptor"] = hearth::device::toJson(e.descriptor);
            } else if constexpr (std::is_same_v<T, DeviceStateChangedEvent>) {
                j["state"] = hearth::device::toJson(e.state);
            } else if constexpr (std::is_same_v<T, DeviceErrorEvent>) {
                j["error"] = e.error.toJson();
            }
        },
        payload);
    return j;
}

}  // namespace hearth::device
