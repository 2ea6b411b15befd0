/*
 * device_event.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device lifecycle and state-change events

**************************************************/

#ifndef HEARTH_DEVICE_EVENTS_DEVICE_EVENT_HPP
#define HEARTH_DEVICE_EVENTS_DEVICE_EVENT_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "device/common/device_error.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device {

/**
 * @brief Device event types
 *
 * Enumerators follow the alternative order of DeviceEventPayload.
 */
enum class DeviceEventType {
    DeviceDiscovered,    ///< First registration of a device id
    DeviceLost,          ///< Grace period expired, entry removed
    DeviceStateChanged,  ///< Command succeeded or poll/push saw a change
    DeviceError          ///< Command failed or device became unreachable
};

[[nodiscard]] auto eventTypeToString(DeviceEventType type) -> std::string;

struct DeviceDiscoveredEvent {
    DeviceDescriptor descriptor;
};

struct DeviceLostEvent {
    DeviceId id;
};

struct DeviceStateChangedEvent {
    DeviceId id;
    DeviceState state;
};

struct DeviceErrorEvent {
    DeviceId id;
    DeviceError error;
};

using DeviceEventPayload =
    std::variant<DeviceDiscoveredEvent, DeviceLostEvent,
                 DeviceStateChangedEvent, DeviceErrorEvent>;

/**
 * @brief Immutable event as delivered to subscribers
 */
struct DeviceEvent {
    DeviceEventPayload payload;
    std::uint64_t sequenceNumber{0};
    Clock::time_point timestamp{Clock::now()};

    DeviceEvent() = default;
    explicit DeviceEvent(DeviceEventPayload p) : payload(std::move(p)) {}

    [[nodiscard]] auto type() const -> DeviceEventType;

    /**
     * @brief Id of the device the event is about
     */
    [[nodiscard]] auto deviceId() const -> const DeviceId&;

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(payload);
    }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(payload);
    }

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_EVENTS_DEVICE_EVENT_HPP
