/*
 * command.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device command set and boundary validation

**************************************************/

#ifndef HEARTH_DEVICE_MODEL_COMMAND_HPP
#define HEARTH_DEVICE_MODEL_COMMAND_HPP

#include <string>
#include <variant>

#include "device/common/device_result.hpp"
#include "device_types.hpp"

namespace hearth::device {

struct SetPower {
    bool on = false;
};

/**
 * @brief Flip power relative to the last-known state
 *
 * Resolved into SetPower by the registry right before execution.
 */
struct Toggle {};

struct SetBrightness {
    int level = 0;
};

struct SetColor {
    Rgb color;
};

struct SetVolume {
    int level = 0;
};

enum class MediaAction { Play, Pause, Stop };

struct MediaControl {
    MediaAction action = MediaAction::Play;
};

using Command = std::variant<SetPower, Toggle, SetBrightness, SetColor,
                            SetVolume, MediaControl>;

[[nodiscard]] auto requiredCapability(const Command& command) -> CapabilityTag;

/**
 * @brief Human-readable form used in logs, e.g. "setBrightness(50)"
 */
[[nodiscard]] auto describeCommand(const Command& command) -> std::string;

/**
 * @brief Key under which a queued command is replaced by a later one
 *
 * Commands sharing a non-empty key target the same property, so only the
 * newest queued one matters. Relative commands return an empty key and are
 * never superseded.
 */
[[nodiscard]] auto supersedeKey(const Command& command) -> std::string;

/**
 * @brief Check a command against a device before it is queued
 *
 * Fails with UnsupportedCapability when the device lacks the capability and
 * with InvalidArgument for color channels outside 0-255. Brightness and
 * volume are clamped to [0, 100].
 *
 * @return The normalized command
 */
[[nodiscard]] auto validateCommand(const DeviceDescriptor& descriptor,
                                   const Command& command)
    -> DeviceResult<Command>;

/**
 * @brief State after a successful command, before the next poll confirms it
 */
[[nodiscard]] auto applyCommandToState(DeviceState state,
                                       const Command& command) -> DeviceState;

[[nodiscard]] auto mediaActionToString(MediaAction action) -> std::string;

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_MODEL_COMMAND_HPP
