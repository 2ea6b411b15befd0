/*
 * wiz_protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: WiZ bulb UDP JSON messages

**************************************************/

#ifndef HEARTH_DEVICE_WIZ_WIZ_PROTOCOL_HPP
#define HEARTH_DEVICE_WIZ_WIZ_PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "device/common/device_result.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::wiz {

inline constexpr std::uint16_t kDefaultPort = 38899;

// Bulbs refuse dimming values below this
inline constexpr int kMinDimming = 10;
inline constexpr int kMaxDimming = 100;

[[nodiscard]] auto buildGetPilot() -> std::string;

[[nodiscard]] auto buildGetSystemConfig() -> std::string;

/**
 * @brief Broadcast message that every bulb on the segment answers
 */
[[nodiscard]] auto buildRegistration() -> std::string;

/**
 * @brief setPilot request for a light command
 * @return UnsupportedCapability for commands a bulb cannot execute
 */
[[nodiscard]] auto buildSetPilot(const Command& command)
    -> DeviceResult<std::string>;

/**
 * @brief Extract the "result" object of a reply
 * @return ProtocolError for malformed JSON, an "error" member or a missing
 *         result
 */
[[nodiscard]] auto parseReply(std::string_view payload) -> DeviceResult<json>;

/**
 * @brief Convert a getPilot result into a device state
 */
[[nodiscard]] auto parsePilot(const json& result) -> DeviceState;

[[nodiscard]] auto levelToDimming(int level) -> int;

[[nodiscard]] auto dimmingToLevel(int dimming) -> int;

/**
 * @brief Capabilities of a bulb given its getSystemConfig moduleName
 *
 * Dimmable-white modules ("DW" without "RGB") have no color channel.
 */
[[nodiscard]] auto capabilitiesForModule(const std::string& moduleName)
    -> CapabilitySet;

/**
 * @brief Lowercase hex MAC without separators
 */
[[nodiscard]] auto normalizeMac(std::string_view mac) -> std::string;

}  // namespace hearth::device::wiz

#endif  // HEARTH_DEVICE_WIZ_WIZ_PROTOCOL_HPP
