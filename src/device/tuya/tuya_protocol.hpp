/*
 * tuya_protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tuya local protocol 3.3 framing, encryption and data points

**************************************************/

#ifndef HEARTH_DEVICE_TUYA_TUYA_PROTOCOL_HPP
#define HEARTH_DEVICE_TUYA_TUYA_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "device/common/device_result.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::tuya {

inline constexpr std::uint32_t kPrefix = 0x000055AA;
inline constexpr std::uint32_t kSuffix = 0x0000AA55;
inline constexpr std::size_t kHeaderSize = 16;
inline constexpr std::size_t kTrailerSize = 8;
inline constexpr std::string_view kVersion = "3.3";
inline constexpr std::size_t kVersionHeaderSize = 15;  // "3.3" + 12 zeros

inline constexpr std::uint16_t kDefaultPort = 6668;
inline constexpr std::uint16_t kBroadcastPort = 6666;
inline constexpr std::uint16_t kEncryptedBroadcastPort = 6667;

enum class CommandType : std::uint32_t {
    Control = 0x07,
    Status = 0x08,
    DpQuery = 0x0a,
    UdpNew = 0x13,
};

// Light data points
inline constexpr std::string_view kDpSwitch = "1";
inline constexpr std::string_view kDpLedSwitch = "20";
inline constexpr std::string_view kDpMode = "21";
inline constexpr std::string_view kDpBrightness = "22";
inline constexpr std::string_view kDpColour = "24";

struct Frame {
    std::uint32_t sequence = 0;
    std::uint32_t command = 0;
    std::optional<std::uint32_t> returnCode;
    std::string payload;
};

/**
 * @brief IEEE 802.3 CRC-32 as used in the frame trailer
 */
[[nodiscard]] auto crc32(std::string_view data) -> std::uint32_t;

[[nodiscard]] auto encodeFrame(std::uint32_t sequence, CommandType command,
                               std::string_view payload) -> std::string;

/**
 * @brief Bytes that follow a 16-byte header, trailer included
 * @return ProtocolError if the prefix is wrong or the length is absurd
 */
[[nodiscard]] auto remainingLength(std::string_view header)
    -> DeviceResult<std::size_t>;

/**
 * @brief Parse a complete frame and verify its CRC
 * @param hasReturnCode Device-to-client frames carry a 4-byte return code
 */
[[nodiscard]] auto decodeFrame(std::string_view bytes, bool hasReturnCode)
    -> DeviceResult<Frame>;

/**
 * @brief AES-128-ECB with PKCS#7 padding
 * @return ConfigurationError if the key is not 16 bytes
 */
[[nodiscard]] auto encrypt(std::string_view plain, std::string_view key)
    -> DeviceResult<std::string>;

[[nodiscard]] auto decrypt(std::string_view cipher, std::string_view key)
    -> DeviceResult<std::string>;

/**
 * @brief Key used by devices for encrypted UDP announcements
 */
[[nodiscard]] auto broadcastKey() -> std::string;

[[nodiscard]] auto buildDpQuery(const std::string& deviceId,
                                std::int64_t timestamp) -> json;

[[nodiscard]] auto buildControl(const std::string& deviceId, json dps,
                                std::int64_t timestamp) -> json;

/**
 * @brief Serialize, encrypt and frame a request
 *
 * Control frames carry the protocol version header in front of the
 * ciphertext; queries do not.
 */
[[nodiscard]] auto encodeRequest(std::uint32_t sequence, CommandType command,
                                 const json& body, std::string_view key)
    -> DeviceResult<std::string>;

/**
 * @brief Decrypt and parse a response payload
 * @return null JSON for an empty payload
 */
[[nodiscard]] auto decodePayload(std::string_view payload,
                                 std::string_view key) -> DeviceResult<json>;

/**
 * @brief Data points that implement a light command
 */
[[nodiscard]] auto dpsForCommand(const Command& command) -> DeviceResult<json>;

[[nodiscard]] auto stateFromDps(const json& dps) -> DeviceState;

/**
 * @brief HHHHSSSSVVVV hex colour (hue 0-360, saturation and value 0-1000)
 */
[[nodiscard]] auto encodeColour(const Rgb& color) -> std::string;

[[nodiscard]] auto decodeColour(std::string_view hex) -> std::optional<Rgb>;

[[nodiscard]] auto levelToBrightness(int level) -> int;

[[nodiscard]] auto brightnessToLevel(int brightness) -> int;

/**
 * @brief Parse a discovery datagram from port 6666 or 6667
 */
[[nodiscard]] auto parseBroadcast(std::string_view datagram, bool encrypted)
    -> DeviceResult<json>;

}  // namespace hearth::device::tuya

#endif  // HEARTH_DEVICE_TUYA_TUYA_PROTOCOL_HPP
