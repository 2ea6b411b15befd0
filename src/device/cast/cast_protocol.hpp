/*
 * cast_protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Cast v2 namespaces, framing and status payloads

**************************************************/

#ifndef HEARTH_DEVICE_CAST_CAST_PROTOCOL_HPP
#define HEARTH_DEVICE_CAST_CAST_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cast_channel.pb.h"
#include "device/common/device_result.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device::cast {

inline constexpr std::uint16_t kDefaultPort = 8009;
inline constexpr std::size_t kMaxMessageSize = 64 * 1024;

inline constexpr const char* kSenderId = "sender-0";
inline constexpr const char* kReceiverId = "receiver-0";

inline constexpr const char* kConnectionNamespace =
    "urn:x-cast:com.google.cast.tp.connection";
inline constexpr const char* kHeartbeatNamespace =
    "urn:x-cast:com.google.cast.tp.heartbeat";
inline constexpr const char* kReceiverNamespace =
    "urn:x-cast:com.google.cast.receiver";
inline constexpr const char* kMediaNamespace =
    "urn:x-cast:com.google.cast.media";

inline constexpr const char* kServiceType = "_googlecast._tcp.local";

struct CastApplication {
    std::string appId;
    std::string displayName;
    std::string sessionId;
    std::string transportId;
    bool isIdleScreen = false;
    bool supportsMedia = false;
};

struct ReceiverStatus {
    double volumeLevel = 0.0;  // 0..1
    bool muted = false;
    std::optional<CastApplication> application;

    // Running application other than the idle backdrop
    [[nodiscard]] auto activeApplication() const -> const CastApplication*;
};

struct MediaStatus {
    std::int64_t mediaSessionId = 0;
    PlaybackState playbackState = PlaybackState::Unknown;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<double> duration;
    std::optional<double> position;
};

/**
 * @brief Envelope carrying a JSON payload
 */
[[nodiscard]] auto makeMessage(std::string_view ns, std::string_view source,
                               std::string_view destination,
                               const json& payload) -> proto::CastMessage;

/**
 * @brief 4-byte big-endian length followed by the serialized message
 */
[[nodiscard]] auto encodeFrame(const proto::CastMessage& message)
    -> std::string;

[[nodiscard]] auto frameLength(std::string_view header)
    -> DeviceResult<std::size_t>;

[[nodiscard]] auto decodeMessage(std::string_view body)
    -> DeviceResult<proto::CastMessage>;

/**
 * @brief JSON payload of a string message, null for binary or malformed
 */
[[nodiscard]] auto payloadOf(const proto::CastMessage& message) -> json;

[[nodiscard]] auto parseReceiverStatus(const json& payload)
    -> DeviceResult<ReceiverStatus>;

/**
 * @brief First entry of a MEDIA_STATUS payload, if any
 */
[[nodiscard]] auto parseMediaStatus(const json& payload)
    -> std::optional<MediaStatus>;

[[nodiscard]] auto playbackStateFromString(std::string_view playerState)
    -> PlaybackState;

/**
 * @brief Device state as seen by the rest of the system
 *
 * A speaker is "on" while an application other than the idle screen runs.
 */
[[nodiscard]] auto stateFromStatus(const ReceiverStatus& receiver,
                                   const std::optional<MediaStatus>& media)
    -> DeviceState;

}  // namespace hearth::device::cast

#endif  // HEARTH_DEVICE_CAST_CAST_PROTOCOL_HPP
