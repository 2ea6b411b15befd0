/*
 * cast_protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Cast v2 namespaces, framing and status payloads

**************************************************/

#include "cast_protocol.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace hearth::device::cast {

auto ReceiverStatus::activeApplication() const -> const CastApplication* {
    if (!application || application->isIdleScreen) {
        return nullptr;
    }
    return &*application;
}

auto makeMessage(std::string_view ns, std::string_view source,
                 std::string_view destination, const json& payload)
    -> proto::CastMessage {
    proto::CastMessage message;
    message.set_protocol_version(proto::CastMessage::CASTV2_1_0);
    message.set_source_id(std::string(source));
    message.set_destination_id(std::string(destination));
    message.set_namespace_(std::string(ns));
    message.set_payload_type(proto::CastMessage::STRING);
    message.set_payload_utf8(payload.dump());
    return message;
}

auto encodeFrame(const proto::CastMessage& message) -> std::string {
    std::string body;
    message.SerializeToString(&body);
    const auto size = static_cast<std::uint32_t>(body.size());
    std::string frame;
    frame.reserve(4 + body.size());
    frame.push_back(static_cast<char>((size >> 24) & 0xFF));
    frame.push_back(static_cast<char>((size >> 16) & 0xFF));
    frame.push_back(static_cast<char>((size >> 8) & 0xFF));
    frame.push_back(static_cast<char>(size & 0xFF));
    frame.append(body);
    return frame;
}

auto frameLength(std::string_view header) -> DeviceResult<std::size_t> {
    if (header.size() < 4) {
        return failure<std::size_t>(error::protocolError("short Cast header"));
    }
    const auto* p = reinterpret_cast<const unsigned char*>(header.data());
    const std::size_t size = (static_cast<std::size_t>(p[0]) << 24) |
                             (static_cast<std::size_t>(p[1]) << 16) |
                             (static_cast<std::size_t>(p[2]) << 8) |
                             static_cast<std::size_t>(p[3]);
    if (size == 0 || size > kMaxMessageSize) {
        return failure<std::size_t>(error::protocolError(
            fmt::format("Cast message length {} out of range", size)));
    }
    return size;
}

auto decodeMessage(std::string_view body) -> DeviceResult<proto::CastMessage> {
    proto::CastMessage message;
    if (!message.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        return failure<proto::CastMessage>(
            error::protocolError("undecodable CastMessage"));
    }
    return message;
}

auto payloadOf(const proto::CastMessage& message) -> json {
    if (message.payload_type() != proto::CastMessage::STRING ||
        !message.has_payload_utf8()) {
        return nullptr;
    }
    auto payload = json::parse(message.payload_utf8(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return nullptr;
    }
    return payload;
}

auto parseReceiverStatus(const json& payload) -> DeviceResult<ReceiverStatus> {
    if (!payload.is_object() || payload.value("type", "") != "RECEIVER_STATUS" ||
        !payload.contains("status") || !payload["status"].is_object()) {
        return failure<ReceiverStatus>(
            error::protocolError("not a RECEIVER_STATUS message"));
    }
    const auto& status = payload["status"];

    ReceiverStatus result;
    if (auto it = status.find("volume"); it != status.end() && it->is_object()) {
        result.volumeLevel = std::clamp(it->value("level", 0.0), 0.0, 1.0);
        result.muted = it->value("muted", false);
    }
    if (auto it = status.find("applications");
        it != status.end() && it->is_array() && !it->empty()) {
        const auto& app = it->front();
        CastApplication application;
        application.appId = app.value("appId", "");
        application.displayName = app.value("displayName", "");
        application.sessionId = app.value("sessionId", "");
        application.transportId = app.value("transportId", "");
        application.isIdleScreen = app.value("isIdleScreen", false);
        if (auto ns = app.find("namespaces"); ns != app.end() && ns->is_array()) {
            application.supportsMedia =
                std::any_of(ns->begin(), ns->end(), [](const json& entry) {
                    return entry.value("name", "") == kMediaNamespace;
                });
        }
        result.application = std::move(application);
    }
    return result;
}

auto playbackStateFromString(std::string_view playerState) -> PlaybackState {
    if (playerState == "PLAYING") {
        return PlaybackState::Playing;
    }
    if (playerState == "PAUSED") {
        return PlaybackState::Paused;
    }
    if (playerState == "BUFFERING") {
        return PlaybackState::Buffering;
    }
    if (playerState == "IDLE") {
        return PlaybackState::Idle;
    }
    return PlaybackState::Unknown;
}

auto parseMediaStatus(const json& payload) -> std::optional<MediaStatus> {
    if (!payload.is_object() || payload.value("type", "") != "MEDIA_STATUS") {
        return std::nullopt;
    }
    auto it = payload.find("status");
    if (it == payload.end() || !it->is_array() || it->empty()) {
        return std::nullopt;
    }
    const auto& entry = it->front();

    MediaStatus status;
    status.mediaSessionId = entry.value("mediaSessionId", std::int64_t{0});
    status.playbackState =
        playbackStateFromString(entry.value("playerState", ""));
    if (entry.contains("currentTime") && entry["currentTime"].is_number()) {
        status.position = entry["currentTime"].get<double>();
    }
    if (auto media = entry.find("media");
        media != entry.end() && media->is_object()) {
        if (media->contains("duration") && (*media)["duration"].is_number()) {
            status.duration = (*media)["duration"].get<double>();
        }
        if (auto meta = media->find("metadata");
            meta != media->end() && meta->is_object()) {
            if (meta->contains("title")) {
                status.title = meta->value("title", "");
            }
            if (meta->contains("artist")) {
                status.artist = meta->value("artist", "");
            } else if (meta->contains("albumArtist")) {
                status.artist = meta->value("albumArtist", "");
            }
        }
    }
    return status;
}

auto stateFromStatus(const ReceiverStatus& receiver,
                     const std::optional<MediaStatus>& media) -> DeviceState {
    DeviceState state;
    const auto* app = receiver.activeApplication();
    state.power = app != nullptr;
    state.volume =
        static_cast<int>(std::lround(receiver.volumeLevel * 100.0));

    MediaInfo info;
    info.playbackState = PlaybackState::Idle;
    if (app != nullptr) {
        info.appName = app->displayName;
    }
    if (media && app != nullptr) {
        info.playbackState = media->playbackState;
        info.title = media->title;
        info.artist = media->artist;
        info.duration = media->duration;
        info.position = media->position;
    }
    state.mediaInfo = std::move(info);
    state.reachable = true;
    state.lastUpdated = Clock::now();
    return state;
}

}  // namespace hearth::device::cast
