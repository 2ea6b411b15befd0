/*
 * device_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: String and JSON conversions for the device data model

**************************************************/

#include "device_types.hpp"

namespace hearth::device {

namespace {

auto toMillis(Clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch())
        .count();
}

}  // namespace

auto deviceKindToString(DeviceKind kind) -> std::string {
    switch (kind) {
        case DeviceKind::Speaker:
            return "Speaker";
        case DeviceKind::Light:
            return "Light";
    }
    return "Unknown";
}

auto protocolToString(Protocol protocol) -> std::string {
    switch (protocol) {
        case Protocol::Chromecast:
            return "Chromecast";
        case Protocol::WiZ:
            return "WiZ";
        case Protocol::Tapo:
            return "Tapo";
        case Protocol::Tuya:
            return "Tuya";
    }
    return "Unknown";
}

auto capabilityToString(CapabilityTag tag) -> std::string {
    switch (tag) {
        case CapabilityTag::Power:
            return "Power";
        case CapabilityTag::Brightness:
            return "Brightness";
        case CapabilityTag::Color:
            return "Color";
        case CapabilityTag::Volume:
            return "Volume";
        case CapabilityTag::Media:
            return "Media";
    }
    return "Unknown";
}

auto playbackStateToString(PlaybackState state) -> std::string {
    switch (state) {
        case PlaybackState::Unknown:
            return "Unknown";
        case PlaybackState::Idle:
            return "Idle";
        case PlaybackState::Playing:
            return "Playing";
        case PlaybackState::Paused:
            return "Paused";
        case PlaybackState::Buffering:
            return "Buffering";
    }
    return "Unknown";
}

auto protocolFromString(std::string_view name) -> std::optional<Protocol> {
    for (auto p : {Protocol::Chromecast, Protocol::WiZ, Protocol::Tapo,
                   Protocol::Tuya}) {
        if (name == protocolToString(p) || name == protocolTag(p)) {
            return p;
        }
    }
    return std::nullopt;
}

auto protocolTag(Protocol protocol) -> std::string {
    switch (protocol) {
        case Protocol::Chromecast:
            return "chromecast";
        case Protocol::WiZ:
            return "wiz";
        case Protocol::Tapo:
            return "tapo";
        case Protocol::Tuya:
            return "tuya";
    }
    return "unknown";
}

auto DeviceId::make(Protocol protocol, std::string_view vendorId) -> DeviceId {
    return DeviceId(protocolTag(protocol) + ":" + std::string(vendorId));
}

auto toJson(const Rgb& rgb) -> json {
    return json{{"r", rgb.r}, {"g", rgb.g}, {"b", rgb.b}};
}

auto toJson(const MediaInfo& info) -> json {
    json j;
    j["playbackState"] = playbackStateToString(info.playbackState);
    if (info.title) {
        j["title"] = *info.title;
    }
    if (info.artist) {
        j["artist"] = *info.artist;
    }
    if (info.appName) {
        j["appName"] = *info.appName;
    }
    if (info.duration) {
        j["duration"] = *info.duration;
    }
    if (info.position) {
        j["position"] = *info.position;
    }
    return j;
}

auto toJson(const DeviceDescriptor& descriptor) -> json {
    json j;
    j["id"] = descriptor.id.str();
    j["displayName"] = descriptor.displayName;
    j["kind"] = deviceKindToString(descriptor.kind);
    j["protocol"] = protocolToString(descriptor.protocol);
    j["capabilities"] = json::array();
    for (auto tag : descriptor.capabilities) {
        j["capabilities"].push_back(capabilityToString(tag));
    }
    j["address"] = descriptor.address.toString();
    j["lastSeen"] = toMillis(descriptor.lastSeen);
    if (!descriptor.model.empty()) {
        j["model"] = descriptor.model;
    }
    if (!descriptor.manufacturer.empty()) {
        j["manufacturer"] = descriptor.manufacturer;
    }
    return j;
}

auto toJson(const DeviceState& state) -> json {
    json j;
    j["power"] = state.power;
    j["reachable"] = state.reachable;
    if (state.brightness) {
        j["brightness"] = *state.brightness;
    }
    if (state.color) {
        j["color"] = toJson(*state.color);
    }
    if (state.volume) {
        j["volume"] = *state.volume;
    }
    if (state.mediaInfo) {
        j["mediaInfo"] = toJson(*state.mediaInfo);
    }
    j["lastUpdated"] = toMillis(state.lastUpdated);
    return j;
}

auto toJson(const DeviceSnapshot& snapshot) -> json {
    return json{{"descriptor", toJson(snapshot.descriptor)},
                {"state", toJson(snapshot.state)}};
}

}  // namespace hearth::device
