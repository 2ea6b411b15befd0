/*
 * device_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Uniform device data model shared by adapters, registry and
subscribers

**************************************************/

#ifndef HEARTH_DEVICE_MODEL_DEVICE_TYPES_HPP
#define HEARTH_DEVICE_MODEL_DEVICE_TYPES_HPP

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hearth::device {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;

// ==================== Enumerations ====================

enum class DeviceKind { Speaker, Light };

enum class Protocol { Chromecast, WiZ, Tapo, Tuya };

enum class CapabilityTag { Power, Brightness, Color, Volume, Media };

enum class PlaybackState { Unknown, Idle, Playing, Paused, Buffering };

[[nodiscard]] auto deviceKindToString(DeviceKind kind) -> std::string;
[[nodiscard]] auto protocolToString(Protocol protocol) -> std::string;
[[nodiscard]] auto capabilityToString(CapabilityTag tag) -> std::string;
[[nodiscard]] auto playbackStateToString(PlaybackState state) -> std::string;

[[nodiscard]] auto protocolFromString(std::string_view name)
    -> std::optional<Protocol>;

/**
 * @brief Short lowercase prefix used in device identifiers ("wiz", "tuya")
 */
[[nodiscard]] auto protocolTag(Protocol protocol) -> std::string;

// ==================== DeviceId ====================

/**
 * @brief Stable, protocol-qualified device identifier
 *
 * Formatted as "<protocol tag>:<vendor id>", e.g. "wiz:a8bb50e3f1c2".
 * Immutable once constructed; the sole key into the registry.
 */
class DeviceId {
public:
    DeviceId() = default;
    explicit DeviceId(std::string value) : value_(std::move(value)) {}

    static auto make(Protocol protocol, std::string_view vendorId)
        -> DeviceId;

    [[nodiscard]] auto str() const -> const std::string& { return value_; }
    [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

    /**
     * @brief Part after the protocol tag, or the whole id if untagged
     */
    [[nodiscard]] auto vendorId() const -> std::string_view {
        auto pos = value_.find(':');
        return pos == std::string::npos
                   ? std::string_view(value_)
                   : std::string_view(value_).substr(pos + 1);
    }

    auto operator<=>(const DeviceId&) const = default;

private:
    std::string value_;
};

using CapabilitySet = std::set<CapabilityTag>;

// ==================== Value Types ====================

struct Rgb {
    int r = 0;
    int g = 0;
    int b = 0;

    auto operator==(const Rgb&) const -> bool = default;
};

struct Endpoint {
    std::string host;
    std::uint16_t port = 0;

    auto operator==(const Endpoint&) const -> bool = default;

    [[nodiscard]] auto toString() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

/**
 * @brief Structured now-playing information reported by speakers
 */
struct MediaInfo {
    PlaybackState playbackState = PlaybackState::Unknown;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> appName;
    std::optional<double> duration;  // seconds
    std::optional<double> position;  // seconds

    auto operator==(const MediaInfo&) const -> bool = default;
};

/**
 * @brief Identity and addressing of a device
 *
 * Created on first discovery. address and lastSeen change on every
 * rediscovery; capabilities are fixed per protocol family but may narrow.
 */
struct DeviceDescriptor {
    DeviceId id;
    std::string displayName;
    DeviceKind kind = DeviceKind::Light;
    Protocol protocol = Protocol::WiZ;
    CapabilitySet capabilities;
    Endpoint address;
    Clock::time_point lastSeen{};
    std::string model;
    std::string manufacturer;

    [[nodiscard]] auto hasCapability(CapabilityTag tag) const -> bool {
        return capabilities.contains(tag);
    }
};

/**
 * @brief Last-known state of a device
 *
 * Optional fields are absent until the device reports them. On transport
 * failure only reachable changes; the remaining fields keep their values.
 */
struct DeviceState {
    bool power = false;
    std::optional<int> brightness;  // 0-100
    std::optional<Rgb> color;
    std::optional<int> volume;  // 0-100
    std::optional<MediaInfo> mediaInfo;
    bool reachable = false;
    Clock::time_point lastUpdated{};

    /**
     * @brief Compare device-reported fields, ignoring lastUpdated
     */
    [[nodiscard]] auto sameAs(const DeviceState& other) const -> bool {
        return power == other.power && brightness == other.brightness &&
               color == other.color && volume == other.volume &&
               mediaInfo == other.mediaInfo && reachable == other.reachable;
    }
};

/**
 * @brief Immutable copy of one registry entry
 */
struct DeviceSnapshot {
    DeviceDescriptor descriptor;
    DeviceState state;
};

// ==================== JSON ====================

[[nodiscard]] auto toJson(const Rgb& rgb) -> json;
[[nodiscard]] auto toJson(const MediaInfo& info) -> json;
[[nodiscard]] auto toJson(const DeviceDescriptor& descriptor) -> json;
[[nodiscard]] auto toJson(const DeviceState& state) -> json;
[[nodiscard]] auto toJson(const DeviceSnapshot& snapshot) -> json;

}  // namespace hearth::device

template <>
struct std::hash<hearth::device::DeviceId> {
    auto operator()(const hearth::device::DeviceId& id) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(id.str());
    }
};

#endif  // HEARTH_DEVICE_MODEL_DEVICE_TYPES_HPP
