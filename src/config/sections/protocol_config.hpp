/*
 * protocol_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Per-protocol credentials and static host lists

**************************************************/

#ifndef HEARTH_CONFIG_SECTIONS_PROTOCOL_CONFIG_HPP
#define HEARTH_CONFIG_SECTIONS_PROTOCOL_CONFIG_HPP

#include <string>
#include <vector>

#include "../core/config_section.hpp"

namespace hearth::config {

namespace detail {

inline std::vector<std::string> stringList(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<std::string>>();
    }
    return {};
}

}  // namespace detail

/**
 * @brief WiZ bulbs (UDP JSON)
 */
struct WizConfig : ConfigSection<WizConfig> {
    static constexpr std::string_view KEY = "wiz";

    bool enabled{true};
    int port{38899};
    std::vector<std::string> hosts;  ///< Probed in addition to broadcast

    [[nodiscard]] json serialize() const {
        return {{"enabled", enabled}, {"port", port}, {"hosts", hosts}};
    }

    [[nodiscard]] static WizConfig deserialize(const json& j) {
        WizConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.port = j.value("port", cfg.port);
        cfg.hosts = detail::stringList(j, "hosts");
        return cfg;
    }
};

/**
 * @brief TP-Link Tapo bulbs (KLAP over HTTP)
 *
 * Tapo has no local discovery, so only the listed hosts are probed.
 */
struct TapoConfig : ConfigSection<TapoConfig> {
    static constexpr std::string_view KEY = "tapo";

    bool enabled{true};
    std::string username;  ///< TP-Link cloud account e-mail
    std::string password;
    std::vector<std::string> hosts;
    int port{80};

    [[nodiscard]] bool hasCredentials() const {
        return !username.empty() && !password.empty();
    }

    [[nodiscard]] json serialize() const {
        // Credentials are never written back out
        return {{"enabled", enabled},
                {"username", username},
                {"hosts", hosts},
                {"port", port}};
    }

    [[nodiscard]] static TapoConfig deserialize(const json& j) {
        TapoConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.username = j.value("username", cfg.username);
        cfg.password = j.value("password", cfg.password);
        cfg.hosts = detail::stringList(j, "hosts");
        cfg.port = j.value("port", cfg.port);
        return cfg;
    }
};

/**
 * @brief One Tuya device with its pre-shared local key
 */
struct TuyaDeviceConfig {
    std::string id;
    std::string key;
    std::string ip;
    std::string name;
    std::string version{"3.3"};

    [[nodiscard]] json toJson() const {
        return {{"id", id}, {"ip", ip}, {"name", name}, {"version", version}};
    }

    [[nodiscard]] static TuyaDeviceConfig fromJson(const json& j) {
        TuyaDeviceConfig cfg;
        cfg.id = j.value("id", "");
        cfg.key = j.value("key", "");
        cfg.ip = j.value("ip", "");
        cfg.name = j.value("name", "");
        // Some exports store the version as a number
        if (j.contains("version") && j["version"].is_number()) {
            auto v = j["version"].get<double>();
            cfg.version = v == 3.3 ? "3.3" : std::to_string(v);
        } else {
            cfg.version = j.value("version", cfg.version);
        }
        return cfg;
    }
};

/**
 * @brief Tuya bulbs (55AA over TCP, AES-ECB)
 */
struct TuyaConfig : ConfigSection<TuyaConfig> {
    static constexpr std::string_view KEY = "tuya";

    bool enabled{true};
    bool scanBroadcast{true};  ///< Listen for UDP announcements
    int port{6668};
    std::vector<TuyaDeviceConfig> devices;

    [[nodiscard]] const TuyaDeviceConfig* find(const std::string& id) const {
        for (const auto& device : devices) {
            if (device.id == id) {
                return &device;
            }
        }
        return nullptr;
    }

    [[nodiscard]] json serialize() const {
        json list = json::array();
        for (const auto& device : devices) {
            list.push_back(device.toJson());
        }
        return {{"enabled", enabled},
                {"scanBroadcast", scanBroadcast},
                {"port", port},
                {"devices", list}};
    }

    [[nodiscard]] static TuyaConfig deserialize(const json& j) {
        TuyaConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.scanBroadcast = j.value("scanBroadcast", cfg.scanBroadcast);
        cfg.port = j.value("port", cfg.port);
        if (j.contains("devices") && j["devices"].is_array()) {
            for (const auto& item : j["devices"]) {
                cfg.devices.push_back(TuyaDeviceConfig::fromJson(item));
            }
        }
        return cfg;
    }
};

/**
 * @brief Google Cast speakers (CastV2 over TLS)
 */
struct CastConfig : ConfigSection<CastConfig> {
    static constexpr std::string_view KEY = "cast";

    bool enabled{true};
    size_t heartbeatSeconds{5};

    [[nodiscard]] json serialize() const {
        return {{"enabled", enabled}, {"heartbeatSeconds", heartbeatSeconds}};
    }

    [[nodiscard]] static CastConfig deserialize(const json& j) {
        CastConfig cfg;
        cfg.enabled = j.value("enabled", cfg.enabled);
        cfg.heartbeatSeconds = j.value("heartbeatSeconds", cfg.heartbeatSeconds);
        return cfg;
    }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_SECTIONS_PROTOCOL_CONFIG_HPP
