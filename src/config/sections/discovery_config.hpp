/*
 * discovery_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Discovery orchestrator configuration

**************************************************/

#ifndef HEARTH_CONFIG_SECTIONS_DISCOVERY_CONFIG_HPP
#define HEARTH_CONFIG_SECTIONS_DISCOVERY_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace hearth::config {

struct DiscoveryConfig : ConfigSection<DiscoveryConfig> {
    static constexpr std::string_view KEY = "discovery";

    bool autoDiscovery{true};        ///< Run probes continuously
    size_t intervalSeconds{60};      ///< Pause between continuous passes
    size_t sightingWindowMs{2000};   ///< Duplicate sightings inside are dropped
    size_t probeTimeoutMs{3000};     ///< Listen window of one probe pass
    std::string broadcastAddress{"255.255.255.255"};

    [[nodiscard]] json serialize() const {
        return {{"autoDiscovery", autoDiscovery},
                {"intervalSeconds", intervalSeconds},
                {"sightingWindowMs", sightingWindowMs},
                {"probeTimeoutMs", probeTimeoutMs},
                {"broadcastAddress", broadcastAddress}};
    }

    [[nodiscard]] static DiscoveryConfig deserialize(const json& j) {
        DiscoveryConfig cfg;
        cfg.autoDiscovery = j.value("autoDiscovery", cfg.autoDiscovery);
        cfg.intervalSeconds = j.value("intervalSeconds", cfg.intervalSeconds);
        cfg.sightingWindowMs =
            j.value("sightingWindowMs", cfg.sightingWindowMs);
        cfg.probeTimeoutMs = j.value("probeTimeoutMs", cfg.probeTimeoutMs);
        cfg.broadcastAddress =
            j.value("broadcastAddress", cfg.broadcastAddress);
        return cfg;
    }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_SECTIONS_DISCOVERY_CONFIG_HPP
