/*
 * hearth_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Complete application configuration document

**************************************************/

#ifndef HEARTH_CONFIG_HEARTH_CONFIG_HPP
#define HEARTH_CONFIG_HEARTH_CONFIG_HPP

#include "sections/discovery_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/protocol_config.hpp"
#include "sections/registry_config.hpp"

namespace hearth::config {

/**
 * @brief All sections of a configuration file
 *
 * Unknown keys are ignored and missing sections take their defaults, so an
 * empty object is a valid configuration.
 */
struct HearthConfig {
    LoggingConfig logging;
    DiscoveryConfig discovery;
    RegistryConfig registry;
    WizConfig wiz;
    TapoConfig tapo;
    TuyaConfig tuya;
    CastConfig cast;

    [[nodiscard]] json toJson() const {
        return {{std::string(LoggingConfig::key()), logging.toJson()},
                {std::string(DiscoveryConfig::key()), discovery.toJson()},
                {std::string(RegistryConfig::key()), registry.toJson()},
                {std::string(WizConfig::key()), wiz.toJson()},
                {std::string(TapoConfig::key()), tapo.toJson()},
                {std::string(TuyaConfig::key()), tuya.toJson()},
                {std::string(CastConfig::key()), cast.toJson()}};
    }

    [[nodiscard]] static HearthConfig fromJson(const json& j) {
        HearthConfig cfg;
        cfg.logging = LoggingConfig::fromDocument(j);
        cfg.discovery = DiscoveryConfig::fromDocument(j);
        cfg.registry = RegistryConfig::fromDocument(j);
        cfg.wiz = WizConfig::fromDocument(j);
        cfg.tapo = TapoConfig::fromDocument(j);
        cfg.tuya = TuyaConfig::fromDocument(j);
        cfg.cast = CastConfig::fromDocument(j);
        return cfg;
    }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_HEARTH_CONFIG_HPP
