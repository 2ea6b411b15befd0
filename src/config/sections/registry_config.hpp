/*
 * registry_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Device registry, polling and retry configuration

**************************************************/

#ifndef HEARTH_CONFIG_SECTIONS_REGISTRY_CONFIG_HPP
#define HEARTH_CONFIG_SECTIONS_REGISTRY_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <map>
#include <string>

#include "../core/config_section.hpp"

namespace hearth::config {

/**
 * @brief Retry strategy enumeration
 */
enum class RetryStrategy {
    None,        ///< No retry
    Linear,      ///< Fixed delay between retries
    Exponential  ///< Exponential backoff
};

[[nodiscard]] inline RetryStrategy retryStrategyFromString(const std::string& str) {
    if (str == "none") return RetryStrategy::None;
    if (str == "linear") return RetryStrategy::Linear;
    return RetryStrategy::Exponential;
}

/**
 * @brief Retry configuration for DeviceUnreachable and ProtocolError
 */
struct RetryConfig {
    std::string strategy{"exponential"};  ///< none, linear, exponential
    int maxRetries{2};                    ///< Attempts after the first one
    size_t initialDelayMs{250};           ///< Initial delay in milliseconds
    size_t maxDelayMs{2000};              ///< Maximum delay in milliseconds
    float multiplier{2.0f};               ///< Multiplier for exponential backoff

    /**
     * @brief Delay before retry number attempt (0-based)
     */
    [[nodiscard]] std::chrono::milliseconds delayFor(int attempt) const {
        switch (retryStrategyFromString(strategy)) {
            case RetryStrategy::None:
                return std::chrono::milliseconds(0);
            case RetryStrategy::Linear:
                return std::chrono::milliseconds(initialDelayMs);
            case RetryStrategy::Exponential: {
                auto delay = static_cast<double>(initialDelayMs) *
                             std::pow(multiplier, attempt);
                return std::chrono::milliseconds(static_cast<long long>(
                    std::min(delay, static_cast<double>(maxDelayMs))));
            }
        }
        return std::chrono::milliseconds(initialDelayMs);
    }

    [[nodiscard]] int effectiveRetries() const {
        return retryStrategyFromString(strategy) == RetryStrategy::None
                   ? 0
                   : std::max(maxRetries, 0);
    }

    [[nodiscard]] json toJson() const {
        return {{"strategy", strategy},
                {"maxRetries", maxRetries},
                {"initialDelayMs", initialDelayMs},
                {"maxDelayMs", maxDelayMs},
                {"multiplier", multiplier}};
    }

    [[nodiscard]] static RetryConfig fromJson(const json& j) {
        RetryConfig cfg;
        cfg.strategy = j.value("strategy", cfg.strategy);
        cfg.maxRetries = j.value("maxRetries", cfg.maxRetries);
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.maxDelayMs = j.value("maxDelayMs", cfg.maxDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        return cfg;
    }
};

/**
 * @brief Registry tunables
 *
 * Grace period and poll interval have no fixed values; both are read here
 * and may be overridden per device.
 */
struct RegistryConfig : ConfigSection<RegistryConfig> {
    static constexpr std::string_view KEY = "registry";

    size_t gracePeriodSeconds{30};   ///< Delay before a lost device is removed
    bool pollingEnabled{true};       ///< Poll devices without push support
    size_t pollIntervalSeconds{5};   ///< Default poll interval
    std::map<std::string, size_t> pollOverrides;  ///< deviceId -> seconds
    size_t commandTimeoutMs{4000};   ///< Bound of one adapter call
    size_t workerThreads{4};         ///< Concurrent outbound operations

    RetryConfig retry;

    [[nodiscard]] std::chrono::seconds pollIntervalFor(
        const std::string& deviceId) const {
        auto it = pollOverrides.find(deviceId);
        return std::chrono::seconds(it != pollOverrides.end()
                                        ? it->second
                                        : pollIntervalSeconds);
    }

    [[nodiscard]] json serialize() const {
        return {{"gracePeriodSeconds", gracePeriodSeconds},
                {"pollingEnabled", pollingEnabled},
                {"pollIntervalSeconds", pollIntervalSeconds},
                {"pollOverrides", pollOverrides},
                {"commandTimeoutMs", commandTimeoutMs},
                {"workerThreads", workerThreads},
                {"retry", retry.toJson()}};
    }

    [[nodiscard]] static RegistryConfig deserialize(const json& j) {
        RegistryConfig cfg;
        cfg.gracePeriodSeconds =
            j.value("gracePeriodSeconds", cfg.gracePeriodSeconds);
        cfg.pollingEnabled = j.value("pollingEnabled", cfg.pollingEnabled);
        cfg.pollIntervalSeconds =
            j.value("pollIntervalSeconds", cfg.pollIntervalSeconds);
        if (j.contains("pollOverrides") && j["pollOverrides"].is_object()) {
            cfg.pollOverrides =
                j["pollOverrides"].get<std::map<std::string, size_t>>();
        }
        cfg.commandTimeoutMs = j.value("commandTimeoutMs", cfg.commandTimeoutMs);
        cfg.workerThreads =
            std::max<size_t>(1, j.value("workerThreads", cfg.workerThreads));
        if (j.contains("retry")) {
            cfg.retry = RetryConfig::fromJson(j["retry"]);
        }
        return cfg;
    }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_SECTIONS_REGISTRY_CONFIG_HPP
