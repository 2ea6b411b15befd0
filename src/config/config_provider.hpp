/*
 * config_provider.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Read-only configuration access with explicit reload

**************************************************/

#ifndef HEARTH_CONFIG_CONFIG_PROVIDER_HPP
#define HEARTH_CONFIG_CONFIG_PROVIDER_HPP

#include <filesystem>
#include <memory>
#include <mutex>

#include "device/common/device_result.hpp"
#include "hearth_config.hpp"

namespace hearth::config {

/**
 * @brief Source of configuration snapshots
 *
 * The core reads configuration at startup and on reload(); it never watches
 * the underlying store.
 */
class ConfigProvider {
public:
    virtual ~ConfigProvider() = default;

    /**
     * @brief Current configuration snapshot
     */
    [[nodiscard]] virtual auto current() const
        -> std::shared_ptr<const HearthConfig> = 0;

    /**
     * @brief Re-read the store
     *
     * On failure the previous snapshot stays current.
     */
    virtual auto reload() -> device::DeviceVoidResult = 0;
};

/**
 * @brief Configuration held in memory, replaced by update()
 */
class StaticConfigProvider : public ConfigProvider {
public:
    explicit StaticConfigProvider(HearthConfig config = {});

    [[nodiscard]] auto current() const
        -> std::shared_ptr<const HearthConfig> override;
    auto reload() -> device::DeviceVoidResult override;

    void update(HearthConfig config);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const HearthConfig> config_;
};

/**
 * @brief Configuration read from a JSON file
 */
class JsonConfigProvider : public ConfigProvider {
public:
    /**
     * @brief Load the file
     * @throws device::ConfigurationException if it cannot be read or parsed
     */
    explicit JsonConfigProvider(std::filesystem::path path);

    [[nodiscard]] auto current() const
        -> std::shared_ptr<const HearthConfig> override;
    auto reload() -> device::DeviceVoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    /**
     * @brief Parse a configuration file without installing it
     */
    static auto loadFile(const std::filesystem::path& path)
        -> device::DeviceResult<HearthConfig>;

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::shared_ptr<const HearthConfig> config_;
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_CONFIG_PROVIDER_HPP
