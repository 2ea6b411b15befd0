/*
 * tuya_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tuya 3.3 light adapter and discovery probe

**************************************************/

#ifndef HEARTH_DEVICE_TUYA_TUYA_ADAPTER_HPP
#define HEARTH_DEVICE_TUYA_TUYA_ADAPTER_HPP

#include <chrono>
#include <memory>

#include "config/config_provider.hpp"
#include "device/adapter/device_adapter.hpp"
#include "device/discovery/discovery_probe.hpp"

namespace hearth::device::tuya {

/**
 * @brief Tuya lights over the encrypted TCP protocol
 *
 * Each device needs its local key in the configuration. A device without
 * one, or configured with a protocol version other than 3.3, fails with
 * ConfigurationError.
 */
class TuyaAdapter : public DeviceAdapter {
public:
    TuyaAdapter(std::shared_ptr<config::ConfigProvider> config,
                std::chrono::milliseconds timeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Tuya;
    }

    auto connect(const DeviceDescriptor& descriptor)
        -> DeviceResult<std::unique_ptr<DeviceSession>> override;

    auto applyCommand(DeviceSession& session, const Command& command)
        -> DeviceVoidResult override;

    auto fetchState(DeviceSession& session)
        -> DeviceResult<DeviceState> override;

    void close(DeviceSession& session) override;

private:
    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Listens for UDP announcements and checks configured devices
 */
class TuyaProbe : public DiscoveryProbe {
public:
    TuyaProbe(std::shared_ptr<config::ConfigProvider> config,
              std::chrono::milliseconds queryTimeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Tuya;
    }

    auto scan(std::chrono::milliseconds window,
              const SightingCallback& onSighting) -> DeviceVoidResult override;

private:
    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds queryTimeout_;
};

}  // namespace hearth::device::tuya

#endif  // HEARTH_DEVICE_TUYA_TUYA_ADAPTER_HPP
