/*
 * wiz_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: WiZ light adapter and discovery probe

**************************************************/

#ifndef HEARTH_DEVICE_WIZ_WIZ_ADAPTER_HPP
#define HEARTH_DEVICE_WIZ_WIZ_ADAPTER_HPP

#include <chrono>
#include <memory>

#include "config/config_provider.hpp"
#include "device/adapter/device_adapter.hpp"
#include "device/discovery/discovery_probe.hpp"

namespace hearth::device::wiz {

/**
 * @brief WiZ bulbs over connectionless UDP JSON
 *
 * A session only pins the endpoint; every call is one request/reply
 * exchange bounded by the command timeout.
 */
class WizAdapter : public DeviceAdapter {
public:
    WizAdapter(std::shared_ptr<config::ConfigProvider> config,
               std::chrono::milliseconds timeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::WiZ;
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
 * @brief Finds bulbs by registration broadcast plus configured hosts
 */
class WizProbe : public DiscoveryProbe {
public:
    WizProbe(std::shared_ptr<config::ConfigProvider> config,
             std::chrono::milliseconds queryTimeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::WiZ;
    }

    auto scan(std::chrono::milliseconds window,
              const SightingCallback& onSighting) -> DeviceVoidResult override;

private:
    // Reads mac and moduleName with getSystemConfig
    auto describe(const Endpoint& endpoint) const
        -> DeviceResult<DeviceDescriptor>;

    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds queryTimeout_;
};

}  // namespace hearth::device::wiz

#endif  // HEARTH_DEVICE_WIZ_WIZ_ADAPTER_HPP
