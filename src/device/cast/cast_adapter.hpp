/*
 * cast_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Chromecast speaker adapter and mDNS discovery probe

**************************************************/

#ifndef HEARTH_DEVICE_CAST_CAST_ADAPTER_HPP
#define HEARTH_DEVICE_CAST_CAST_ADAPTER_HPP

#include <chrono>
#include <memory>

#include "config/config_provider.hpp"
#include "device/adapter/device_adapter.hpp"
#include "device/discovery/discovery_probe.hpp"

namespace hearth::device::cast {

/**
 * @brief Cast receivers (speakers, TVs) over the Cast v2 channel
 *
 * State is pushed by the receiver, so the registry watches these devices
 * instead of polling them. The receiver itself cannot be switched off:
 * setPower(true) is accepted without effect and setPower(false) stops the
 * running application.
 */
class CastAdapter : public DeviceAdapter {
public:
    CastAdapter(std::shared_ptr<config::ConfigProvider> config,
                std::chrono::milliseconds timeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Chromecast;
    }

    auto connect(const DeviceDescriptor& descriptor)
        -> DeviceResult<std::unique_ptr<DeviceSession>> override;

    auto applyCommand(DeviceSession& session, const Command& command)
        -> DeviceVoidResult override;

    auto fetchState(DeviceSession& session)
        -> DeviceResult<DeviceState> override;

    void close(DeviceSession& session) override;

    [[nodiscard]] auto supportsPush() const -> bool override { return true; }

    auto watch(const DeviceDescriptor& descriptor, PushSink sink)
        -> DeviceResult<PushSubscription> override;

private:
    [[nodiscard]] auto heartbeat() const -> std::chrono::seconds;

    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Browses _googlecast._tcp.local with an mDNS PTR query
 */
class CastProbe : public DiscoveryProbe {
public:
    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Chromecast;
    }

    auto scan(std::chrono::milliseconds window,
              const SightingCallback& onSighting) -> DeviceVoidResult override;
};

}  // namespace hearth::device::cast

#endif  // HEARTH_DEVICE_CAST_CAST_ADAPTER_HPP
