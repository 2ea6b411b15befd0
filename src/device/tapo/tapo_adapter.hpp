/*
 * tapo_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tapo light adapter and discovery probe

**************************************************/

#ifndef HEARTH_DEVICE_TAPO_TAPO_ADAPTER_HPP
#define HEARTH_DEVICE_TAPO_TAPO_ADAPTER_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

#include "config/config_provider.hpp"
#include "device/adapter/device_adapter.hpp"
#include "device/discovery/discovery_probe.hpp"
#include "tapo_client.hpp"

namespace hearth::device::tapo {

/**
 * @brief Tapo lights over KLAP
 *
 * Sessions are cached per device address and survive between commands;
 * reset() drops them, e.g. after the credentials changed.
 */
class TapoAdapter : public DeviceAdapter {
public:
    TapoAdapter(std::shared_ptr<config::ConfigProvider> config,
                std::chrono::milliseconds timeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Tapo;
    }

    auto connect(const DeviceDescriptor& descriptor)
        -> DeviceResult<std::unique_ptr<DeviceSession>> override;

    auto applyCommand(DeviceSession& session, const Command& command)
        -> DeviceVoidResult override;

    auto fetchState(DeviceSession& session)
        -> DeviceResult<DeviceState> override;

    void close(DeviceSession& session) override;

    void reset() override;

private:
    auto clientFor(const Endpoint& endpoint)
        -> DeviceResult<std::shared_ptr<KlapClient>>;

    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds timeout_;

    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<KlapClient>> clients_;
};

/**
 * @brief Queries the configured Tapo hosts
 *
 * Tapo bulbs do not announce themselves; only hosts listed in the
 * configuration are checked.
 */
class TapoProbe : public DiscoveryProbe {
public:
    TapoProbe(std::shared_ptr<config::ConfigProvider> config,
              std::chrono::milliseconds queryTimeout);

    [[nodiscard]] auto protocol() const -> Protocol override {
        return Protocol::Tapo;
    }

    auto scan(std::chrono::milliseconds window,
              const SightingCallback& onSighting) -> DeviceVoidResult override;

private:
    std::shared_ptr<config::ConfigProvider> config_;
    std::chrono::milliseconds queryTimeout_;
};

}  // namespace hearth::device::tapo

#endif  // HEARTH_DEVICE_TAPO_TAPO_ADAPTER_HPP
