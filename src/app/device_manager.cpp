/*
 * device_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device manager implementation

**************************************************/

#include "device_manager.hpp"

#include <spdlog/spdlog.h>

#include "device/cast/cast_adapter.hpp"
#include "device/tapo/tapo_adapter.hpp"
#include "device/tuya/tuya_adapter.hpp"
#include "device/wiz/wiz_adapter.hpp"
#include "logging/logging_manager.hpp"

namespace hearth::app {

using namespace device;

DeviceManager::DeviceManager(std::shared_ptr<config::ConfigProvider> config)
    : config_(std::move(config)),
      adapters_(std::make_shared<AdapterRegistry>()) {
    queue_.attach(bus_);
    registry_ = std::make_unique<DeviceRegistry>(adapters_, bus_,
                                                 config_->current()->registry);
    orchestrator_ = std::make_unique<DiscoveryOrchestrator>(*registry_, config_);
}

DeviceManager::~DeviceManager() { stop(); }

void DeviceManager::registerProtocols() {
    const auto config = config_->current();
    const std::chrono::milliseconds timeout(config->registry.commandTimeoutMs);
    const std::chrono::milliseconds window(config->discovery.probeTimeoutMs);

    adapters_->registerAdapter(
        std::make_shared<wiz::WizAdapter>(config_, timeout));
    adapters_->registerAdapter(
        std::make_shared<tuya::TuyaAdapter>(config_, timeout));
    adapters_->registerAdapter(
        std::make_shared<tapo::TapoAdapter>(config_, timeout));
    adapters_->registerAdapter(
        std::make_shared<cast::CastAdapter>(config_, timeout));

    orchestrator_->addProbe(std::make_unique<wiz::WizProbe>(config_, window));
    orchestrator_->addProbe(std::make_unique<tuya::TuyaProbe>(config_, window));
    orchestrator_->addProbe(std::make_unique<tapo::TapoProbe>(config_, window));
    orchestrator_->addProbe(std::make_unique<cast::CastProbe>());
}

void DeviceManager::start() {
    if (started_) {
        return;
    }
    started_ = true;
    registerProtocols();
    orchestrator_->start();

    const auto config = config_->current();
    if (!config->discovery.autoDiscovery) {
        spdlog::info("DeviceManager: auto discovery off, use rescan");
    }
    spdlog::info("DeviceManager: started");
}

void DeviceManager::stop() {
    // Discovery feeds the registry, so it goes first
    orchestrator_->stop();
    registry_->stop();
    queue_.close();
}

auto DeviceManager::snapshot() const -> std::vector<DeviceSnapshot> {
    return registry_->snapshot();
}

auto DeviceManager::invoke(const DeviceId& id, Command command)
    -> std::future<DeviceVoidResult> {
    return registry_->invoke(id, std::move(command));
}

void DeviceManager::rescan() { orchestrator_->rescan(); }

auto DeviceManager::reload() -> DeviceVoidResult {
    if (auto result = config_->reload(); !result) {
        spdlog::error("DeviceManager: reload failed: {}",
                      result.error().toString());
        return result;
    }
    const auto config = config_->current();
    logging::LoggingManager::getInstance().initialize(config->logging);
    adapters_->resetAll();
    registry_->applyConfig(config->registry);
    orchestrator_->rescan();
    spdlog::info("DeviceManager: configuration reloaded");
    return success();
}

auto DeviceManager::probeStatus() const -> std::vector<ProbeStatus> {
    return orchestrator_->probeStatus();
}

}  // namespace hearth::app
