/*
 * test_device_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for the DeviceManager wiring

**************************************************/

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "app/device_manager.hpp"
#include "logging/logging_manager.hpp"

using namespace hearth;
using namespace hearth::device;
using namespace std::chrono_literals;

class DeviceManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config::HearthConfig cfg;
        cfg.logging.enableConsole = false;
        cfg.discovery.autoDiscovery = false;
        cfg.registry.pollingEnabled = false;
        cfg.registry.gracePeriodSeconds = 0;
        cfg.wiz.enabled = false;
        cfg.tapo.enabled = false;
        cfg.tuya.enabled = false;
        cfg.cast.enabled = false;
        provider_ = std::make_shared<config::StaticConfigProvider>(cfg);
        manager_ = std::make_unique<app::DeviceManager>(provider_);
    }

    void TearDown() override {
        manager_.reset();
        logging::LoggingManager::getInstance().shutdown();
    }

    static auto manualBulb() -> DeviceDescriptor {
        DeviceDescriptor descriptor;
        descriptor.id = DeviceId::make(Protocol::WiZ, "a8bb50000001");
        descriptor.displayName = "Desk";
        descriptor.protocol = Protocol::WiZ;
        descriptor.capabilities = {CapabilityTag::Power,
                                   CapabilityTag::Brightness};
        descriptor.address = {"127.0.0.1", 38899};
        return descriptor;
    }

    std::shared_ptr<config::StaticConfigProvider> provider_;
    std::unique_ptr<app::DeviceManager> manager_;
};

TEST_F(DeviceManagerTest, Start_RegistersOneProbePerProtocol) {
    manager_->start();
    EXPECT_EQ(manager_->probeStatus().size(), 4U);
    EXPECT_TRUE(manager_->snapshot().empty());
}

TEST_F(DeviceManagerTest, ManualDevice_ReachesEventQueue) {
    manager_->start();
    manager_->orchestrator().addManual(manualBulb());

    auto event = manager_->events().waitPop(2s);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type(), DeviceEventType::DeviceDiscovered);
    EXPECT_EQ(event->deviceId(), manualBulb().id);

    auto snapshot = manager_->snapshot();
    ASSERT_EQ(snapshot.size(), 1U);
    EXPECT_EQ(snapshot[0].descriptor.displayName, "Desk");
}

TEST_F(DeviceManagerTest, Invoke_UnknownDevice_NotFound) {
    manager_->start();
    auto result =
        manager_->invoke(DeviceId("wiz:missing"), SetPower{true}).get();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, DeviceErrorCode::NotFound);
}

TEST_F(DeviceManagerTest, Reload_AppliesNewConfiguration) {
    manager_->start();

    auto next = *provider_->current();
    next.registry.commandTimeoutMs = 1500;
    provider_->update(next);

    EXPECT_TRUE(manager_->reload());
    EXPECT_TRUE(logging::LoggingManager::getInstance().isInitialized());
}

TEST_F(DeviceManagerTest, Stop_ClosesEventQueue) {
    manager_->start();
    manager_->stop();

    const auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(manager_->events().waitPop(2s).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 1s);
    EXPECT_NO_THROW(manager_->stop());
}
