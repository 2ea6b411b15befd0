/*
 * test_discovery_orchestrator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for DiscoveryOrchestrator with scripted probes

**************************************************/

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "device/discovery/discovery_orchestrator.hpp"
#include "device/events/event_queue.hpp"

using namespace hearth::device;
using namespace std::chrono_literals;

namespace {

class StubAdapter : public DeviceAdapter {
public:
    explicit StubAdapter(Protocol protocol) : protocol_(protocol) {}

    auto protocol() const -> Protocol override { return protocol_; }

    auto connect(const DeviceDescriptor& descriptor)
        -> DeviceResult<std::unique_ptr<DeviceSession>> override {
        return std::make_unique<DeviceSession>(descriptor);
    }

    auto applyCommand(DeviceSession&, const Command&)
        -> DeviceVoidResult override {
        return success();
    }

    auto fetchState(DeviceSession&) -> DeviceResult<DeviceState> override {
        DeviceState state;
        state.reachable = true;
        return state;
    }

    void close(DeviceSession&) override {}

private:
    Protocol protocol_;
};

/**
 * @brief What the next scan of a ScriptedProbe reports
 */
struct ProbeScript {
    std::mutex mutex;
    std::vector<DeviceDescriptor> sightings;
    std::optional<DeviceError> failWith;
    bool throwInstead = false;
    std::atomic<int> scans{0};
};

class ScriptedProbe : public DiscoveryProbe {
public:
    ScriptedProbe(Protocol protocol, std::shared_ptr<ProbeScript> script)
        : protocol_(protocol), script_(std::move(script)) {}

    auto protocol() const -> Protocol override { return protocol_; }

    auto scan(std::chrono::milliseconds, const SightingCallback& onSighting)
        -> DeviceVoidResult override {
        ++script_->scans;
        std::vector<DeviceDescriptor> sightings;
        {
            std::lock_guard<std::mutex> lock(script_->mutex);
            if (script_->throwInstead) {
                throw std::runtime_error("socket exploded");
            }
            if (script_->failWith) {
                return failure(*script_->failWith);
            }
            sightings = script_->sightings;
        }
        for (const auto& d : sightings) {
            onSighting(d);
        }
        return success();
    }

private:
    Protocol protocol_;
    std::shared_ptr<ProbeScript> script_;
};

auto device(Protocol protocol, const std::string& vendorId,
            const std::string& host = "10.0.0.5") -> DeviceDescriptor {
    DeviceDescriptor d;
    d.id = DeviceId::make(protocol, vendorId);
    d.displayName = vendorId;
    d.protocol = protocol;
    d.kind = DeviceKind::Light;
    d.capabilities = {CapabilityTag::Power};
    d.address = {host, 6668};
    d.lastSeen = Clock::now();
    return d;
}

}  // namespace

class DiscoveryOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        queue_.attach(bus_);
        adapters_ = std::make_shared<AdapterRegistry>();
        adapters_->registerAdapter(std::make_shared<StubAdapter>(Protocol::WiZ));
        adapters_->registerAdapter(
            std::make_shared<StubAdapter>(Protocol::Tuya));

        config_.registry.gracePeriodSeconds = 0;
        config_.registry.pollingEnabled = false;
        config_.discovery.autoDiscovery = false;
        config_.discovery.probeTimeoutMs = 10;
        provider_ = std::make_shared<hearth::config::StaticConfigProvider>(config_);

        registry_ = std::make_unique<DeviceRegistry>(adapters_, bus_,
                                                     config_.registry);
        orchestrator_ =
            std::make_unique<DiscoveryOrchestrator>(*registry_, provider_);
    }

    void TearDown() override {
        orchestrator_->stop();
        registry_->stop();
    }

    auto addProbe(Protocol protocol) -> std::shared_ptr<ProbeScript> {
        auto script = std::make_shared<ProbeScript>();
        orchestrator_->addProbe(std::make_unique<ScriptedProbe>(protocol, script));
        return script;
    }

    auto countEvents(DeviceEventType type, std::chrono::milliseconds settle)
        -> int {
        std::this_thread::sleep_for(settle);
        int count = 0;
        for (const auto& event : queue_.drain()) {
            if (event.type() == type) {
                ++count;
            }
        }
        return count;
    }

    auto statusOf(Protocol protocol) -> ProbeStatus {
        for (const auto& status : orchestrator_->probeStatus()) {
            if (status.protocol == protocol) {
                return status;
            }
        }
        return {};
    }

    DeviceEventBus bus_;
    EventQueue queue_;
    std::shared_ptr<AdapterRegistry> adapters_;
    hearth::config::HearthConfig config_;
    std::shared_ptr<hearth::config::StaticConfigProvider> provider_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<DiscoveryOrchestrator> orchestrator_;
};

// ========== Sightings ==========

TEST_F(DiscoveryOrchestratorTest, RepeatedSightings_OneDiscoveredEvent) {
    auto wiz = addProbe(Protocol::WiZ);
    wiz->sightings = {device(Protocol::WiZ, "aa"), device(Protocol::WiZ, "aa"),
                      device(Protocol::WiZ, "aa")};

    orchestrator_->scanOnce();
    orchestrator_->scanOnce();

    EXPECT_EQ(registry_->size(), 1U);
    EXPECT_EQ(countEvents(DeviceEventType::DeviceDiscovered, 100ms), 1);
}

TEST_F(DiscoveryOrchestratorTest, AddressChange_ForwardedInsideWindow) {
    auto wiz = addProbe(Protocol::WiZ);
    wiz->sightings = {device(Protocol::WiZ, "aa", "10.0.0.5")};
    orchestrator_->scanOnce();

    wiz->sightings = {device(Protocol::WiZ, "aa", "10.0.0.9")};
    orchestrator_->scanOnce();

    auto entry = registry_->get(DeviceId("wiz:aa"));
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->descriptor.address.host, "10.0.0.9");
}

TEST_F(DiscoveryOrchestratorTest, ForeignSighting_Ignored) {
    auto wiz = addProbe(Protocol::WiZ);
    wiz->sightings = {device(Protocol::Tuya, "bb"), DeviceDescriptor{}};

    orchestrator_->scanOnce();
    EXPECT_EQ(registry_->size(), 0U);
    EXPECT_EQ(statusOf(Protocol::WiZ).lastSightings, 0U);
}

// ========== Loss ==========

TEST_F(DiscoveryOrchestratorTest, MissingFromPass_MarkedLost) {
    auto wiz = addProbe(Protocol::WiZ);
    wiz->sightings = {device(Protocol::WiZ, "aa"), device(Protocol::WiZ, "bb")};
    orchestrator_->scanOnce();
    ASSERT_EQ(registry_->size(), 2U);
    queue_.drain();

    wiz->sightings = {device(Protocol::WiZ, "aa")};
    orchestrator_->scanOnce();

    EXPECT_EQ(countEvents(DeviceEventType::DeviceLost, 300ms), 1);
    EXPECT_TRUE(registry_->contains(DeviceId("wiz:aa")));
    EXPECT_FALSE(registry_->contains(DeviceId("wiz:bb")));
}

TEST_F(DiscoveryOrchestratorTest, OtherProtocolsUntouchedByPass) {
    addProbe(Protocol::WiZ);
    auto tuya = addProbe(Protocol::Tuya);
    tuya->sightings = {device(Protocol::Tuya, "t1")};
    orchestrator_->scanOnce();

    tuya->failWith = error::discoveryError("bind failed");
    orchestrator_->scanOnce();

    EXPECT_EQ(countEvents(DeviceEventType::DeviceLost, 300ms), 0);
    EXPECT_TRUE(registry_->contains(DeviceId("tuya:t1")));
}

TEST_F(DiscoveryOrchestratorTest, ManualDevice_NeverMarkedLost) {
    addProbe(Protocol::WiZ);
    orchestrator_->addManual(device(Protocol::WiZ, "manual", "10.0.0.77"));

    orchestrator_->scanOnce();
    orchestrator_->scanOnce();

    EXPECT_EQ(countEvents(DeviceEventType::DeviceLost, 300ms), 0);
    EXPECT_TRUE(registry_->contains(DeviceId("wiz:manual")));
}

// ========== Failure isolation ==========

TEST_F(DiscoveryOrchestratorTest, FailingProbe_RecordedInStatus) {
    auto wiz = addProbe(Protocol::WiZ);
    auto tuya = addProbe(Protocol::Tuya);
    wiz->sightings = {device(Protocol::WiZ, "aa")};
    tuya->failWith = error::discoveryError("no broadcast route");

    orchestrator_->scanOnce();

    EXPECT_TRUE(registry_->contains(DeviceId("wiz:aa")));
    auto failed = statusOf(Protocol::Tuya);
    EXPECT_EQ(failed.passes, 1U);
    EXPECT_EQ(failed.failures, 1U);
    ASSERT_TRUE(failed.lastError);
    EXPECT_EQ(failed.lastError->code, DeviceErrorCode::DiscoveryError);

    auto ok = statusOf(Protocol::WiZ);
    EXPECT_EQ(ok.failures, 0U);
    EXPECT_EQ(ok.lastSightings, 1U);
    EXPECT_FALSE(ok.lastError);
}

TEST_F(DiscoveryOrchestratorTest, ThrowingProbe_BecomesDiscoveryError) {
    auto tuya = addProbe(Protocol::Tuya);
    tuya->throwInstead = true;

    EXPECT_NO_THROW(orchestrator_->scanOnce());
    auto status = statusOf(Protocol::Tuya);
    ASSERT_TRUE(status.lastError);
    EXPECT_EQ(status.lastError->code, DeviceErrorCode::DiscoveryError);
    EXPECT_EQ(status.toJson()["failures"], 1);
}

TEST_F(DiscoveryOrchestratorTest, DisabledProtocol_NotScanned) {
    auto config = config_;
    config.tuya.enabled = false;
    provider_->update(config);
    auto tuya = addProbe(Protocol::Tuya);
    tuya->sightings = {device(Protocol::Tuya, "t1")};

    orchestrator_->scanOnce();

    EXPECT_EQ(tuya->scans, 0);
    EXPECT_EQ(registry_->size(), 0U);
    EXPECT_EQ(statusOf(Protocol::Tuya).passes, 0U);
}

// ========== Background passes ==========

TEST_F(DiscoveryOrchestratorTest, Rescan_RunsPassWithAutoDiscoveryOff) {
    auto wiz = addProbe(Protocol::WiZ);
    wiz->sightings = {device(Protocol::WiZ, "aa")};
    orchestrator_->start();

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(wiz->scans, 0);

    orchestrator_->rescan();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!registry_->contains(DeviceId("wiz:aa")) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(wiz->scans, 1);
    EXPECT_TRUE(registry_->contains(DeviceId("wiz:aa")));
}

TEST_F(DiscoveryOrchestratorTest, AutoDiscovery_PassRunsOnStart) {
    auto config = config_;
    config.discovery.autoDiscovery = true;
    config.discovery.intervalSeconds = 60;
    provider_->update(config);
    auto wiz = addProbe(Protocol::WiZ);
    orchestrator_->start();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (wiz->scans == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(wiz->scans, 1);
}

TEST_F(DiscoveryOrchestratorTest, AddProbe_AfterStartThrows) {
    orchestrator_->start();
    EXPECT_THROW(addProbe(Protocol::WiZ), std::logic_error);
}
