/*
 * test_command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for the capability model, command validation and colour
conversion

**************************************************/

#include <gtest/gtest.h>

#include "device/adapter/color.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"

using namespace hearth::device;

class CommandTest : public ::testing::Test {
protected:
    static auto bulb() -> DeviceDescriptor {
        DeviceDescriptor d;
        d.id = DeviceId::make(Protocol::WiZ, "a8bb50e3f1c2");
        d.kind = DeviceKind::Light;
        d.protocol = Protocol::WiZ;
        d.capabilities = {CapabilityTag::Power, CapabilityTag::Brightness,
                          CapabilityTag::Color};
        return d;
    }

    static auto speaker() -> DeviceDescriptor {
        DeviceDescriptor d;
        d.id = DeviceId::make(Protocol::Chromecast, "5f2c");
        d.kind = DeviceKind::Speaker;
        d.protocol = Protocol::Chromecast;
        d.capabilities = {CapabilityTag::Power, CapabilityTag::Volume,
                          CapabilityTag::Media};
        return d;
    }
};

// ========== Validation ==========

TEST_F(CommandTest, Brightness_AboveRangeIsClamped) {
    auto result = validateCommand(bulb(), SetBrightness{150});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<SetBrightness>(*result).level, 100);
}

TEST_F(CommandTest, Brightness_BelowRangeIsClamped) {
    auto result = validateCommand(bulb(), SetBrightness{-20});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<SetBrightness>(*result).level, 0);
}

TEST_F(CommandTest, Volume_IsClamped) {
    auto result = validateCommand(speaker(), SetVolume{101});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<SetVolume>(*result).level, 100);
}

TEST_F(CommandTest, Color_ChannelOutOfRangeIsRejected) {
    auto result = validateCommand(bulb(), SetColor{Rgb{300, 0, 0}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::InvalidArgument);
}

TEST_F(CommandTest, Color_NegativeChannelIsRejected) {
    auto result = validateCommand(bulb(), SetColor{Rgb{0, -1, 0}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::InvalidArgument);
}

TEST_F(CommandTest, Color_ValidIsUnchanged) {
    auto result = validateCommand(bulb(), SetColor{Rgb{255, 128, 0}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(std::get<SetColor>(*result).color, (Rgb{255, 128, 0}));
}

TEST_F(CommandTest, Volume_OnBulbIsUnsupported) {
    auto result = validateCommand(bulb(), SetVolume{20});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::UnsupportedCapability);
}

TEST_F(CommandTest, Brightness_OnSpeakerIsUnsupported) {
    auto result = validateCommand(speaker(), SetBrightness{20});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::UnsupportedCapability);
}

TEST_F(CommandTest, MissingCapabilityWinsOverBadArgument) {
    auto d = bulb();
    d.capabilities.erase(CapabilityTag::Color);
    auto result = validateCommand(d, SetColor{Rgb{999, 0, 0}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::UnsupportedCapability);
}

TEST_F(CommandTest, Media_RequiresMediaCapability) {
    EXPECT_TRUE(validateCommand(speaker(), MediaControl{MediaAction::Pause}));
    EXPECT_FALSE(validateCommand(bulb(), MediaControl{MediaAction::Pause}));
}

// ========== Capabilities and keys ==========

TEST_F(CommandTest, RequiredCapability_MapsEveryCommand) {
    EXPECT_EQ(requiredCapability(SetPower{true}), CapabilityTag::Power);
    EXPECT_EQ(requiredCapability(Toggle{}), CapabilityTag::Power);
    EXPECT_EQ(requiredCapability(SetBrightness{1}), CapabilityTag::Brightness);
    EXPECT_EQ(requiredCapability(SetColor{}), CapabilityTag::Color);
    EXPECT_EQ(requiredCapability(SetVolume{1}), CapabilityTag::Volume);
    EXPECT_EQ(requiredCapability(MediaControl{}), CapabilityTag::Media);
}

TEST_F(CommandTest, SupersedeKey_ToggleIsNeverSuperseded) {
    EXPECT_TRUE(supersedeKey(Toggle{}).empty());
    EXPECT_EQ(supersedeKey(SetPower{true}), supersedeKey(SetPower{false}));
    EXPECT_NE(supersedeKey(SetPower{true}), supersedeKey(SetBrightness{1}));
}

TEST_F(CommandTest, Describe_IsReadable) {
    EXPECT_EQ(describeCommand(SetBrightness{50}), "setBrightness(50)");
    EXPECT_EQ(describeCommand(SetColor{Rgb{1, 2, 3}}), "setColor(1, 2, 3)");
    EXPECT_EQ(describeCommand(MediaControl{MediaAction::Stop}), "media(stop)");
}

// ========== State application ==========

TEST_F(CommandTest, ApplyBrightness_ImpliesPowerOn) {
    DeviceState state;
    state.power = false;
    auto next = applyCommandToState(state, SetBrightness{40});
    EXPECT_TRUE(next.power);
    EXPECT_EQ(next.brightness, 40);
    EXPECT_TRUE(next.reachable);
}

TEST_F(CommandTest, ApplyPowerOff_KeepsOtherFields) {
    DeviceState state;
    state.power = true;
    state.brightness = 70;
    state.color = Rgb{1, 2, 3};
    auto next = applyCommandToState(state, SetPower{false});
    EXPECT_FALSE(next.power);
    EXPECT_EQ(next.brightness, 70);
    EXPECT_EQ(next.color, (Rgb{1, 2, 3}));
}

TEST_F(CommandTest, ApplyMedia_UpdatesPlaybackState) {
    DeviceState state;
    auto next = applyCommandToState(state, MediaControl{MediaAction::Pause});
    ASSERT_TRUE(next.mediaInfo.has_value());
    EXPECT_EQ(next.mediaInfo->playbackState, PlaybackState::Paused);
}

// ========== Model ==========

TEST(DeviceTypesTest, DeviceId_CarriesProtocolTag) {
    auto id = DeviceId::make(Protocol::Tuya, "bf12ab");
    EXPECT_EQ(id.str(), "tuya:bf12ab");
    EXPECT_EQ(id.vendorId(), "bf12ab");
    EXPECT_EQ(DeviceId("plain").vendorId(), "plain");
}

TEST(DeviceTypesTest, ProtocolFromString_AcceptsNameAndTag) {
    EXPECT_EQ(protocolFromString("WiZ"), Protocol::WiZ);
    EXPECT_EQ(protocolFromString("chromecast"), Protocol::Chromecast);
    EXPECT_FALSE(protocolFromString("zigbee").has_value());
}

TEST(DeviceTypesTest, SameAs_IgnoresTimestamp) {
    DeviceState a;
    a.power = true;
    a.lastUpdated = Clock::now();
    DeviceState b = a;
    b.lastUpdated = a.lastUpdated + std::chrono::seconds(5);
    EXPECT_TRUE(a.sameAs(b));
    b.brightness = 10;
    EXPECT_FALSE(a.sameAs(b));
}

TEST(DeviceTypesTest, StateJson_OmitsAbsentFields) {
    DeviceState state;
    state.power = true;
    state.volume = 30;
    auto j = toJson(state);
    EXPECT_EQ(j["power"], true);
    EXPECT_EQ(j["volume"], 30);
    EXPECT_FALSE(j.contains("brightness"));
    EXPECT_FALSE(j.contains("color"));
}

// ========== Colour ==========

TEST(ColorTest, PrimaryColorsToHsv) {
    auto red = rgbToHsv(Rgb{255, 0, 0});
    EXPECT_DOUBLE_EQ(red.h, 0.0);
    EXPECT_DOUBLE_EQ(red.s, 1.0);
    EXPECT_DOUBLE_EQ(red.v, 1.0);

    auto blue = rgbToHsv(Rgb{0, 0, 255});
    EXPECT_DOUBLE_EQ(blue.h, 240.0);
}

TEST(ColorTest, GreyHasNoSaturation) {
    auto grey = rgbToHsv(Rgb{128, 128, 128});
    EXPECT_DOUBLE_EQ(grey.s, 0.0);
    EXPECT_DOUBLE_EQ(grey.h, 0.0);
}

TEST(ColorTest, HsvToRgb_Primaries) {
    EXPECT_EQ(hsvToRgb(Hsv{120.0, 1.0, 1.0}), (Rgb{0, 255, 0}));
    EXPECT_EQ(hsvToRgb(Hsv{60.0, 1.0, 1.0}), (Rgb{255, 255, 0}));
    EXPECT_EQ(hsvToRgb(Hsv{0.0, 0.0, 0.0}), (Rgb{0, 0, 0}));
}
