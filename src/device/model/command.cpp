/*
 * command.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device command set and boundary validation

**************************************************/

#include "command.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace hearth::device {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

constexpr int kPercentMin = 0;
constexpr int kPercentMax = 100;
constexpr int kChannelMax = 255;

auto channelInRange(int value) -> bool {
    return value >= 0 && value <= kChannelMax;
}

}  // namespace

auto mediaActionToString(MediaAction action) -> std::string {
    switch (action) {
        case MediaAction::Play:
            return "play";
        case MediaAction::Pause:
            return "pause";
        case MediaAction::Stop:
            return "stop";
    }
    return "unknown";
}

auto requiredCapability(const Command& command) -> CapabilityTag {
    return std::visit(
        Overloaded{
            [](const SetPower&) { return CapabilityTag::Power; },
            [](const Toggle&) { return CapabilityTag::Power; },
            [](const SetBrightness&) { return CapabilityTag::Brightness; },
            [](const SetColor&) { return CapabilityTag::Color; },
            [](const SetVolume&) { return CapabilityTag::Volume; },
            [](const MediaControl&) { return CapabilityTag::Media; },
        },
        command);
}

auto describeCommand(const Command& command) -> std::string {
    return std::visit(
        Overloaded{
            [](const SetPower& c) {
                return fmt::format("setPower({})", c.on);
            },
            [](const Toggle&) { return std::string("toggle()"); },
            [](const SetBrightness& c) {
                return fmt::format("setBrightness({})", c.level);
            },
            [](const SetColor& c) {
                return fmt::format("setColor({}, {}, {})", c.color.r,
                                   c.color.g, c.color.b);
            },
            [](const SetVolume& c) {
                return fmt::format("setVolume({})", c.level);
            },
            [](const MediaControl& c) {
                return fmt::format("media({})", mediaActionToString(c.action));
            },
        },
        command);
}

auto supersedeKey(const Command& command) -> std::string {
    return std::visit(
        Overloaded{
            [](const SetPower&) { return std::string("power"); },
            [](const Toggle&) { return std::string(); },
            [](const SetBrightness&) { return std::string("brightness"); },
            [](const SetColor&) { return std::string("color"); },
            [](const SetVolume&) { return std::string("volume"); },
            [](const MediaControl&) { return std::string("media"); },
        },
        command);
}

auto validateCommand(const DeviceDescriptor& descriptor,
                     const Command& command) -> DeviceResult<Command> {
    auto capability = requiredCapability(command);
    if (!descriptor.hasCapability(capability)) {
        return failure<Command>(
            error::unsupported(capabilityToString(capability))
                .withDevice(descriptor.id.str()));
    }

    if (const auto* c = std::get_if<SetBrightness>(&command)) {
        return Command{
            SetBrightness{std::clamp(c->level, kPercentMin, kPercentMax)}};
    }
    if (const auto* c = std::get_if<SetVolume>(&command)) {
        return Command{
            SetVolume{std::clamp(c->level, kPercentMin, kPercentMax)}};
    }
    if (const auto* c = std::get_if<SetColor>(&command)) {
        const auto& rgb = c->color;
        if (!channelInRange(rgb.r) || !channelInRange(rgb.g) ||
            !channelInRange(rgb.b)) {
            return failure<Command>(
                error::invalidArgument(
                    fmt::format("Color channel out of range 0-255: ({}, {}, {})",
                                rgb.r, rgb.g, rgb.b))
                    .withDevice(descriptor.id.str()));
        }
    }
    return command;
}

auto applyCommandToState(DeviceState state, const Command& command)
    -> DeviceState {
    std::visit(Overloaded{
                   [&](const SetPower& c) { state.power = c.on; },
                   [&](const Toggle&) { state.power = !state.power; },
                   [&](const SetBrightness& c) {
                       state.brightness = c.level;
                       state.power = true;
                   },
                   [&](const SetColor& c) {
                       state.color = c.color;
                       state.power = true;
                   },
                   [&](const SetVolume& c) { state.volume = c.level; },
                   [&](const MediaControl& c) {
                       auto info = state.mediaInfo.value_or(MediaInfo{});
                       switch (c.action) {
                           case MediaAction::Play:
                               info.playbackState = PlaybackState::Playing;
                               break;
                           case MediaAction::Pause:
                               info.playbackState = PlaybackState::Paused;
                               break;
                           case MediaAction::Stop:
                               info.playbackState = PlaybackState::Idle;
                               break;
                       }
                       state.mediaInfo = info;
                   },
               },
               command);
    state.reachable = true;
    state.lastUpdated = Clock::now();
    return state;
}

}  // namespace hearth::device
