/*
 * wiz_protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: WiZ bulb UDP JSON messages

**************************************************/

#include "wiz_protocol.hpp"

#include <algorithm>
#include <cctype>

namespace hearth::device::wiz {

namespace {

auto request(const char* method, json params = json::object()) -> std::string {
    json message{{"method", method}, {"params", std::move(params)}};
    return message.dump();
}

}  // namespace

auto buildGetPilot() -> std::string {
    return request("getPilot");
}

auto buildGetSystemConfig() -> std::string {
    return request("getSystemConfig");
}

auto buildRegistration() -> std::string {
    return request("registration", {{"phoneMac", "AAAAAAAAAAAA"},
                                    {"register", false},
                                    {"phoneIp", "1.2.3.4"},
                                    {"id", "1"}});
}

auto buildSetPilot(const Command& command) -> DeviceResult<std::string> {
    json params;
    if (const auto* power = std::get_if<SetPower>(&command)) {
        params["state"] = power->on;
    } else if (const auto* brightness = std::get_if<SetBrightness>(&command)) {
        params["state"] = true;
        params["dimming"] = levelToDimming(brightness->level);
    } else if (const auto* color = std::get_if<SetColor>(&command)) {
        params["state"] = true;
        params["r"] = color->color.r;
        params["g"] = color->color.g;
        params["b"] = color->color.b;
    } else {
        return failure<std::string>(
            error::unsupported(describeCommand(command)));
    }
    return request("setPilot", std::move(params));
}

auto parseReply(std::string_view payload) -> DeviceResult<json> {
    auto reply = json::parse(payload, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return failure<json>(error::protocolError("malformed WiZ reply"));
    }
    if (auto it = reply.find("error"); it != reply.end()) {
        std::string message = "WiZ error";
        if (it->is_object()) {
            message = it->value("message", message);
            if (it->contains("code")) {
                message += " (" + it->at("code").dump() + ")";
            }
        }
        return failure<json>(error::protocolError(message));
    }
    auto it = reply.find("result");
    if (it == reply.end() || !it->is_object()) {
        return failure<json>(error::protocolError("WiZ reply has no result"));
    }
    if (it->contains("success") && !it->value("success", false)) {
        return failure<json>(error::protocolError("WiZ bulb refused request"));
    }
    return *it;
}

auto parsePilot(const json& result) -> DeviceState {
    DeviceState state;
    state.power = result.value("state", false);
    if (result.contains("dimming") && result["dimming"].is_number()) {
        state.brightness = dimmingToLevel(result["dimming"].get<int>());
    }
    if (result.contains("r") && result.contains("g") && result.contains("b")) {
        state.color = Rgb{result.value("r", 0), result.value("g", 0),
                          result.value("b", 0)};
    }
    state.reachable = true;
    state.lastUpdated = Clock::now();
    return state;
}

auto levelToDimming(int level) -> int {
    level = std::clamp(level, 0, 100);
    return kMinDimming + (level * (kMaxDimming - kMinDimming) + 50) / 100;
}

auto dimmingToLevel(int dimming) -> int {
    dimming = std::clamp(dimming, kMinDimming, kMaxDimming);
    return ((dimming - kMinDimming) * 100 + (kMaxDimming - kMinDimming) / 2) /
           (kMaxDimming - kMinDimming);
}

auto capabilitiesForModule(const std::string& moduleName) -> CapabilitySet {
    CapabilitySet caps{CapabilityTag::Power, CapabilityTag::Brightness,
                       CapabilityTag::Color};
    std::string upper = moduleName;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (upper.find("DW") != std::string::npos &&
        upper.find("RGB") == std::string::npos) {
        caps.erase(CapabilityTag::Color);
    }
    return caps;
}

auto normalizeMac(std::string_view mac) -> std::string {
    std::string out;
    out.reserve(mac.size());
    for (unsigned char c : mac) {
        if (std::isxdigit(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

}  // namespace hearth::device::wiz
