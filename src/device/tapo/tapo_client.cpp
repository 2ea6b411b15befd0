/*
 * tapo_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: KLAP session client and Tapo request helpers

**************************************************/

#include "tapo_client.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "device/adapter/color.hpp"
#include "device/net/http_client.hpp"

namespace hearth::device::tapo {

namespace {

constexpr const char* kSessionCookie = "TP_SESSIONID";

// Device error codes that mean the session is no longer valid
constexpr int kSessionTimeout = 9999;
constexpr int kSessionExpired = -1301;

auto epochMillis() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               Clock::now().time_since_epoch())
        .count();
}

}  // namespace

KlapClient::KlapClient(Endpoint endpoint, std::string authHash,
                       std::chrono::milliseconds timeout, int maxRetries)
    : endpoint_(std::move(endpoint)),
      authHash_(std::move(authHash)),
      timeout_(timeout),
      maxRetries_(std::max(maxRetries, 0)) {}

void KlapClient::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cipher_.reset();
    cookie_.clear();
}

auto KlapClient::handshake() -> DeviceVoidResult {
    auto localSeed = randomBytes(kSeedSize);
    if (!localSeed) {
        return failure(localSeed.error());
    }

    net::HttpRequest first;
    first.target = "/app/handshake1";
    first.body = *localSeed;
    auto reply = net::httpPost(endpoint_, first, timeout_);
    if (!reply) {
        return failure(reply.error());
    }
    if (!reply->ok() || reply->body.size() != kSeedSize + kSignatureSize) {
        return failure(error::protocolError(
            fmt::format("handshake1 failed: HTTP {} with {} bytes",
                        reply->status, reply->body.size())));
    }
    const auto remoteSeed = reply->body.substr(0, kSeedSize);
    const auto serverHash = reply->body.substr(kSeedSize);
    if (serverHash != serverProof(*localSeed, remoteSeed, authHash_)) {
        return failure(error::configurationError(
            "Tapo device at " + endpoint_.host +
            " rejected the configured credentials"));
    }
    std::string cookie;
    if (auto it = reply->cookies.find(kSessionCookie);
        it != reply->cookies.end()) {
        cookie = std::string(kSessionCookie) + "=" + it->second;
    }

    net::HttpRequest second;
    second.target = "/app/handshake2";
    second.body = clientProof(*localSeed, remoteSeed, authHash_);
    if (!cookie.empty()) {
        second.headers["Cookie"] = cookie;
    }
    reply = net::httpPost(endpoint_, second, timeout_);
    if (!reply) {
        return failure(reply.error());
    }
    if (!reply->ok()) {
        return failure(error::protocolError(
            fmt::format("handshake2 failed: HTTP {}", reply->status)));
    }

    cipher_.emplace(*localSeed, remoteSeed, authHash_);
    cookie_ = std::move(cookie);
    spdlog::debug("KlapClient: session established with {}",
                  endpoint_.toString());
    return success();
}

auto KlapClient::send(const std::string& body, bool& sessionExpired)
    -> DeviceResult<json> {
    sessionExpired = false;
    auto encrypted = cipher_->encrypt(body);
    if (!encrypted) {
        return failure<json>(encrypted.error());
    }

    net::HttpRequest request;
    request.target = fmt::format("/app/request?seq={}", encrypted->sequence);
    request.body = std::move(encrypted->payload);
    if (!cookie_.empty()) {
        request.headers["Cookie"] = cookie_;
    }
    auto reply = net::httpPost(endpoint_, request, timeout_);
    if (!reply) {
        return failure<json>(reply.error());
    }
    if (!reply->ok()) {
        sessionExpired = true;
        return failure<json>(error::protocolError(
            fmt::format("request rejected: HTTP {}", reply->status)));
    }

    auto plain = cipher_->decrypt(reply->body, encrypted->sequence);
    if (!plain) {
        return failure<json>(plain.error());
    }
    auto response = json::parse(*plain, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return failure<json>(error::protocolError("malformed Tapo reply"));
    }
    const int code = response.value("error_code", 0);
    if (code == kSessionTimeout || code == kSessionExpired) {
        sessionExpired = true;
    }
    if (code != 0) {
        return failure<json>(
            error::protocolError(fmt::format("Tapo error code {}", code)));
    }
    return response.value("result", json::object());
}

auto KlapClient::call(const std::string& method, const json& params)
    -> DeviceResult<json> {
    json request{{"method", method}, {"request_time_milis", epochMillis()}};
    if (!params.is_null()) {
        request["params"] = params;
    }
    const auto body = request.dump();

    std::lock_guard<std::mutex> lock(mutex_);
    DeviceResult<json> result =
        failure<json>(error::protocolError("Tapo session kept expiring"));
    for (int attempt = 0; attempt <= maxRetries_; ++attempt) {
        if (!cipher_) {
            if (auto established = handshake(); !established) {
                if (established.error().code !=
                        DeviceErrorCode::DeviceUnreachable ||
                    attempt == maxRetries_) {
                    return failure<json>(established.error());
                }
                spdlog::debug("KlapClient: handshake with {} timed out, "
                              "retrying",
                              endpoint_.toString());
                result = failure<json>(established.error());
                continue;
            }
        }
        bool expired = false;
        result = send(body, expired);
        // A session the device may have dropped is not reused either
        const bool unreachable =
            !result &&
            result.error().code == DeviceErrorCode::DeviceUnreachable;
        if (!expired && !unreachable) {
            return result;
        }
        spdlog::debug("KlapClient: session with {} {}, handshaking again",
                      endpoint_.toString(),
                      unreachable ? "unreachable" : "expired");
        cipher_.reset();
        cookie_.clear();
    }
    return result;
}

// ==================== Request helpers ====================

auto buildDeviceInfoParams(const Command& command) -> DeviceResult<json> {
    if (const auto* power = std::get_if<SetPower>(&command)) {
        return json{{"device_on", power->on}};
    }
    if (const auto* brightness = std::get_if<SetBrightness>(&command)) {
        // Bulbs accept 1-100
        return json{{"device_on", true},
                    {"brightness", std::clamp(brightness->level, 1, 100)}};
    }
    if (const auto* color = std::get_if<SetColor>(&command)) {
        const auto hsv = rgbToHsv(color->color);
        return json{
            {"device_on", true},
            {"hue", static_cast<int>(std::lround(hsv.h)) % 360},
            {"saturation", static_cast<int>(std::lround(hsv.s * 100.0))},
            {"color_temp", 0}};
    }
    return failure<json>(error::unsupported(describeCommand(command)));
}

auto stateFromDeviceInfo(const json& info) -> DeviceState {
    DeviceState state;
    state.power = info.value("device_on", false);
    if (info.contains("brightness") && info["brightness"].is_number()) {
        state.brightness = std::clamp(info["brightness"].get<int>(), 0, 100);
    }
    // color_temp 0 means the bulb is in colour mode
    if (info.contains("hue") && info.contains("saturation") &&
        info.value("color_temp", 0) == 0) {
        state.color = hsvToRgb(Hsv{info.value("hue", 0.0),
                                   info.value("saturation", 0.0) / 100.0,
                                   1.0});
    }
    state.reachable = true;
    state.lastUpdated = Clock::now();
    return state;
}

auto descriptorFromDeviceInfo(const json& info, const Endpoint& endpoint)
    -> DeviceResult<DeviceDescriptor> {
    const auto deviceId = info.value("device_id", "");
    if (deviceId.empty()) {
        return failure<DeviceDescriptor>(
            error::protocolError("get_device_info without device_id"));
    }

    std::string name;
    if (auto decoded = base64Decode(info.value("nickname", ""));
        decoded && !decoded->empty()) {
        name = *decoded;
    } else {
        auto pos = endpoint.host.rfind('.');
        name = "Tapo " + (pos == std::string::npos
                              ? endpoint.host
                              : endpoint.host.substr(pos + 1));
    }

    DeviceDescriptor descriptor;
    descriptor.id = DeviceId::make(Protocol::Tapo, deviceId);
    descriptor.displayName = std::move(name);
    descriptor.kind = DeviceKind::Light;
    descriptor.protocol = Protocol::Tapo;
    descriptor.capabilities = {CapabilityTag::Power, CapabilityTag::Brightness};
    if (info.contains("hue")) {
        descriptor.capabilities.insert(CapabilityTag::Color);
    }
    descriptor.address = endpoint;
    descriptor.lastSeen = Clock::now();
    descriptor.model = info.value("model", "Tapo Light");
    descriptor.manufacturer = "TP-Link";
    return descriptor;
}

}  // namespace hearth::device::tapo
