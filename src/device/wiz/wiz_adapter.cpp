/*
 * wiz_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: WiZ light adapter and discovery probe

**************************************************/

#include "wiz_adapter.hpp"

#include <map>

#include <spdlog/spdlog.h>

#include "device/net/udp_client.hpp"
#include "wiz_protocol.hpp"

namespace hearth::device::wiz {

namespace {

class WizSession : public DeviceSession {
public:
    WizSession(DeviceDescriptor descriptor, Endpoint endpoint)
        : DeviceSession(std::move(descriptor)),
          endpoint_(std::move(endpoint)) {}

    [[nodiscard]] auto endpoint() const -> const Endpoint& {
        return endpoint_;
    }

private:
    Endpoint endpoint_;
};

auto exchange(const Endpoint& endpoint, const std::string& message,
              std::chrono::milliseconds timeout) -> DeviceResult<json> {
    spdlog::trace("WizAdapter: -> {} {}", endpoint.toString(), message);
    auto reply = net::udpRequest(endpoint, message, timeout);
    if (!reply) {
        return failure<json>(reply.error());
    }
    spdlog::trace("WizAdapter: <- {} {}", endpoint.toString(), *reply);
    return parseReply(*reply);
}

auto lastOctet(const std::string& host) -> std::string {
    auto pos = host.rfind('.');
    return pos == std::string::npos ? host : host.substr(pos + 1);
}

}  // namespace

// ==================== WizAdapter ====================

WizAdapter::WizAdapter(std::shared_ptr<config::ConfigProvider> config,
                       std::chrono::milliseconds timeout)
    : config_(std::move(config)), timeout_(timeout) {}

auto WizAdapter::connect(const DeviceDescriptor& descriptor)
    -> DeviceResult<std::unique_ptr<DeviceSession>> {
    Endpoint endpoint = descriptor.address;
    if (endpoint.host.empty()) {
        return failure<std::unique_ptr<DeviceSession>>(
            error::connectionError(descriptor.id.str(), "no address known"));
    }
    if (endpoint.port == 0) {
        endpoint.port = static_cast<std::uint16_t>(config_->current()->wiz.port);
    }
    return std::make_unique<WizSession>(descriptor, std::move(endpoint));
}

auto WizAdapter::applyCommand(DeviceSession& session, const Command& command)
    -> DeviceVoidResult {
    auto& wizSession = static_cast<WizSession&>(session);
    auto message = buildSetPilot(command);
    if (!message) {
        return failure(message.error());
    }
    auto result = exchange(wizSession.endpoint(), *message, timeout_);
    if (!result) {
        return failure(result.error());
    }
    spdlog::debug("WizAdapter: {} {} ok", session.descriptor().id.str(),
                  describeCommand(command));
    return success();
}

auto WizAdapter::fetchState(DeviceSession& session)
    -> DeviceResult<DeviceState> {
    auto& wizSession = static_cast<WizSession&>(session);
    auto result = exchange(wizSession.endpoint(), buildGetPilot(), timeout_);
    if (!result) {
        return failure<DeviceState>(result.error());
    }
    return parsePilot(*result);
}

void WizAdapter::close(DeviceSession& /*session*/) {}

// ==================== WizProbe ====================

WizProbe::WizProbe(std::shared_ptr<config::ConfigProvider> config,
                   std::chrono::milliseconds queryTimeout)
    : config_(std::move(config)), queryTimeout_(queryTimeout) {}

auto WizProbe::describe(const Endpoint& endpoint) const
    -> DeviceResult<DeviceDescriptor> {
    auto result = exchange(endpoint, buildGetSystemConfig(), queryTimeout_);
    if (!result) {
        return failure<DeviceDescriptor>(result.error());
    }
    auto mac = normalizeMac(result->value("mac", ""));
    if (mac.empty()) {
        return failure<DeviceDescriptor>(
            error::protocolError("getSystemConfig reply without mac"));
    }
    auto moduleName = result->value("moduleName", "");

    DeviceDescriptor descriptor;
    descriptor.id = DeviceId::make(Protocol::WiZ, mac);
    descriptor.displayName = moduleName.empty()
                                 ? "WiZ " + lastOctet(endpoint.host)
                                 : "WiZ " + moduleName;
    descriptor.kind = DeviceKind::Light;
    descriptor.protocol = Protocol::WiZ;
    descriptor.capabilities = capabilitiesForModule(moduleName);
    descriptor.address = endpoint;
    descriptor.lastSeen = Clock::now();
    descriptor.model = moduleName.empty() ? "WiZ Light" : moduleName;
    descriptor.manufacturer = "WiZ";
    return descriptor;
}

auto WizProbe::scan(std::chrono::milliseconds window,
                    const SightingCallback& onSighting) -> DeviceVoidResult {
    auto config = config_->current();
    const auto port = static_cast<std::uint16_t>(config->wiz.port);

    // host -> mac from the registration reply
    std::map<std::string, std::string> responders;
    net::CollectOptions options;
    options.window = window;
    options.broadcast = true;
    auto collected = net::udpCollect(
        Endpoint{config->discovery.broadcastAddress, port}, buildRegistration(),
        options, [&](const net::Datagram& datagram) {
            auto result = parseReply(datagram.payload);
            if (!result) {
                spdlog::debug("WizProbe: ignoring reply from {}: {}",
                              datagram.senderHost, result.error().message);
                return;
            }
            responders.emplace(datagram.senderHost,
                               normalizeMac(result->value("mac", "")));
        });
    if (!collected) {
        spdlog::warn("WizProbe: broadcast failed: {}",
                     collected.error().toString());
    }

    for (const auto& host : config->wiz.hosts) {
        responders.emplace(host, std::string{});
    }

    std::size_t found = 0;
    for (const auto& [host, mac] : responders) {
        Endpoint endpoint{host, port};
        auto descriptor = describe(endpoint);
        if (!descriptor) {
            if (mac.empty()) {
                spdlog::debug("WizProbe: {} did not answer: {}", host,
                              descriptor.error().message);
                continue;
            }
            // Answered the broadcast but not the follow-up query
            DeviceDescriptor fallback;
            fallback.id = DeviceId::make(Protocol::WiZ, mac);
            fallback.displayName = "WiZ " + lastOctet(host);
            fallback.kind = DeviceKind::Light;
            fallback.protocol = Protocol::WiZ;
            fallback.capabilities = capabilitiesForModule("");
            fallback.address = endpoint;
            fallback.lastSeen = Clock::now();
            fallback.model = "WiZ Light";
            fallback.manufacturer = "WiZ";
            descriptor = std::move(fallback);
        }
        ++found;
        onSighting(*descriptor);
    }

    if (!collected && config->wiz.hosts.empty()) {
        return failure(error::discoveryError(collected.error().message));
    }
    spdlog::debug("WizProbe: {} bulb(s) answered", found);
    return success();
}

}  // namespace hearth::device::wiz
