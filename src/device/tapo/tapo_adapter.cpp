/*
 * tapo_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tapo light adapter and discovery probe

**************************************************/

#include "tapo_adapter.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace hearth::device::tapo {

namespace {

class TapoSession : public DeviceSession {
public:
    TapoSession(DeviceDescriptor descriptor,
                std::shared_ptr<KlapClient> client)
        : DeviceSession(std::move(descriptor)), client_(std::move(client)) {}

    auto client() -> KlapClient& { return *client_; }

private:
    std::shared_ptr<KlapClient> client_;
};

auto missingCredentials() -> DeviceError {
    return error::configurationError("Tapo username and password are not set");
}

}  // namespace

// ==================== TapoAdapter ====================

TapoAdapter::TapoAdapter(std::shared_ptr<config::ConfigProvider> config,
                         std::chrono::milliseconds timeout)
    : config_(std::move(config)), timeout_(timeout) {}

auto TapoAdapter::clientFor(const Endpoint& endpoint)
    -> DeviceResult<std::shared_ptr<KlapClient>> {
    const auto config = config_->current();
    if (!config->tapo.hasCredentials()) {
        return failure<std::shared_ptr<KlapClient>>(missingCredentials());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& client = clients_[endpoint.toString()];
    if (!client) {
        client = std::make_shared<KlapClient>(
            endpoint, authHash(config->tapo.username, config->tapo.password),
            timeout_, config->registry.retry.maxRetries);
    }
    return client;
}

auto TapoAdapter::connect(const DeviceDescriptor& descriptor)
    -> DeviceResult<std::unique_ptr<DeviceSession>> {
    using SessionResult = DeviceResult<std::unique_ptr<DeviceSession>>;
    Endpoint endpoint = descriptor.address;
    if (endpoint.host.empty()) {
        return SessionResult(std::unexpect,
                             error::connectionError(descriptor.id.str(),
                                                    "no address known"));
    }
    if (endpoint.port == 0) {
        endpoint.port =
            static_cast<std::uint16_t>(config_->current()->tapo.port);
    }
    auto client = clientFor(endpoint);
    if (!client) {
        return SessionResult(std::unexpect, client.error());
    }
    return std::make_unique<TapoSession>(descriptor, std::move(*client));
}

auto TapoAdapter::applyCommand(DeviceSession& session, const Command& command)
    -> DeviceVoidResult {
    auto params = buildDeviceInfoParams(command);
    if (!params) {
        return failure(params.error());
    }
    auto result =
        static_cast<TapoSession&>(session).client().call("set_device_info",
                                                         *params);
    if (!result) {
        return failure(result.error());
    }
    spdlog::debug("TapoAdapter: {} {} ok", session.descriptor().id.str(),
                  describeCommand(command));
    return success();
}

auto TapoAdapter::fetchState(DeviceSession& session)
    -> DeviceResult<DeviceState> {
    auto info =
        static_cast<TapoSession&>(session).client().call("get_device_info");
    if (!info) {
        return failure<DeviceState>(info.error());
    }
    return stateFromDeviceInfo(*info);
}

void TapoAdapter::close(DeviceSession& /*session*/) {}

void TapoAdapter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("TapoAdapter: dropping {} cached session(s)",
                  clients_.size());
    clients_.clear();
}

// ==================== TapoProbe ====================

TapoProbe::TapoProbe(std::shared_ptr<config::ConfigProvider> config,
                     std::chrono::milliseconds queryTimeout)
    : config_(std::move(config)), queryTimeout_(queryTimeout) {}

auto TapoProbe::scan(std::chrono::milliseconds window,
                     const SightingCallback& onSighting) -> DeviceVoidResult {
    const auto config = config_->current();
    if (config->tapo.hosts.empty()) {
        return success();
    }
    if (!config->tapo.hasCredentials()) {
        return failure(missingCredentials());
    }

    const auto hash = authHash(config->tapo.username, config->tapo.password);
    // Tapo has no broadcast; each configured host gets at most the window
    const auto timeout = std::min(queryTimeout_, window);
    std::size_t found = 0;
    std::optional<DeviceError> rejected;
    for (const auto& host : config->tapo.hosts) {
        Endpoint endpoint{host, static_cast<std::uint16_t>(config->tapo.port)};
        KlapClient client(endpoint, hash, timeout, 0);
        auto info = client.call("get_device_info");
        if (!info) {
            if (info.error().code == DeviceErrorCode::ConfigurationError) {
                rejected = info.error();
            }
            spdlog::debug("TapoProbe: {} did not answer: {}", host,
                          info.error().message);
            continue;
        }
        auto descriptor = descriptorFromDeviceInfo(*info, endpoint);
        if (!descriptor) {
            spdlog::warn("TapoProbe: {}: {}", host,
                         descriptor.error().message);
            continue;
        }
        ++found;
        onSighting(*descriptor);
    }
    spdlog::debug("TapoProbe: {} of {} host(s) answered", found,
                  config->tapo.hosts.size());
    if (found == 0 && rejected) {
        return failure(*rejected);
    }
    return success();
}

}  // namespace hearth::device::tapo
