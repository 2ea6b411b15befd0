/*
 * tuya_adapter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tuya 3.3 light adapter and discovery probe

**************************************************/

#include "tuya_adapter.hpp"

#include <map>
#include <mutex>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "device/net/tcp_stream.hpp"
#include "device/net/udp_client.hpp"
#include "tuya_protocol.hpp"

namespace hearth::device::tuya {

namespace {

// Devices may push status frames before the reply we wait for
constexpr int kMaxFramesPerReply = 4;

auto unixSeconds() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               Clock::now().time_since_epoch())
        .count();
}

auto lastOctet(const std::string& host) -> std::string {
    auto pos = host.rfind('.');
    return pos == std::string::npos ? host : host.substr(pos + 1);
}

/**
 * @brief One TCP connection to a device with its key and sequence counter
 */
class TuyaConnection {
public:
    TuyaConnection(std::unique_ptr<net::TcpStream> stream,
                   std::string deviceId, std::string localKey)
        : stream_(std::move(stream)),
          deviceId_(std::move(deviceId)),
          localKey_(std::move(localKey)) {}

    static auto open(const Endpoint& endpoint, std::string deviceId,
                     std::string localKey, std::chrono::milliseconds timeout)
        -> DeviceResult<std::unique_ptr<TuyaConnection>> {
        auto stream = net::TcpStream::connect(endpoint, timeout);
        if (!stream) {
            return failure<std::unique_ptr<TuyaConnection>>(stream.error());
        }
        return std::make_unique<TuyaConnection>(
            std::move(*stream), std::move(deviceId), std::move(localKey));
    }

    auto request(CommandType command, const json& body) -> DeviceResult<json> {
        auto frame = encodeRequest(sequence_++, command, body, localKey_);
        if (!frame) {
            return failure<json>(frame.error());
        }
        if (auto written = stream_->write(*frame); !written) {
            return failure<json>(written.error());
        }

        for (int i = 0; i < kMaxFramesPerReply; ++i) {
            auto reply = readFrame();
            if (!reply) {
                return failure<json>(reply.error());
            }
            if (reply->command != static_cast<std::uint32_t>(command)) {
                spdlog::trace("TuyaAdapter: {} skipping frame cmd={:#x}",
                              deviceId_, reply->command);
                continue;
            }
            if (reply->returnCode.value_or(0) != 0) {
                return failure<json>(error::protocolError(fmt::format(
                    "device returned code {}", *reply->returnCode)));
            }
            return decodePayload(reply->payload, localKey_);
        }
        return failure<json>(
            error::protocolError("no reply to Tuya request"));
    }

    auto queryDps() -> DeviceResult<json> {
        auto reply = request(CommandType::DpQuery,
                             buildDpQuery(deviceId_, unixSeconds()));
        if (!reply) {
            return reply;
        }
        if (!reply->is_object() || !reply->contains("dps") ||
            !(*reply)["dps"].is_object()) {
            return failure<json>(
                error::protocolError("Tuya status without dps"));
        }
        return (*reply)["dps"];
    }

    auto control(json dps) -> DeviceVoidResult {
        auto reply = request(CommandType::Control,
                             buildControl(deviceId_, std::move(dps),
                                          unixSeconds()));
        if (!reply) {
            return failure(reply.error());
        }
        return success();
    }

    void close() { stream_->close(); }

private:
    auto readFrame() -> DeviceResult<Frame> {
        auto header = stream_->readExactly(kHeaderSize);
        if (!header) {
            return failure<Frame>(header.error());
        }
        auto length = remainingLength(*header);
        if (!length) {
            return failure<Frame>(length.error());
        }
        auto rest = stream_->readExactly(*length);
        if (!rest) {
            return failure<Frame>(rest.error());
        }
        return decodeFrame(*header + *rest, true);
    }

    std::unique_ptr<net::TcpStream> stream_;
    std::string deviceId_;
    std::string localKey_;
    std::uint32_t sequence_ = 1;
};

class TuyaSession : public DeviceSession {
public:
    TuyaSession(DeviceDescriptor descriptor,
                std::unique_ptr<TuyaConnection> connection)
        : DeviceSession(std::move(descriptor)),
          connection_(std::move(connection)) {}

    auto connection() -> TuyaConnection& { return *connection_; }

private:
    std::unique_ptr<TuyaConnection> connection_;
};

auto checkDeviceConfig(const config::TuyaDeviceConfig* device,
                       const std::string& vendorId) -> DeviceVoidResult {
    if (device == nullptr || device->key.empty()) {
        return failure(error::configurationError(
            "no local key configured for Tuya device " + vendorId));
    }
    if (device->version != kVersion) {
        return failure(error::configurationError(
            fmt::format("Tuya protocol version {} is not supported for {}",
                        device->version, vendorId)));
    }
    return success();
}

auto makeDescriptor(const std::string& vendorId, const std::string& host,
                    const config::TuyaDeviceConfig* device,
                    const std::string& productKey) -> DeviceDescriptor {
    DeviceDescriptor descriptor;
    descriptor.id = DeviceId::make(Protocol::Tuya, vendorId);
    descriptor.displayName = device != nullptr && !device->name.empty()
                                 ? device->name
                                 : "Tuya " + lastOctet(host);
    descriptor.kind = DeviceKind::Light;
    descriptor.protocol = Protocol::Tuya;
    descriptor.capabilities = {CapabilityTag::Power, CapabilityTag::Brightness,
                               CapabilityTag::Color};
    descriptor.address = Endpoint{host, kDefaultPort};
    descriptor.lastSeen = Clock::now();
    descriptor.model = productKey.empty() ? "Tuya Light" : productKey;
    descriptor.manufacturer = "Tuya";
    return descriptor;
}

}  // namespace

// ==================== TuyaAdapter ====================

TuyaAdapter::TuyaAdapter(std::shared_ptr<config::ConfigProvider> config,
                         std::chrono::milliseconds timeout)
    : config_(std::move(config)), timeout_(timeout) {}

auto TuyaAdapter::connect(const DeviceDescriptor& descriptor)
    -> DeviceResult<std::unique_ptr<DeviceSession>> {
    using SessionResult = DeviceResult<std::unique_ptr<DeviceSession>>;
    const auto config = config_->current();
    const std::string vendorId(descriptor.id.vendorId());
    const auto* device = config->tuya.find(vendorId);
    if (auto valid = checkDeviceConfig(device, vendorId); !valid) {
        return SessionResult(std::unexpect, valid.error());
    }

    Endpoint endpoint = descriptor.address;
    if (endpoint.host.empty()) {
        endpoint.host = device->ip;
    }
    if (endpoint.host.empty()) {
        return SessionResult(std::unexpect,
                             error::connectionError(vendorId, "no address"));
    }
    endpoint.port = static_cast<std::uint16_t>(config->tuya.port);

    auto connection =
        TuyaConnection::open(endpoint, vendorId, device->key, timeout_);
    if (!connection) {
        return SessionResult(std::unexpect, connection.error());
    }
    spdlog::debug("TuyaAdapter: connected to {} at {}", vendorId,
                  endpoint.toString());
    return std::make_unique<TuyaSession>(descriptor, std::move(*connection));
}

auto TuyaAdapter::applyCommand(DeviceSession& session, const Command& command)
    -> DeviceVoidResult {
    auto dps = dpsForCommand(command);
    if (!dps) {
        return failure(dps.error());
    }
    spdlog::debug("TuyaAdapter: {} dps {}", session.descriptor().id.str(),
                  dps->dump());
    return static_cast<TuyaSession&>(session).connection().control(
        std::move(*dps));
}

auto TuyaAdapter::fetchState(DeviceSession& session)
    -> DeviceResult<DeviceState> {
    auto dps = static_cast<TuyaSession&>(session).connection().queryDps();
    if (!dps) {
        return failure<DeviceState>(dps.error());
    }
    return stateFromDps(*dps);
}

void TuyaAdapter::close(DeviceSession& session) {
    static_cast<TuyaSession&>(session).connection().close();
}

// ==================== TuyaProbe ====================

TuyaProbe::TuyaProbe(std::shared_ptr<config::ConfigProvider> config,
                     std::chrono::milliseconds queryTimeout)
    : config_(std::move(config)), queryTimeout_(queryTimeout) {}

auto TuyaProbe::scan(std::chrono::milliseconds window,
                     const SightingCallback& onSighting) -> DeviceVoidResult {
    const auto config = config_->current();

    struct Announcement {
        std::string ip;
        std::string productKey;
    };
    std::mutex mutex;
    std::map<std::string, Announcement> announced;
    int listenFailures = 0;

    if (config->tuya.scanBroadcast) {
        auto listen = [&](std::uint16_t port, bool encrypted) {
            auto result = net::udpListen(
                port, window, [&](const net::Datagram& datagram) {
                    auto message = parseBroadcast(datagram.payload, encrypted);
                    if (!message) {
                        spdlog::trace("TuyaProbe: bad datagram from {}: {}",
                                      datagram.senderHost,
                                      message.error().message);
                        return;
                    }
                    std::lock_guard<std::mutex> lock(mutex);
                    announced[message->value("gwId", "")] = Announcement{
                        message->value("ip", datagram.senderHost),
                        message->value("productKey", "")};
                });
            if (!result) {
                spdlog::warn("TuyaProbe: cannot listen on {}: {}", port,
                             result.error().message);
                std::lock_guard<std::mutex> lock(mutex);
                ++listenFailures;
            }
        };
        std::thread plain(listen, kBroadcastPort, false);
        listen(kEncryptedBroadcastPort, true);
        plain.join();
    }
    announced.erase("");

    std::size_t found = 0;
    for (const auto& [gwId, announcement] : announced) {
        ++found;
        onSighting(makeDescriptor(gwId, announcement.ip,
                                  config->tuya.find(gwId),
                                  announcement.productKey));
    }

    // Configured devices that stayed silent are checked directly
    for (const auto& device : config->tuya.devices) {
        if (device.ip.empty() || announced.contains(device.id)) {
            continue;
        }
        if (!checkDeviceConfig(&device, device.id)) {
            spdlog::debug("TuyaProbe: skipping {}, incomplete configuration",
                          device.id);
            continue;
        }
        Endpoint endpoint{device.ip,
                          static_cast<std::uint16_t>(config->tuya.port)};
        auto connection = TuyaConnection::open(endpoint, device.id, device.key,
                                               queryTimeout_);
        if (!connection) {
            spdlog::debug("TuyaProbe: {} at {} unreachable", device.id,
                          device.ip);
            continue;
        }
        auto dps = (*connection)->queryDps();
        (*connection)->close();
        if (!dps) {
            spdlog::debug("TuyaProbe: {} did not answer: {}", device.id,
                          dps.error().message);
            continue;
        }
        ++found;
        onSighting(makeDescriptor(device.id, device.ip, &device, ""));
    }

    if (config->tuya.scanBroadcast && listenFailures == 2 &&
        config->tuya.devices.empty()) {
        return failure(
            error::discoveryError("cannot listen for Tuya announcements"));
    }
    spdlog::debug("TuyaProbe: {} device(s) found", found);
    return success();
}

}  // namespace hearth::device::tuya
