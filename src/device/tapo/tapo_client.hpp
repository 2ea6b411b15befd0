/*
 * tapo_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: KLAP session client and Tapo request helpers

**************************************************/

#ifndef HEARTH_DEVICE_TAPO_TAPO_CLIENT_HPP
#define HEARTH_DEVICE_TAPO_TAPO_CLIENT_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "device/common/device_result.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"
#include "klap_cipher.hpp"

namespace hearth::device::tapo {

/**
 * @brief Encrypted request/response channel to one Tapo device
 *
 * The handshake runs lazily on the first call. When the device reports an
 * expired session, or stops answering, the client drops the session,
 * handshakes again and repeats the request, at most maxRetries times.
 */
class KlapClient {
public:
    KlapClient(Endpoint endpoint, std::string authHash,
               std::chrono::milliseconds timeout, int maxRetries);

    /**
     * @brief Invoke a device method
     * @return The "result" object, ConfigurationError if the device rejects
     *         the credentials
     */
    auto call(const std::string& method, const json& params = nullptr)
        -> DeviceResult<json>;

    /**
     * @brief Forget the session so the next call handshakes again
     */
    void invalidate();

    [[nodiscard]] auto endpoint() const -> const Endpoint& {
        return endpoint_;
    }

private:
    auto handshake() -> DeviceVoidResult;
    auto send(const std::string& body, bool& sessionExpired)
        -> DeviceResult<json>;

    Endpoint endpoint_;
    std::string authHash_;
    std::chrono::milliseconds timeout_;
    int maxRetries_;

    std::mutex mutex_;
    std::optional<KlapCipher> cipher_;
    std::string cookie_;
};

/**
 * @brief set_device_info parameters for a light command
 */
[[nodiscard]] auto buildDeviceInfoParams(const Command& command)
    -> DeviceResult<json>;

[[nodiscard]] auto stateFromDeviceInfo(const json& info) -> DeviceState;

/**
 * @brief Descriptor for the device that answered get_device_info at host
 * @return ProtocolError if the reply carries no device_id
 */
[[nodiscard]] auto descriptorFromDeviceInfo(const json& info,
                                            const Endpoint& endpoint)
    -> DeviceResult<DeviceDescriptor>;

}  // namespace hearth::device::tapo

#endif  // HEARTH_DEVICE_TAPO_TAPO_CLIENT_HPP
