/*
 * device_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device error codes and structures for unified error handling

**************************************************/

#ifndef HEARTH_DEVICE_COMMON_DEVICE_ERROR_HPP
#define HEARTH_DEVICE_COMMON_DEVICE_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hearth::device {

/**
 * @brief Device error codes for categorizing errors
 *
 * Every adapter, probe and registry call site converts its failures into one
 * of these codes. Nothing else crosses the boundary to subscribers.
 */
enum class DeviceErrorCode {
    Unknown = 0,

    // Transport errors (100-199)
    ConnectionError = 100,
    DeviceUnreachable = 101,

    // Command errors (200-299)
    UnsupportedCapability = 200,
    InvalidArgument = 201,
    Cancelled = 202,
    NotFound = 203,

    // Protocol errors (300-399)
    ProtocolError = 300,

    // Setup errors (400-499)
    ConfigurationError = 400,
    DiscoveryError = 401,

    // Internal errors (900-999)
    InternalError = 900
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto deviceErrorCodeToString(DeviceErrorCode code)
    -> std::string {
    switch (code) {
        case DeviceErrorCode::Unknown:
            return "Unknown";
        case DeviceErrorCode::ConnectionError:
            return "ConnectionError";
        case DeviceErrorCode::DeviceUnreachable:
            return "DeviceUnreachable";
        case DeviceErrorCode::UnsupportedCapability:
            return "UnsupportedCapability";
        case DeviceErrorCode::InvalidArgument:
            return "InvalidArgument";
        case DeviceErrorCode::Cancelled:
            return "Cancelled";
        case DeviceErrorCode::NotFound:
            return "NotFound";
        case DeviceErrorCode::ProtocolError:
            return "ProtocolError";
        case DeviceErrorCode::ConfigurationError:
            return "ConfigurationError";
        case DeviceErrorCode::DiscoveryError:
            return "DiscoveryError";
        case DeviceErrorCode::InternalError:
            return "InternalError";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Check if the registry should retry an operation failing with code
 */
[[nodiscard]] inline auto isRetryable(DeviceErrorCode code) -> bool {
    switch (code) {
        case DeviceErrorCode::DeviceUnreachable:
        case DeviceErrorCode::ProtocolError:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Check if the error means the device could not be talked to
 *
 * Only these errors flip a device's reachable flag.
 */
[[nodiscard]] inline auto isTransportError(DeviceErrorCode code) -> bool {
    switch (code) {
        case DeviceErrorCode::ConnectionError:
        case DeviceErrorCode::DeviceUnreachable:
        case DeviceErrorCode::ProtocolError:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Device error structure with detailed information
 */
struct DeviceError {
    DeviceErrorCode code{DeviceErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceId;
    std::optional<std::string> operationName;
    std::optional<std::string> details;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    DeviceError() = default;

    explicit DeviceError(DeviceErrorCode errorCode,
                         std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    DeviceError(DeviceErrorCode errorCode, std::string errorMessage,
                std::string device)
        : code(errorCode),
          message(std::move(errorMessage)),
          deviceId(std::move(device)) {}

    /**
     * @brief Get formatted error string
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + deviceErrorCodeToString(code) + "] " + message;
        if (deviceId) {
            result += " (device: " + *deviceId + ")";
        }
        if (operationName) {
            result += " (operation: " + *operationName + ")";
        }
        if (details) {
            result += " - " + *details;
        }
        return result;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j;
        j["code"] = static_cast<int>(code);
        j["codeName"] = deviceErrorCodeToString(code);
        j["message"] = message;
        if (deviceId) {
            j["deviceId"] = *deviceId;
        }
        if (operationName) {
            j["operationName"] = *operationName;
        }
        if (details) {
            j["details"] = *details;
        }
        j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
        return j;
    }

    [[nodiscard]] auto isRetryable() const -> bool {
        return hearth::device::isRetryable(code);
    }

    /**
     * @brief Attach device context if not already set
     */
    auto withDevice(const std::string& id) && -> DeviceError {
        if (!deviceId) {
            deviceId = id;
        }
        return std::move(*this);
    }
};

// Convenient factory functions
namespace error {

inline auto connectionError(const std::string& target,
                            const std::string& reason = "") -> DeviceError {
    return DeviceError(
        DeviceErrorCode::ConnectionError,
        "Cannot connect to " + target + (reason.empty() ? "" : ": " + reason));
}

inline auto unreachable(const std::string& target,
                        const std::string& reason = "") -> DeviceError {
    return DeviceError(
        DeviceErrorCode::DeviceUnreachable,
        target + " unreachable" + (reason.empty() ? "" : ": " + reason));
}

inline auto timeout(const std::string& operation) -> DeviceError {
    DeviceError err(DeviceErrorCode::DeviceUnreachable, "Operation timed out");
    err.operationName = operation;
    return err;
}

inline auto unsupported(const std::string& capability) -> DeviceError {
    return DeviceError(DeviceErrorCode::UnsupportedCapability,
                       "Capability not supported: " + capability);
}

inline auto invalidArgument(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InvalidArgument, msg);
}

inline auto protocolError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::ProtocolError, msg);
}

inline auto configurationError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::ConfigurationError, msg);
}

inline auto discoveryError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::DiscoveryError, msg);
}

inline auto notFound(const std::string& what) -> DeviceError {
    return DeviceError(DeviceErrorCode::NotFound, what + " not found");
}

inline auto cancelled(const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::Cancelled, reason);
}

inline auto internalError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InternalError, msg);
}

}  // namespace error

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_COMMON_DEVICE_ERROR_HPP
