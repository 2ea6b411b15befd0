/*
 * device_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Exception types raised inside codecs and configuration loading

**************************************************/

#ifndef HEARTH_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
#define HEARTH_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "device_error.hpp"

namespace hearth::device {

/**
 * @brief Base exception class for all device-related exceptions
 *
 * Exceptions never leave the adapter and config layers; tryExecute turns
 * them back into DeviceResult errors.
 */
class DeviceException : public std::runtime_error {
public:
    explicit DeviceException(const std::string& message,
                             DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    explicit DeviceException(const DeviceError& error)
        : std::runtime_error(error.toString()), error_(error) {}

    [[nodiscard]] auto error() const noexcept -> const DeviceError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> DeviceErrorCode {
        return error_.code;
    }

protected:
    DeviceError error_;
};

/**
 * @brief Malformed or unexpected data on the wire
 */
class ProtocolException : public DeviceException {
public:
    explicit ProtocolException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::ProtocolError) {}
};

/**
 * @brief Missing credentials or unreadable configuration
 */
class ConfigurationException : public DeviceException {
public:
    explicit ConfigurationException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::ConfigurationError) {}
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
