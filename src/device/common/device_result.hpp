/*
 * device_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Result type for device operations using std::expected

**************************************************/

#ifndef HEARTH_DEVICE_COMMON_DEVICE_RESULT_HPP
#define HEARTH_DEVICE_COMMON_DEVICE_RESULT_HPP

#include <expected>
#include <functional>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "device_error.hpp"
#include "device_exceptions.hpp"

namespace hearth::device {

/**
 * @brief Result type for device operations
 *
 * Uses std::expected to represent either a successful value or an error.
 */
template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

/**
 * @brief Result type for operations with no return value
 */
using DeviceVoidResult = DeviceResult<void>;

template <typename T>
[[nodiscard]] inline auto success(T&& value) -> DeviceResult<std::decay_t<T>> {
    return DeviceResult<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline auto success() -> DeviceVoidResult {
    return DeviceVoidResult();
}

template <typename T>
[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceResult<T> {
    return std::unexpected(error);
}

[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceVoidResult {
    return std::unexpected(error);
}

/**
 * @brief Execute a function and convert exceptions to DeviceResult
 *
 * Malformed JSON from a device is reported as ProtocolError, everything else
 * that escapes a library call as InternalError.
 */
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> DeviceResult<std::invoke_result_t<F>> {
    using ReturnType = std::invoke_result_t<F>;
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            std::invoke(std::forward<F>(func));
            return success();
        } else {
            return success(std::invoke(std::forward<F>(func)));
        }
    } catch (const DeviceException& e) {
        return std::unexpected(e.error());
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(
            DeviceError(DeviceErrorCode::ProtocolError, e.what()));
    } catch (const std::exception& e) {
        return std::unexpected(
            DeviceError(DeviceErrorCode::InternalError, e.what()));
    }
}

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_COMMON_DEVICE_RESULT_HPP
