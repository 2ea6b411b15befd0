/*
 * io_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Run an asio coroutine to completion with a deadline

**************************************************/

#ifndef HEARTH_DEVICE_NET_IO_RUNNER_HPP
#define HEARTH_DEVICE_NET_IO_RUNNER_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include "device/common/device_result.hpp"

namespace hearth::device::net {

namespace detail {

template <typename T>
auto completionInto(std::shared_ptr<std::optional<DeviceResult<T>>> outcome,
                    std::string what) {
    return [outcome = std::move(outcome), what = std::move(what)](
               std::exception_ptr ep, DeviceResult<T> result) {
        if (!ep) {
            *outcome = std::move(result);
            return;
        }
        try {
            std::rethrow_exception(ep);
        } catch (const boost::system::system_error& e) {
            *outcome = failure<T>(error::unreachable(what, e.what()));
        } catch (const DeviceException& e) {
            *outcome = failure<T>(e.error());
        } catch (const std::exception& e) {
            *outcome = failure<T>(error::protocolError(what + ": " + e.what()));
        }
    };
}

template <typename T>
auto timedOut(const std::string& what, std::chrono::milliseconds deadline)
    -> DeviceResult<T> {
    auto err = error::timeout(what);
    err.details =
        "no answer within " + std::to_string(deadline.count()) + " ms";
    return failure<T>(err);
}

}  // namespace detail

/**
 * @brief Drive a coroutine on a private io_context until it finishes
 *
 * Adapters expose blocking calls that run on worker threads. Each call gets
 * its own io_context; when the deadline passes, the context is destroyed
 * together with the suspended coroutine and its sockets, and the call fails
 * with DeviceUnreachable. The coroutine obtains its executor through
 * boost::asio::this_coro::executor.
 */
template <typename T>
[[nodiscard]] auto runWithDeadline(
    boost::asio::awaitable<DeviceResult<T>> operation,
    std::chrono::milliseconds deadline, const std::string& what)
    -> DeviceResult<T> {
    auto outcome = std::make_shared<std::optional<DeviceResult<T>>>();
    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc, std::move(operation),
                          detail::completionInto<T>(outcome, what));
    ioc.run_for(deadline);
    if (!*outcome) {
        return detail::timedOut<T>(what, deadline);
    }
    return std::move(**outcome);
}

/**
 * @brief Drive a coroutine on a long-lived io_context with a deadline
 *
 * On timeout, cancel() must abort the outstanding operations (usually by
 * closing the socket); the context is then drained so the coroutine unwinds
 * before the caller touches the socket again.
 */
template <typename T>
[[nodiscard]] auto runOn(boost::asio::io_context& ioc,
                         boost::asio::awaitable<DeviceResult<T>> operation,
                         std::chrono::milliseconds deadline,
                         const std::string& what,
                         const std::function<void()>& cancel)
    -> DeviceResult<T> {
    auto outcome = std::make_shared<std::optional<DeviceResult<T>>>();
    boost::asio::co_spawn(ioc, std::move(operation),
                          detail::completionInto<T>(outcome, what));
    ioc.restart();
    ioc.run_for(deadline);
    if (!*outcome) {
        cancel();
        ioc.restart();
        ioc.run();
        return detail::timedOut<T>(what, deadline);
    }
    return std::move(**outcome);
}

}  // namespace hearth::device::net

#endif  // HEARTH_DEVICE_NET_IO_RUNNER_HPP
