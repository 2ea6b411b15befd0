/*
 * device_adapter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Abstract vendor protocol adapter interface

**************************************************/

#ifndef HEARTH_DEVICE_ADAPTER_DEVICE_ADAPTER_HPP
#define HEARTH_DEVICE_ADAPTER_DEVICE_ADAPTER_HPP

#include <functional>
#include <memory>
#include <utility>

#include "device/common/device_result.hpp"
#include "device/model/command.hpp"
#include "device/model/device_types.hpp"

namespace hearth::device {

/**
 * @brief Adapter-held connection state for one device
 *
 * Obtained from DeviceAdapter::connect and handed back to close. Concrete
 * adapters derive from this and downcast their own sessions.
 */
class DeviceSession {
public:
    explicit DeviceSession(DeviceDescriptor descriptor)
        : descriptor_(std::move(descriptor)) {}
    virtual ~DeviceSession() = default;

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    [[nodiscard]] auto descriptor() const -> const DeviceDescriptor& {
        return descriptor_;
    }

private:
    DeviceDescriptor descriptor_;
};

/**
 * @brief Receiver for state pushed by the device
 */
struct PushSink {
    std::function<void(const DeviceState&)> onState;
    // Called once when the push channel drops; no onState follows
    std::function<void(const DeviceError&)> onClosed;
};

/**
 * @brief Keeps a push channel open; closing happens on destruction
 */
class PushSubscription {
public:
    PushSubscription() = default;
    explicit PushSubscription(std::function<void()> stop)
        : stop_(std::move(stop)) {}
    ~PushSubscription() { reset(); }

    PushSubscription(PushSubscription&& other) noexcept
        : stop_(std::exchange(other.stop_, nullptr)) {}
    PushSubscription& operator=(PushSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            stop_ = std::exchange(other.stop_, nullptr);
        }
        return *this;
    }

    PushSubscription(const PushSubscription&) = delete;
    PushSubscription& operator=(const PushSubscription&) = delete;

    [[nodiscard]] auto active() const -> bool { return stop_ != nullptr; }

    void reset() {
        if (auto stop = std::exchange(stop_, nullptr)) {
            stop();
        }
    }

private:
    std::function<void()> stop_;
};

/**
 * @brief Abstract vendor protocol adapter
 *
 * One instance serves every device of its protocol family. All methods may
 * block on network I/O and are called from worker threads only; every call
 * is bounded by the adapter's timeout and reports a timeout as
 * DeviceUnreachable.
 */
class DeviceAdapter {
public:
    virtual ~DeviceAdapter() = default;

    [[nodiscard]] virtual auto protocol() const -> Protocol = 0;

    /**
     * @brief Open a session for a device
     * @return Session, ConnectionError if the transport cannot be
     *         established, ConfigurationError if credentials are missing
     */
    virtual auto connect(const DeviceDescriptor& descriptor)
        -> DeviceResult<std::unique_ptr<DeviceSession>> = 0;

    /**
     * @brief Execute a validated command
     * @return UnsupportedCapability, DeviceUnreachable or ProtocolError on
     *         failure
     */
    virtual auto applyCommand(DeviceSession& session, const Command& command)
        -> DeviceVoidResult = 0;

    /**
     * @brief Read the current device state
     */
    virtual auto fetchState(DeviceSession& session)
        -> DeviceResult<DeviceState> = 0;

    virtual void close(DeviceSession& session) = 0;

    /**
     * @brief Whether the device pushes its own state changes
     *
     * Push devices are watched instead of polled.
     */
    [[nodiscard]] virtual auto supportsPush() const -> bool { return false; }

    /**
     * @brief Open a push channel
     *
     * The sink may be called from an adapter-owned thread until the returned
     * subscription is destroyed.
     */
    virtual auto watch(const DeviceDescriptor& descriptor, PushSink sink)
        -> DeviceResult<PushSubscription> {
        (void)sink;
        return failure<PushSubscription>(
            error::unsupported("push notifications")
                .withDevice(descriptor.id.str()));
    }

    /**
     * @brief Drop cached credentials or sessions after a configuration reload
     */
    virtual void reset() {}
};

/**
 * @brief Closes an adapter session when leaving scope
 */
class ScopedSession {
public:
    ScopedSession(DeviceAdapter& adapter,
                  std::unique_ptr<DeviceSession> session)
        : adapter_(adapter), session_(std::move(session)) {}

    ~ScopedSession() {
        if (session_) {
            adapter_.close(*session_);
        }
    }

    ScopedSession(const ScopedSession&) = delete;
    ScopedSession& operator=(const ScopedSession&) = delete;

    auto operator*() -> DeviceSession& { return *session_; }

private:
    DeviceAdapter& adapter_;
    std::unique_ptr<DeviceSession> session_;
};

}  // namespace hearth::device

#endif  // HEARTH_DEVICE_ADAPTER_DEVICE_ADAPTER_HPP
