/*
 * device_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device registry implementation

**************************************************/

#include "device_registry.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>

#include <spdlog/spdlog.h>

#include "device/bridge/device_executor.hpp"
#include "device/bridge/scheduler.hpp"

namespace hearth::device {

namespace {

// Adapter calls must never let an exception escape into a worker lane
template <typename F>
auto guardedCall(const std::string& what, F&& func)
    -> std::invoke_result_t<F> {
    try {
        return std::invoke(std::forward<F>(func));
    } catch (const DeviceException& e) {
        return std::unexpected(e.error());
    } catch (const std::exception& e) {
        spdlog::error("DeviceRegistry: {} threw: {}", what, e.what());
        return std::unexpected(error::internalError(e.what()));
    }
}

// Keep last known values for fields the device did not report
auto mergeState(const DeviceState& previous, DeviceState fetched)
    -> DeviceState {
    if (!fetched.brightness) {
        fetched.brightness = previous.brightness;
    }
    if (!fetched.color) {
        fetched.color = previous.color;
    }
    if (!fetched.volume) {
        fetched.volume = previous.volume;
    }
    if (!fetched.mediaInfo) {
        fetched.mediaInfo = previous.mediaInfo;
    }
    fetched.reachable = true;
    fetched.lastUpdated = Clock::now();
    return fetched;
}

}  // namespace

class DeviceRegistry::Impl {
public:
    Impl(std::shared_ptr<AdapterRegistry> adapters, DeviceEventBus& bus,
         config::RegistryConfig config)
        : adapters_(std::move(adapters)),
          bus_(bus),
          config_(std::move(config)),
          executor_(std::max<std::size_t>(config_.workerThreads, 1)) {}

    ~Impl() { stop(); }

    auto registerDevice(DeviceDescriptor descriptor) -> bool;
    void markLost(const DeviceId& id);
    auto invoke(const DeviceId& id, Command command)
        -> std::future<DeviceVoidResult>;
    void pollNow(const DeviceId& id);
    auto snapshot() const -> std::vector<DeviceSnapshot>;
    auto get(const DeviceId& id) const -> std::optional<DeviceSnapshot>;
    auto contains(const DeviceId& id) const -> bool;
    auto size() const -> std::size_t;
    void applyConfig(config::RegistryConfig config);
    void stop();

private:
    struct Entry {
        DeviceDescriptor descriptor;
        DeviceState state;
        std::shared_ptr<DeviceAdapter> adapter;
        bool lost = false;
        std::uint64_t generation = 0;
        TimerId graceTimer = 0;
        TimerId pollTimer = 0;
        // Set when the device cannot work with the current configuration
        std::optional<DeviceError> configurationError;
        PushSubscription push;
    };

    using Promise = std::shared_ptr<std::promise<DeviceVoidResult>>;

    void expire(const DeviceId& id, std::uint64_t generation);

    void execute(const DeviceId& id, const Command& command,
                 const Promise& promise);
    auto executeOnce(DeviceAdapter& adapter,
                     const DeviceDescriptor& descriptor,
                     const Command& command) -> DeviceVoidResult;
    auto waitBackoff(std::chrono::milliseconds delay) -> bool;

    void startMonitoring(const DeviceId& id);
    void schedulePollLocked(const DeviceId& id, Entry& entry,
                            std::chrono::milliseconds delay);
    void pollTick(const DeviceId& id);
    void submitPoll(const DeviceId& id);
    void poll(const DeviceId& id);

    void startWatch(const DeviceId& id);
    void scheduleWatchRetry(const DeviceId& id);
    void onPushedState(const DeviceId& id, const DeviceState& state);

    // Requires mutex_ held; returns the events to publish
    void recordFetchedLocked(const DeviceId& id, Entry& entry,
                             const DeviceState& fetched,
                             std::vector<DeviceEventPayload>& events);
    void recordMonitorFailureLocked(const DeviceId& id, Entry& entry,
                                    const DeviceError& error,
                                    std::vector<DeviceEventPayload>& events);

    void publishAll(std::vector<DeviceEventPayload>& events);

    std::shared_ptr<AdapterRegistry> adapters_;
    DeviceEventBus& bus_;

    mutable std::mutex mutex_;
    config::RegistryConfig config_;
    std::map<DeviceId, Entry> entries_;
    bool stopped_ = false;

    std::mutex backoffMutex_;
    std::condition_variable backoffCv_;

    // Declared last: destroyed first, so no job outlives the state above
    Scheduler scheduler_;
    DeviceExecutor executor_;
};

// ==================== Lifecycle ====================

auto DeviceRegistry::Impl::registerDevice(DeviceDescriptor descriptor)
    -> bool {
    auto adapter = adapters_->get(descriptor.protocol);
    if (!adapter) {
        spdlog::warn("DeviceRegistry: no adapter for protocol {}, ignoring {}",
                     protocolToString(descriptor.protocol),
                     descriptor.id.str());
        return false;
    }

    const DeviceId id = descriptor.id;
    std::vector<DeviceEventPayload> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            auto& entry = it->second;
            if (entry.lost) {
                entry.lost = false;
                ++entry.generation;
                scheduler_.cancel(entry.graceTimer);
                entry.graceTimer = 0;
                spdlog::info("DeviceRegistry: {} seen again", id.str());
            }
            // Kind, protocol and id never change; the rest follows discovery
            entry.descriptor.displayName = descriptor.displayName;
            entry.descriptor.address = descriptor.address;
            entry.descriptor.lastSeen = descriptor.lastSeen;
            if (!descriptor.capabilities.empty()) {
                entry.descriptor.capabilities = descriptor.capabilities;
            }
            if (!descriptor.model.empty()) {
                entry.descriptor.model = descriptor.model;
            }
            return false;
        }

        Entry entry;
        entry.descriptor = descriptor;
        entry.adapter = std::move(adapter);
        entry.state.reachable = true;
        entry.state.lastUpdated = Clock::now();
        entries_.emplace(id, std::move(entry));
        events.emplace_back(DeviceDiscoveredEvent{std::move(descriptor)});
    }

    spdlog::info("DeviceRegistry: registered {}", id.str());
    publishAll(events);
    startMonitoring(id);
    return true;
}

void DeviceRegistry::Impl::markLost(const DeviceId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.lost || stopped_) {
        return;
    }
    auto& entry = it->second;
    entry.lost = true;
    const auto generation = ++entry.generation;
    const auto grace = std::chrono::seconds(config_.gracePeriodSeconds);
    entry.graceTimer = scheduler_.scheduleAfter(
        grace, [this, id, generation] { expire(id, generation); });
    spdlog::info("DeviceRegistry: {} missing, removal in {}s", id.str(),
                 grace.count());
}

void DeviceRegistry::Impl::expire(const DeviceId& id,
                                  std::uint64_t generation) {
    std::optional<Entry> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.lost ||
            it->second.generation != generation) {
            return;
        }
        scheduler_.cancel(it->second.pollTimer);
        removed.emplace(std::move(it->second));
        entries_.erase(it);
    }

    executor_.cancelQueued(id);
    // Closing a push channel may block on the adapter thread
    removed->push.reset();

    spdlog::info("DeviceRegistry: {} removed after grace period", id.str());
    bus_.publish(DeviceLostEvent{id});
}

// ==================== Commands ====================

auto DeviceRegistry::Impl::invoke(const DeviceId& id, Command command)
    -> std::future<DeviceVoidResult> {
    auto promise = std::make_shared<std::promise<DeviceVoidResult>>();
    auto future = promise->get_future();

    std::vector<DeviceEventPayload> events;
    std::optional<DeviceError> rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            promise->set_value(failure(error::notFound(id.str())));
            return future;
        }
        auto& entry = it->second;

        if (entry.configurationError) {
            rejected = *entry.configurationError;
        } else {
            auto validated = validateCommand(entry.descriptor, command);
            if (!validated) {
                rejected = std::move(validated.error());
            } else {
                command = std::move(*validated);
            }
        }
        if (rejected) {
            events.emplace_back(DeviceErrorEvent{id, *rejected});
        }
    }

    if (rejected) {
        spdlog::warn("DeviceRegistry: {} rejected: {}", describeCommand(command),
                     rejected->toString());
        publishAll(events);
        promise->set_value(failure(std::move(*rejected)));
        return future;
    }

    DeviceJob job;
    job.supersedeKey = supersedeKey(command);
    job.run = [this, id, command, promise] { execute(id, command, promise); };
    job.cancel = [id, command, promise] {
        spdlog::debug("DeviceRegistry: {} on {} superseded",
                      describeCommand(command), id.str());
        promise->set_value(failure(
            error::cancelled(describeCommand(command)).withDevice(id.str())));
    };
    executor_.submit(id, std::move(job));
    return future;
}

void DeviceRegistry::Impl::execute(const DeviceId& id, const Command& command,
                                   const Promise& promise) {
    std::shared_ptr<DeviceAdapter> adapter;
    DeviceDescriptor descriptor;
    Command resolved = command;
    config::RetryConfig retry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            promise->set_value(failure(error::notFound(id.str())));
            return;
        }
        adapter = it->second.adapter;
        descriptor = it->second.descriptor;
        retry = config_.retry;
        // Toggle reads the state left by every earlier command in the lane
        if (std::holds_alternative<Toggle>(command)) {
            resolved = SetPower{!it->second.state.power};
        }
    }

    const auto label = describeCommand(resolved);
    DeviceVoidResult result = executeOnce(*adapter, descriptor, resolved);
    const int retries = retry.effectiveRetries();
    for (int attempt = 0; !result && attempt < retries; ++attempt) {
        if (!result.error().isRetryable()) {
            break;
        }
        auto delay = retry.delayFor(attempt);
        spdlog::debug("DeviceRegistry: {} on {} failed ({}), retry {} in {}ms",
                      label, id.str(), result.error().message, attempt + 1,
                      delay.count());
        if (!waitBackoff(delay)) {
            break;
        }
        result = executeOnce(*adapter, descriptor, resolved);
    }

    std::vector<DeviceEventPayload> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            auto& entry = it->second;
            if (result) {
                entry.state = applyCommandToState(entry.state, resolved);
                events.emplace_back(DeviceStateChangedEvent{id, entry.state});
            } else {
                if (isTransportError(result.error().code)) {
                    entry.state.reachable = false;
                }
                if (result.error().code ==
                    DeviceErrorCode::ConfigurationError) {
                    entry.configurationError = result.error();
                }
            }
        }
        if (!result) {
            events.emplace_back(DeviceErrorEvent{id, result.error()});
        }
    }

    if (result) {
        spdlog::debug("DeviceRegistry: {} on {} succeeded", label, id.str());
    } else {
        spdlog::warn("DeviceRegistry: {} on {} failed: {}", label, id.str(),
                     result.error().toString());
    }
    publishAll(events);
    promise->set_value(std::move(result));
}

auto DeviceRegistry::Impl::executeOnce(DeviceAdapter& adapter,
                                       const DeviceDescriptor& descriptor,
                                       const Command& command)
    -> DeviceVoidResult {
    const auto deviceId = descriptor.id.str();
    auto session = guardedCall("connect", [&] {
        return adapter.connect(descriptor);
    });
    if (!session) {
        return failure(std::move(session.error()).withDevice(deviceId));
    }
    ScopedSession scoped(adapter, std::move(*session));
    auto result = guardedCall("applyCommand", [&] {
        return adapter.applyCommand(*scoped, command);
    });
    if (!result) {
        return failure(std::move(result.error()).withDevice(deviceId));
    }
    return success();
}

auto DeviceRegistry::Impl::waitBackoff(std::chrono::milliseconds delay)
    -> bool {
    std::unique_lock<std::mutex> lock(backoffMutex_);
    return !backoffCv_.wait_for(lock, delay, [this] {
        std::lock_guard<std::mutex> guard(mutex_);
        return stopped_;
    });
}

// ==================== Monitoring ====================

void DeviceRegistry::Impl::startMonitoring(const DeviceId& id) {
    std::shared_ptr<DeviceAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || stopped_) {
            return;
        }
        adapter = it->second.adapter;
    }
    if (adapter->supportsPush()) {
        startWatch(id);
    } else {
        // Initial read fills in the state; later reads follow the interval
        submitPoll(id);
    }
}

void DeviceRegistry::Impl::schedulePollLocked(
    const DeviceId& id, Entry& entry, std::chrono::milliseconds delay) {
    if (stopped_ || !config_.pollingEnabled || entry.configurationError) {
        return;
    }
    scheduler_.cancel(entry.pollTimer);
    entry.pollTimer =
        scheduler_.scheduleAfter(delay, [this, id] { pollTick(id); });
}

void DeviceRegistry::Impl::pollTick(const DeviceId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        it->second.pollTimer = 0;
    }
    submitPoll(id);
}

void DeviceRegistry::Impl::submitPoll(const DeviceId& id) {
    DeviceJob job;
    job.run = [this, id] { poll(id); };
    job.cancel = [] {};
    if (!executor_.submitIfIdle(id, std::move(job))) {
        spdlog::trace("DeviceRegistry: {} busy, poll skipped", id.str());
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            schedulePollLocked(
                id, it->second,
                config_.pollIntervalFor(id.str()));
        }
    }
}

void DeviceRegistry::Impl::poll(const DeviceId& id) {
    std::shared_ptr<DeviceAdapter> adapter;
    DeviceDescriptor descriptor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.configurationError) {
            return;
        }
        adapter = it->second.adapter;
        descriptor = it->second.descriptor;
    }

    auto fetched = [&]() -> DeviceResult<DeviceState> {
        auto session = guardedCall("connect", [&] {
            return adapter->connect(descriptor);
        });
        if (!session) {
            return failure<DeviceState>(std::move(session.error()));
        }
        ScopedSession scoped(*adapter, std::move(*session));
        return guardedCall("fetchState",
                           [&] { return adapter->fetchState(*scoped); });
    }();

    std::vector<DeviceEventPayload> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        auto& entry = it->second;
        if (fetched) {
            recordFetchedLocked(id, entry, *fetched, events);
        } else {
            recordMonitorFailureLocked(
                id, entry, std::move(fetched.error()).withDevice(id.str()),
                events);
        }
        schedulePollLocked(id, entry, config_.pollIntervalFor(id.str()));
    }
    publishAll(events);
}

void DeviceRegistry::Impl::recordFetchedLocked(
    const DeviceId& id, Entry& entry, const DeviceState& fetched,
    std::vector<DeviceEventPayload>& events) {
    auto next = mergeState(entry.state, fetched);
    const bool changed = !next.sameAs(entry.state);
    entry.state = std::move(next);
    if (changed) {
        events.emplace_back(DeviceStateChangedEvent{id, entry.state});
    }
}

void DeviceRegistry::Impl::recordMonitorFailureLocked(
    const DeviceId& id, Entry& entry, const DeviceError& error,
    std::vector<DeviceEventPayload>& events) {
    if (error.code == DeviceErrorCode::ConfigurationError) {
        if (!entry.configurationError) {
            spdlog::error("DeviceRegistry: {} unusable: {}", id.str(),
                          error.toString());
            entry.configurationError = error;
            events.emplace_back(DeviceErrorEvent{id, error});
        }
        return;
    }
    if (entry.state.reachable && isTransportError(error.code)) {
        spdlog::warn("DeviceRegistry: {} unreachable: {}", id.str(),
                     error.toString());
        entry.state.reachable = false;
        events.emplace_back(DeviceErrorEvent{id, error});
    } else {
        spdlog::debug("DeviceRegistry: {} monitor failure: {}", id.str(),
                      error.toString());
    }
}

void DeviceRegistry::Impl::startWatch(const DeviceId& id) {
    DeviceJob job;
    job.cancel = [] {};
    job.run = [this, id] {
        std::shared_ptr<DeviceAdapter> adapter;
        DeviceDescriptor descriptor;
        PushSubscription previous;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end() || stopped_ ||
                it->second.configurationError) {
                return;
            }
            adapter = it->second.adapter;
            descriptor = it->second.descriptor;
            previous = std::move(it->second.push);
        }
        previous.reset();

        PushSink sink;
        sink.onState = [this, id](const DeviceState& state) {
            onPushedState(id, state);
        };
        sink.onClosed = [this, id](const DeviceError& error) {
            std::vector<DeviceEventPayload> events;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = entries_.find(id);
                if (it == entries_.end()) {
                    return;
                }
                recordMonitorFailureLocked(id, it->second, error, events);
            }
            publishAll(events);
            scheduleWatchRetry(id);
        };

        auto subscription = guardedCall(
            "watch", [&] { return adapter->watch(descriptor, sink); });

        std::vector<DeviceEventPayload> events;
        bool retry = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end() || stopped_) {
                // Device left while connecting; subscription closes below
                return;
            }
            if (subscription) {
                it->second.push = std::move(*subscription);
                spdlog::debug("DeviceRegistry: watching {}", id.str());
            } else {
                recordMonitorFailureLocked(
                    id, it->second,
                    std::move(subscription.error()).withDevice(id.str()),
                    events);
                retry = !it->second.configurationError;
            }
        }
        publishAll(events);
        if (retry) {
            scheduleWatchRetry(id);
        }
    };
    executor_.submit(id, std::move(job));
}

void DeviceRegistry::Impl::scheduleWatchRetry(const DeviceId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || stopped_ || it->second.configurationError) {
        return;
    }
    scheduler_.cancel(it->second.pollTimer);
    it->second.pollTimer = scheduler_.scheduleAfter(
        config_.pollIntervalFor(id.str()), [this, id] { startWatch(id); });
}

void DeviceRegistry::Impl::onPushedState(const DeviceId& id,
                                         const DeviceState& state) {
    std::vector<DeviceEventPayload> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        recordFetchedLocked(id, it->second, state, events);
    }
    publishAll(events);
}

void DeviceRegistry::Impl::pollNow(const DeviceId& id) {
    if (!contains(id)) {
        return;
    }
    submitPoll(id);
}

// ==================== Queries ====================

auto DeviceRegistry::Impl::snapshot() const -> std::vector<DeviceSnapshot> {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeviceSnapshot> result;
    result.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        result.push_back({entry.descriptor, entry.state});
    }
    return result;
}

auto DeviceRegistry::Impl::get(const DeviceId& id) const
    -> std::optional<DeviceSnapshot> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return DeviceSnapshot{it->second.descriptor, it->second.state};
}

auto DeviceRegistry::Impl::contains(const DeviceId& id) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(id);
}

auto DeviceRegistry::Impl::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ==================== Configuration ====================

void DeviceRegistry::Impl::applyConfig(config::RegistryConfig config) {
    std::vector<DeviceId> restart;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = std::move(config);
        for (auto& [id, entry] : entries_) {
            if (entry.configurationError) {
                entry.configurationError.reset();
                restart.push_back(id);
            } else if (!entry.adapter->supportsPush()) {
                schedulePollLocked(id, entry,
                                   config_.pollIntervalFor(id.str()));
            }
        }
    }
    for (const auto& id : restart) {
        spdlog::info("DeviceRegistry: retrying {} with new configuration",
                     id.str());
        startMonitoring(id);
    }
}

void DeviceRegistry::Impl::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    {
        std::lock_guard<std::mutex> guard(backoffMutex_);
    }
    backoffCv_.notify_all();
    scheduler_.stop();
    executor_.shutdown();

    std::vector<PushSubscription> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (entry.push.active()) {
                channels.push_back(std::move(entry.push));
            }
        }
    }
    channels.clear();
    spdlog::debug("DeviceRegistry: stopped");
}

void DeviceRegistry::Impl::publishAll(std::vector<DeviceEventPayload>& events) {
    for (auto& payload : events) {
        bus_.publish(std::move(payload));
    }
    events.clear();
}

// ==================== Public interface ====================

DeviceRegistry::DeviceRegistry(std::shared_ptr<AdapterRegistry> adapters,
                               DeviceEventBus& bus,
                               config::RegistryConfig config)
    : impl_(std::make_unique<Impl>(std::move(adapters), bus,
                                   std::move(config))) {}

DeviceRegistry::~DeviceRegistry() = default;

auto DeviceRegistry::registerDevice(DeviceDescriptor descriptor) -> bool {
    return impl_->registerDevice(std::move(descriptor));
}

void DeviceRegistry::markLost(const DeviceId& id) { impl_->markLost(id); }

auto DeviceRegistry::invoke(const DeviceId& id, Command command)
    -> std::future<DeviceVoidResult> {
    return impl_->invoke(id, std::move(command));
}

void DeviceRegistry::pollNow(const DeviceId& id) { impl_->pollNow(id); }

auto DeviceRegistry::snapshot() const -> std::vector<DeviceSnapshot> {
    return impl_->snapshot();
}

auto DeviceRegistry::get(const DeviceId& id) const
    -> std::optional<DeviceSnapshot> {
    return impl_->get(id);
}

auto DeviceRegistry::contains(const DeviceId& id) const -> bool {
    return impl_->contains(id);
}

auto DeviceRegistry::size() const -> std::size_t { return impl_->size(); }

void DeviceRegistry::applyConfig(config::RegistryConfig config) {
    impl_->applyConfig(std::move(config));
}

void DeviceRegistry::stop() { impl_->stop(); }

}  // namespace hearth::device
