/*
 * config_provider.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Read-only configuration access with explicit reload

**************************************************/

#include "config_provider.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace hearth::config {

using device::DeviceResult;
using device::DeviceVoidResult;

StaticConfigProvider::StaticConfigProvider(HearthConfig config)
    : config_(std::make_shared<const HearthConfig>(std::move(config))) {}

auto StaticConfigProvider::current() const
    -> std::shared_ptr<const HearthConfig> {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

auto StaticConfigProvider::reload() -> DeviceVoidResult {
    return device::success();
}

void StaticConfigProvider::update(HearthConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = std::make_shared<const HearthConfig>(std::move(config));
}

JsonConfigProvider::JsonConfigProvider(std::filesystem::path path)
    : path_(std::move(path)) {
    auto loaded = loadFile(path_);
    if (!loaded) {
        throw device::ConfigurationException(loaded.error().message);
    }
    config_ = std::make_shared<const HearthConfig>(std::move(*loaded));
    spdlog::info("JsonConfigProvider: loaded {}", path_.string());
}

auto JsonConfigProvider::current() const
    -> std::shared_ptr<const HearthConfig> {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

auto JsonConfigProvider::reload() -> DeviceVoidResult {
    auto loaded = loadFile(path_);
    if (!loaded) {
        spdlog::warn("JsonConfigProvider: reload failed, keeping previous: {}",
                     loaded.error().message);
        return device::failure(loaded.error());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = std::make_shared<const HearthConfig>(std::move(*loaded));
    }
    spdlog::info("JsonConfigProvider: reloaded {}", path_.string());
    return device::success();
}

auto JsonConfigProvider::loadFile(const std::filesystem::path& path)
    -> DeviceResult<HearthConfig> {
    std::ifstream in(path);
    if (!in) {
        return device::failure<HearthConfig>(device::error::configurationError(
            "Cannot open configuration file " + path.string()));
    }
    auto document = json::parse(in, nullptr, false, true);
    if (document.is_discarded()) {
        return device::failure<HearthConfig>(device::error::configurationError(
            "Configuration file is not valid JSON: " + path.string()));
    }
    auto parsed = device::tryExecute(
        [&document] { return HearthConfig::fromJson(document); });
    if (!parsed) {
        auto err = parsed.error();
        err.code = device::DeviceErrorCode::ConfigurationError;
        err.details = path.string();
        return device::failure<HearthConfig>(err);
    }
    return parsed;
}

}  // namespace hearth::config
