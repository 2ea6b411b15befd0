/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace hearth::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const config::LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    sinks_.clear();
    std::string fileError;
    auto minLevel = spdlog::level::off;

    if (config.enableConsole) {
        spdlog::sink_ptr console;
        if (config.consoleColor) {
            console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        } else {
            console = std::make_shared<spdlog::sinks::stdout_sink_mt>();
        }
        auto level = levelFromString(config.consoleLevel);
        console->set_level(level);
        minLevel = std::min(minLevel, level);
        sinks_.push_back(std::move(console));
    }

    if (config.enableFile) {
        std::error_code ec;
        std::filesystem::create_directories(config.logDir, ec);
        auto file = (std::filesystem::path(config.logDir) /
                     (config.logFilename + ".log"))
                        .string();
        try {
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, config.maxFileSize, config.maxFiles);
            auto level = levelFromString(config.fileLevel);
            sink->set_level(level);
            minLevel = std::min(minLevel, level);
            sinks_.push_back(std::move(sink));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep console logging when the file cannot be opened
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("hearth", sinks_.begin(),
                                                   sinks_.end());
    logger->set_pattern(config.pattern);
    logger->set_level(minLevel);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    initialized_ = true;
    if (!fileError.empty()) {
        spdlog::warn("LoggingManager: file sink disabled: {}", fileError);
    }
    spdlog::debug("LoggingManager: initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }
    spdlog::default_logger()->flush();
    sinks_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void LoggingManager::flush() { spdlog::default_logger()->flush(); }

auto LoggingManager::levelFromString(const std::string& level)
    -> spdlog::level::level_enum {
    if (level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "fatal") {
        return spdlog::level::critical;
    }
    return spdlog::level::from_str(level);
}

}  // namespace hearth::logging
