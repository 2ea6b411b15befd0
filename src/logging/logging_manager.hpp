/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Process-wide spdlog setup from configuration

**************************************************/

#ifndef HEARTH_LOGGING_LOGGING_MANAGER_HPP
#define HEARTH_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace hearth::logging {

/**
 * @brief Installs the default spdlog logger with console and rotating file
 * sinks
 *
 * Components log through the spdlog free functions; this class only owns the
 * sinks behind the default logger.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief Build sinks and install the default logger
     *
     * Calling it again replaces the previous setup (used on config reload).
     */
    void initialize(const config::LoggingConfig& config);

    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    void flush();

    [[nodiscard]] static auto levelFromString(const std::string& level)
        -> spdlog::level::level_enum;

private:
    LoggingManager() = default;
    ~LoggingManager();

    mutable std::mutex mutex_;
    bool initialized_{false};
    std::vector<spdlog::sink_ptr> sinks_;
};

}  // namespace hearth::logging

#endif  // HEARTH_LOGGING_LOGGING_MANAGER_HPP
