/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Logging configuration

**************************************************/

#ifndef HEARTH_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define HEARTH_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace hearth::config {

/**
 * @brief Console and rotating file logging settings
 *
 * @example
 * ```json
 * "logging": {
 *   "consoleLevel": "info",
 *   "enableFile": true,
 *   "logDir": "logs",
 *   "fileLevel": "debug",
 *   "maxFileSize": 5242880
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view KEY = "logging";

    // ========================================================================
    // Console Settings
    // ========================================================================

    bool enableConsole{true};          ///< Enable console output
    std::string consoleLevel{"info"};  ///< Console log level
    bool consoleColor{true};           ///< Enable ANSI color codes

    // ========================================================================
    // File Settings
    // ========================================================================

    bool enableFile{false};             ///< Enable rotating file output
    std::string logDir{"logs"};         ///< Log directory path
    std::string logFilename{"hearth"};  ///< Base filename (without extension)
    std::string fileLevel{"debug"};     ///< File log level

    size_t maxFileSize{5 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{3};                    ///< Max number of rotated files

    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", consoleLevel},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", fileLevel},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

}  // namespace hearth::config

#endif  // HEARTH_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
