/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Logging configuration

**************************************************/

#ifndef RUNSTEP_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define RUNSTEP_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <array>
#include <string>

#include "../core/config_section.hpp"

namespace runstep::config {

inline constexpr std::array<std::string_view, 7> LOG_LEVEL_NAMES = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

[[nodiscard]] inline bool isKnownLogLevel(std::string_view name) {
    for (auto level : LOG_LEVEL_NAMES) {
        if (level == name) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```json
 * "logging": {
 *   "consoleLevel": "info",
 *   "enableFile": true,
 *   "logDir": "logs",
 *   "logFilename": "runstep",
 *   "fileLevel": "debug",
 *   "maxFileSize": 10485760,
 *   "maxFiles": 5
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/runstep/logging";

    // Console
    std::string consoleLevel{"info"};

    // File
    bool enableFile{false};
    std::string logDir{"logs"};
    std::string logFilename{"runstep"};  ///< Without extension
    std::string fileLevel{"debug"};

    // Rotation
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    /// Available placeholders: %Y %m %d %H %M %S %e (milliseconds)
    ///                        %l (level), %n (logger name), %t (thread id), %v
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};

    [[nodiscard]] json serialize() const {
        return {{"consoleLevel", consoleLevel},
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
        cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json levels = json::array();
        for (auto level : LOG_LEVEL_NAMES) {
            levels.push_back(level);
        }
        return {
            {"type", "object"},
            {"properties", {
                {"consoleLevel", {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
                {"enableFile", {{"type", "boolean"}, {"default", false}}},
                {"logDir", {{"type", "string"}, {"default", "logs"}}},
                {"logFilename", {{"type", "string"}, {"default", "runstep"}}},
                {"fileLevel", {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
                {"maxFileSize", {{"type", "integer"}, {"minimum", 1024}, {"default", 10485760}}},
                {"maxFiles", {{"type", "integer"}, {"minimum", 1}, {"default", 5}}},
                {"pattern", {{"type", "string"}}}
            }}
        };
    }

    [[nodiscard]] ConfigValidationResult check() const {
        ConfigValidationResult result;
        if (!isKnownLogLevel(consoleLevel)) {
            result.addError(keyPath("consoleLevel"),
                            "unknown log level \"" + consoleLevel + "\"");
        }
        if (!isKnownLogLevel(fileLevel)) {
            result.addError(keyPath("fileLevel"),
                            "unknown log level \"" + fileLevel + "\"");
        }
        if (enableFile && logFilename.empty()) {
            result.addError(keyPath("logFilename"), "must not be empty");
        }
        if (maxFiles == 0) {
            result.addError(keyPath("maxFiles"), "must be at least 1");
        }
        return result;
    }
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
