/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Central Logging Manager

**************************************************/

#ifndef RUNSTEP_LOGGING_LOGGING_MANAGER_HPP
#define RUNSTEP_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace runstep::logging {

/// Name of the default logger installed by initialize().
inline constexpr const char* DEFAULT_LOGGER_NAME = "runstep";

/**
 * @brief Central logging manager with spdlog integration
 *
 * Builds a console sink and an optional rotating file sink from
 * LoggingConfig, installs a default logger on them and hands out named
 * loggers sharing the same sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     *
     * Calling it again replaces the sinks and every logger created so far.
     */
    void initialize(const config::LoggingConfig& config);

    /**
     * @brief Flush and drop every logger
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger on the managed sinks
     *
     * Before initialize() the logger writes to the sinks of spdlog's
     * default logger.
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set log level of every managed logger
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    void flush();

    [[nodiscard]] auto sinkCount() const -> size_t;

    [[nodiscard]] auto getConfig() const -> config::LoggingConfig;

    /**
     * @brief Convert level string to enum, "info" for unknown names
     */
    [[nodiscard]] static auto levelFromString(const std::string& level)
        -> spdlog::level::level_enum;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void dropLoggers();
    [[nodiscard]] auto loggerLevel() const -> spdlog::level::level_enum;

    mutable std::shared_mutex mutex_;
    config::LoggingConfig config_;
    bool initialized_{false};

    std::vector<spdlog::sink_ptr> sinks_;
    std::vector<std::string> loggerNames_;
};

}  // namespace runstep::logging

#endif  // RUNSTEP_LOGGING_LOGGING_MANAGER_HPP
