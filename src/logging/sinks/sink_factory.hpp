/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNSTEP_LOGGING_SINKS_SINK_FACTORY_HPP
#define RUNSTEP_LOGGING_SINKS_SINK_FACTORY_HPP

#include <filesystem>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace runstep::logging {

/**
 * @brief Builds the sinks described by a LoggingConfig
 */
class SinkFactory {
public:
    /**
     * @brief Colored stderr sink at consoleLevel
     *
     * stderr keeps stdout free for the output of the run step.
     */
    [[nodiscard]] static auto createConsoleSink(const config::LoggingConfig& config)
        -> spdlog::sink_ptr;

    /**
     * @brief Rotating sink writing logDir/logFilename.log at fileLevel
     * @return nullptr when the directory or file cannot be created
     */
    [[nodiscard]] static auto createFileSink(const config::LoggingConfig& config)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto logFilePath(const config::LoggingConfig& config)
        -> std::filesystem::path;
};

}  // namespace runstep::logging

#endif  // RUNSTEP_LOGGING_SINKS_SINK_FACTORY_HPP
