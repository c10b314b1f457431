/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "logging/core/logging_manager.hpp"

namespace runstep::logging {

namespace {

void applyFormat(const spdlog::sink_ptr& sink, const std::string& level,
                 const std::string& pattern) {
    sink->set_level(LoggingManager::levelFromString(level));
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
}

}  // namespace

auto SinkFactory::createConsoleSink(const config::LoggingConfig& config)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    applyFormat(sink, config.consoleLevel, config.pattern);
    return sink;
}

auto SinkFactory::logFilePath(const config::LoggingConfig& config)
    -> std::filesystem::path {
    return std::filesystem::path(config.logDir) / (config.logFilename + ".log");
}

auto SinkFactory::createFileSink(const config::LoggingConfig& config)
    -> spdlog::sink_ptr {
    auto path = logFilePath(config);
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        spdlog::sink_ptr sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), config.maxFileSize, config.maxFiles);
        applyFormat(sink, config.fileLevel, config.pattern);
        return sink;
    } catch (const std::exception& e) {
        spdlog::error("Cannot open log file {}: {}", path.string(), e.what());
        return nullptr;
    }
}

}  // namespace runstep::logging
