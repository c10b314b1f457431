/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <algorithm>
#include <mutex>

#include "../sinks/sink_factory.hpp"

namespace runstep::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

auto LoggingManager::levelFromString(const std::string& level)
    -> spdlog::level::level_enum {
    if (!config::isKnownLogLevel(level)) {
        return spdlog::level::info;
    }
    return spdlog::level::from_str(level);
}

void LoggingManager::initialize(const config::LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        dropLoggers();
        sinks_.clear();
    }

    config_ = config;

    sinks_.push_back(SinkFactory::createConsoleSink(config));
    if (config.enableFile) {
        if (auto sink = SinkFactory::createFileSink(config)) {
            sinks_.push_back(std::move(sink));
        }
    }

    auto defaultLogger = std::make_shared<spdlog::logger>(
        DEFAULT_LOGGER_NAME, sinks_.begin(), sinks_.end());
    defaultLogger->set_level(loggerLevel());
    spdlog::set_default_logger(defaultLogger);
    loggerNames_.push_back(DEFAULT_LOGGER_NAME);

    initialized_ = true;
    spdlog::debug("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    spdlog::debug("LoggingManager shutting down...");
    dropLoggers();
    sinks_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    std::shared_ptr<spdlog::logger> logger;
    if (initialized_) {
        logger = std::make_shared<spdlog::logger>(name, sinks_.begin(),
                                                  sinks_.end());
        logger->set_level(loggerLevel());
    } else {
        const auto& fallback = spdlog::default_logger()->sinks();
        logger = std::make_shared<spdlog::logger>(name, fallback.begin(),
                                                  fallback.end());
    }
    spdlog::register_logger(logger);
    loggerNames_.push_back(name);
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);
    for (const auto& name : loggerNames_) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
    for (const auto& sink : sinks_) {
        sink->set_level(level);
    }
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& name : loggerNames_) {
        if (auto logger = spdlog::get(name)) {
            logger->flush();
        }
    }
}

auto LoggingManager::sinkCount() const -> size_t {
    std::shared_lock lock(mutex_);
    return sinks_.size();
}

auto LoggingManager::getConfig() const -> config::LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::dropLoggers() {
    for (const auto& name : loggerNames_) {
        if (auto logger = spdlog::get(name)) {
            logger->flush();
        }
        if (name != DEFAULT_LOGGER_NAME) {
            spdlog::drop(name);
        }
    }
    loggerNames_.clear();
}

auto LoggingManager::loggerLevel() const -> spdlog::level::level_enum {
    auto level = spdlog::level::off;
    for (const auto& sink : sinks_) {
        level = std::min(level, sink->level());
    }
    return level;
}

}  // namespace runstep::logging
