/*
 * test_logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Tests for LoggingManager and SinkFactory

**************************************************/

#include <gtest/gtest.h>

#include <filesystem>

#include "logging/core/logging_manager.hpp"
#include "logging/sinks/sink_factory.hpp"

using namespace runstep::logging;
using runstep::config::LoggingConfig;
namespace fs = std::filesystem;

class LoggingManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        logDir_ = fs::temp_directory_path() /
                  (std::string("runstep_logging_") + info->name());
        fs::remove_all(logDir_);

        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
    }

    void TearDown() override {
        auto& manager = LoggingManager::getInstance();
        if (manager.isInitialized()) {
            manager.shutdown();
        }
        fs::remove_all(logDir_);
    }

    LoggingConfig fileConfig() const {
        LoggingConfig config;
        config.consoleLevel = "warn";
        config.enableFile = true;
        config.logDir = logDir_.string();
        config.logFilename = "steps";
        config.fileLevel = "debug";
        return config;
    }

    fs::path logDir_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LoggingManagerTest, SingletonInstance) {
    auto& instance1 = LoggingManager::getInstance();
    auto& instance2 = LoggingManager::getInstance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggingManagerTest, InitializeWithDefaultConfig) {
    auto& manager = LoggingManager::getInstance();

    EXPECT_FALSE(manager.isInitialized());
    manager.initialize(LoggingConfig{});

    EXPECT_TRUE(manager.isInitialized());
    EXPECT_EQ(manager.sinkCount(), 1u);
    EXPECT_EQ(spdlog::default_logger()->name(), DEFAULT_LOGGER_NAME);
    EXPECT_EQ(manager.getConfig().consoleLevel, "info");
}

TEST_F(LoggingManagerTest, FileSinkCreatesLogFile) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(fileConfig());

    EXPECT_EQ(manager.sinkCount(), 2u);

    auto logger = manager.getLogger("runstep.test");
    logger->debug("written to the file only");
    manager.flush();

    EXPECT_TRUE(fs::exists(logDir_ / "steps.log"));
    EXPECT_GT(fs::file_size(logDir_ / "steps.log"), 0u);
}

TEST_F(LoggingManagerTest, LoggerLevelFollowsMostVerboseSink) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(fileConfig());

    auto logger = manager.getLogger("runstep.level");
    EXPECT_EQ(logger->level(), spdlog::level::debug);
}

TEST_F(LoggingManagerTest, ReinitializeReplacesSinks) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(fileConfig());
    EXPECT_EQ(manager.sinkCount(), 2u);

    manager.initialize(LoggingConfig{});
    EXPECT_TRUE(manager.isInitialized());
    EXPECT_EQ(manager.sinkCount(), 1u);
}

TEST_F(LoggingManagerTest, ShutdownClearsState) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});
    manager.getLogger("runstep.shutdown");

    manager.shutdown();

    EXPECT_FALSE(manager.isInitialized());
    EXPECT_EQ(manager.sinkCount(), 0u);
    EXPECT_EQ(spdlog::get("runstep.shutdown"), nullptr);
}

// ============================================================================
// Loggers
// ============================================================================

TEST_F(LoggingManagerTest, GetLoggerReturnsSameInstance) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});

    auto first = manager.getLogger("runstep.same");
    auto second = manager.getLogger("runstep.same");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "runstep.same");
}

TEST_F(LoggingManagerTest, GetLoggerBeforeInitialize) {
    auto& manager = LoggingManager::getInstance();
    auto logger = manager.getLogger("runstep.early");

    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->sinks().size(), spdlog::default_logger()->sinks().size());
    spdlog::drop("runstep.early");
}

TEST_F(LoggingManagerTest, SetGlobalLevel) {
    auto& manager = LoggingManager::getInstance();
    manager.initialize(LoggingConfig{});
    auto logger = manager.getLogger("runstep.global");

    manager.setGlobalLevel(spdlog::level::err);
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);
}

TEST_F(LoggingManagerTest, LevelFromString) {
    EXPECT_EQ(LoggingManager::levelFromString("trace"), spdlog::level::trace);
    EXPECT_EQ(LoggingManager::levelFromString("debug"), spdlog::level::debug);
    EXPECT_EQ(LoggingManager::levelFromString("warn"), spdlog::level::warn);
    EXPECT_EQ(LoggingManager::levelFromString("critical"),
              spdlog::level::critical);
    EXPECT_EQ(LoggingManager::levelFromString("off"), spdlog::level::off);
    EXPECT_EQ(LoggingManager::levelFromString("verbose"), spdlog::level::info);
}

// ============================================================================
// SinkFactory
// ============================================================================

TEST_F(LoggingManagerTest, FileSinkCreatesNestedDirectory) {
    auto config = fileConfig();
    config.logDir = (logDir_ / "nested").string();
    config.fileLevel = "info";

    EXPECT_EQ(SinkFactory::logFilePath(config), logDir_ / "nested" / "steps.log");

    auto sink = SinkFactory::createFileSink(config);
    ASSERT_NE(sink, nullptr);
    EXPECT_TRUE(fs::exists(logDir_ / "nested"));
    EXPECT_EQ(sink->level(), spdlog::level::info);
}

TEST_F(LoggingManagerTest, ConsoleSinkUsesConsoleLevel) {
    LoggingConfig config;
    config.consoleLevel = "warn";

    auto sink = SinkFactory::createConsoleSink(config);
    ASSERT_NE(sink, nullptr);
    EXPECT_EQ(sink->level(), spdlog::level::warn);
}
