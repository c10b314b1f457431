/*
 * test_config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Tests for configuration sections and ConfigLoader

**************************************************/

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "config/config_loader.hpp"

using namespace runstep::config;
namespace fs = std::filesystem;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempDir_ = fs::temp_directory_path() /
                   (std::string("runstep_config_") + info->name());
        fs::remove_all(tempDir_);
        fs::create_directories(tempDir_);
    }

    void TearDown() override { fs::remove_all(tempDir_); }

    fs::path writeFile(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    fs::path tempDir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigLoaderTest, EmptyDocumentYieldsDefaults) {
    auto config = ConfigLoader::loadFromJson(json::object());

    EXPECT_EQ(config.terraform.defaultDistribution, "terraform");
    EXPECT_TRUE(config.terraform.defaultVersion.empty());
    EXPECT_FALSE(config.terraform.version().has_value());
    EXPECT_EQ(config.terraform.binDir, "bin");
    EXPECT_TRUE(config.terraform.allowDownloads);

    EXPECT_EQ(config.shell.shell, "sh");
    EXPECT_EQ(config.shell.shellArgs, std::vector<std::string>{"-c"});
    EXPECT_FALSE(config.shell.inheritEnvironment);
    EXPECT_TRUE(config.shell.streamOutput);

    EXPECT_EQ(config.logging.consoleLevel, "info");
    EXPECT_FALSE(config.logging.enableFile);
    EXPECT_EQ(config.logging.maxFiles, 5u);
}

TEST_F(ConfigLoaderTest, DefaultSectionsAreValid) {
    EXPECT_TRUE(TerraformConfig::defaults().validate().isValid());
    EXPECT_TRUE(ShellConfig::defaults().validate().isValid());
    EXPECT_TRUE(LoggingConfig::defaults().validate().isValid());
}

TEST_F(ConfigLoaderTest, PartialSectionKeepsOtherDefaults) {
    json document = {{"runstep", {{"terraform", {{"defaultVersion", "1.6.2"}}}}}};

    auto config = ConfigLoader::loadFromJson(document);

    ASSERT_TRUE(config.terraform.version().has_value());
    EXPECT_EQ(config.terraform.version()->toString(), "1.6.2");
    EXPECT_EQ(config.terraform.defaultDistribution, "terraform");
    EXPECT_EQ(config.terraform.binDir, "bin");
}

// ============================================================================
// Section parsing
// ============================================================================

TEST_F(ConfigLoaderTest, ParsesEverySection) {
    json document = {
        {"runstep",
         {{"terraform",
           {{"defaultDistribution", "opentofu"},
            {"defaultVersion", "1.6.2"},
            {"binDir", "/opt/bin"},
            {"downloadUrl", "https://mirror.example.com"},
            {"allowDownloads", false}}},
          {"shell",
           {{"shell", "bash"},
            {"shellArgs", {"-e", "-c"}},
            {"inheritEnvironment", true},
            {"streamOutput", false}}},
          {"logging", {{"consoleLevel", "debug"}, {"maxFiles", 3}}}}}};

    auto config = ConfigLoader::loadFromJson(document);

    EXPECT_EQ(config.terraform.defaultDistribution, "opentofu");
    EXPECT_EQ(config.terraform.binDir, "/opt/bin");
    EXPECT_EQ(config.terraform.downloadUrl, "https://mirror.example.com");
    EXPECT_FALSE(config.terraform.allowDownloads);

    auto shell = config.shell.commandShell();
    EXPECT_EQ(shell.shell, "bash");
    EXPECT_EQ(shell.shellArgs, (std::vector<std::string>{"-e", "-c"}));
    EXPECT_TRUE(config.shell.inheritEnvironment);
    EXPECT_FALSE(config.shell.streamOutput);

    EXPECT_EQ(config.logging.consoleLevel, "debug");
    EXPECT_EQ(config.logging.maxFiles, 3u);
}

TEST_F(ConfigLoaderTest, ToJsonRoundTrips) {
    RunstepConfig config;
    config.terraform.defaultDistribution = "opentofu";
    config.shell.shellArgs = {"-x", "-c"};
    config.logging.enableFile = true;

    auto document = config.toJson();
    EXPECT_EQ(document["runstep"]["terraform"]["defaultDistribution"], "opentofu");

    auto loaded = ConfigLoader::loadFromJson(document);
    EXPECT_EQ(loaded.terraform, config.terraform);
    EXPECT_EQ(loaded.shell, config.shell);
    EXPECT_EQ(loaded.logging, config.logging);
}

TEST_F(ConfigLoaderTest, SchemaDescribesDistributions) {
    auto schema = TerraformConfig::schema();
    ASSERT_TRUE(schema["properties"].contains("defaultDistribution"));
    EXPECT_EQ(schema["properties"]["defaultDistribution"]["enum"],
              json::array({"terraform", "opentofu"}));
    EXPECT_EQ(schema["properties"]["allowDownloads"]["type"], "boolean");

    auto logging = LoggingConfig::schema();
    EXPECT_EQ(logging["properties"]["consoleLevel"]["enum"].size(), 7u);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ConfigLoaderTest, RejectsNonObjectDocument) {
    EXPECT_THROW((void)ConfigLoader::loadFromJson(json::array()),
                 InvalidConfigException);
}

TEST_F(ConfigLoaderTest, RejectsNonObjectSection) {
    json document = {{"runstep", {{"shell", "bash"}}}};
    EXPECT_THROW((void)ConfigLoader::loadFromJson(document),
                 InvalidConfigException);
}

TEST_F(ConfigLoaderTest, RejectsWrongValueType) {
    json document = {{"runstep", {{"shell", {{"streamOutput", "yes"}}}}}};
    EXPECT_THROW((void)ConfigLoader::loadFromJson(document),
                 InvalidConfigException);
}

TEST_F(ConfigLoaderTest, CollectsEveryValidationError) {
    json document = {
        {"runstep",
         {{"terraform",
           {{"defaultDistribution", "pulumi"}, {"defaultVersion", "one.two"}}},
          {"logging", {{"consoleLevel", "loud"}}}}}};

    RunstepConfig config;
    config.terraform = TerraformConfig::fromJson(document["runstep"]["terraform"]);
    config.logging = LoggingConfig::fromJson(document["runstep"]["logging"]);
    auto result = config.validate();
    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].path, "/runstep/terraform/defaultDistribution");
    EXPECT_EQ(result.errors[1].path, "/runstep/terraform/defaultVersion");
    EXPECT_EQ(result.errors[2].path, "/runstep/logging/consoleLevel");

    try {
        (void)ConfigLoader::loadFromJson(document);
        FAIL() << "expected ConfigValidationException";
    } catch (const ConfigValidationException& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("unknown distribution \"pulumi\""),
                  std::string::npos);
        EXPECT_NE(message.find("invalid version \"one.two\""), std::string::npos);
        EXPECT_NE(message.find("unknown log level \"loud\""), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, RejectsEmptyShell) {
    json document = {{"runstep", {{"shell", {{"shell", ""}}}}}};
    EXPECT_THROW((void)ConfigLoader::loadFromJson(document),
                 ConfigValidationException);
}

TEST_F(ConfigLoaderTest, RejectsZeroMaxFiles) {
    json document = {{"runstep", {{"logging", {{"maxFiles", 0}}}}}};
    EXPECT_THROW((void)ConfigLoader::loadFromJson(document),
                 ConfigValidationException);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigLoaderTest, LoadsFromFile) {
    auto path = writeFile("runstep.json", R"({
        "runstep": {
            "terraform": {"defaultVersion": "0.14.0", "binDir": "/tmp/tf"},
            "shell": {"shellArgs": ["-c"]}
        }
    })");

    auto config = ConfigLoader::loadFromFile(path);
    EXPECT_EQ(config.terraform.defaultVersion, "0.14.0");
    EXPECT_EQ(config.terraform.binDir, "/tmp/tf");
}

TEST_F(ConfigLoaderTest, MissingFileThrowsIOException) {
    EXPECT_THROW((void)ConfigLoader::loadFromFile(tempDir_ / "absent.json"),
                 ConfigIOException);
}

TEST_F(ConfigLoaderTest, MalformedFileThrowsBadConfig) {
    auto path = writeFile("broken.json", "{\"runstep\": ");
    EXPECT_THROW((void)ConfigLoader::loadFromFile(path), BadConfigException);
}
