/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: runstep command line entry point

**************************************************/

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/config_loader.hpp"
#include "jobs/output_handler.hpp"
#include "logging/core/logging_manager.hpp"
#include "models/project_context.hpp"
#include "runtime/run_step_runner.hpp"
#include "terraform/distribution.hpp"
#include "terraform/terraform_client.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

auto loadContext(const fs::path& path) -> runstep::models::ProjectContext {
    std::ifstream ifs(path);
    if (!ifs) {
        THROW_CONFIG_IO_EXCEPTION("Failed to open context file: ", path.string());
    }
    auto document = nlohmann::json::parse(ifs);
    return runstep::models::ProjectContext::fromJson(document);
}

auto buildTerraformClient(const runstep::config::TerraformConfig& config)
    -> std::shared_ptr<runstep::terraform::DefaultTerraformClient> {
    runstep::terraform::TerraformClientOptions options;
    options.binDir = config.binDir;
    options.downloadUrl = config.downloadUrl;
    options.allowDownloads = config.allowDownloads;
    options.defaultVersion = config.version();
    return std::make_shared<runstep::terraform::DefaultTerraformClient>(
        std::move(options));
}

}  // namespace

int main(int argc, char* argv[]) {
    atom::utils::ArgumentParser program("runstep"s);

    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "runstep.json"s, "Path to the config file", {"c"});
    program.addArgument("context", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Path to the project context JSON file",
                        {"x"});
    program.addArgument("command", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Command to run", {"e"});
    program.addArgument("dir", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "."s, "Directory the command runs in", {"d"});
    program.addArgument("mode", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "show"s,
                        "Output post-processing (show/hide/strip_refreshing)",
                        {"m"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("Runs a custom workflow step for a terraform project:");
    program.addEpilog("End.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    auto& loggingManager = runstep::logging::LoggingManager::getInstance();

    runstep::config::RunstepConfig config;
    runstep::models::ProjectContext ctx;
    std::string command;
    std::string dir;
    runstep::runtime::PostProcessRunOutput mode{};

    try {
        fs::path configPath = program.get<std::string>("config").value_or("runstep.json"s);
        if (fs::exists(configPath)) {
            config = runstep::config::ConfigLoader::loadFromFile(configPath);
        } else {
            spdlog::warn("No configuration file at {}, using defaults",
                         configPath.string());
        }

        if (auto level = program.get<std::string>("log-level");
            level && !level->empty()) {
            config.logging.consoleLevel = *level;
        }
        loggingManager.initialize(config.logging);

        auto contextPath = program.get<std::string>("context").value_or(""s);
        if (!contextPath.empty()) {
            ctx = loadContext(contextPath);
        }
        ctx.log = loggingManager.getLogger("runstep.step");

        command = program.get<std::string>("command").value_or(""s);
        dir = fs::absolute(program.get<std::string>("dir").value_or("."s)).string();

        auto modeName = program.get<std::string>("mode").value_or("show"s);
        auto parsedMode = runstep::runtime::postProcessRunOutputFromString(modeName);
        if (!parsedMode) {
            THROW_INVALID_ARGUMENT("Unknown output mode: ", modeName);
        }
        mode = *parsedMode;
    } catch (const runstep::config::ConfigValidationException& e) {
        spdlog::error("Configuration validation failed:\n{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start: {}", e.what());
        return 1;
    }

    auto outputHandler = std::make_shared<runstep::jobs::ProjectCommandOutputHandler>();
    outputHandler->registerReceiver(
        ctx.runId(), "stdout", [](std::string_view line, bool complete) {
            if (!complete) {
                std::cout << line << std::flush;
            }
        });

    runstep::runtime::RunStepRunnerOptions options;
    options.defaultDistribution = runstep::terraform::Distribution::fromName(
        config.terraform.defaultDistribution);
    options.defaultVersion = config.terraform.version();
    options.terraformBinDir = fs::absolute(config.terraform.binDir).string();
    if (const char* path = std::getenv("PATH")) {
        options.inheritedPath = path;
    }
    options.shell = config.shell.commandShell();
    options.inheritEnvironment = config.shell.inheritEnvironment;

    runstep::runtime::RunStepRunner runner(buildTerraformClient(config.terraform),
                                           std::move(options), outputHandler);

    bool stream = config.shell.streamOutput;
    auto result = runner.run(ctx, std::nullopt, command, dir, {}, stream, mode);

    int exitCode = 0;
    if (result) {
        if (!stream) {
            std::cout << *result;
        }
    } else {
        std::cerr << result.error().message() << std::endl;
        exitCode = result.error().exitCode.value_or(1);
    }

    loggingManager.flush();
    loggingManager.shutdown();
    return exitCode;
}
