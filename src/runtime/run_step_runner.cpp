/*
 * run_step_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "run_step_runner.hpp"

#include <string_view>

#include <spdlog/spdlog.h>

#include "env_builder.hpp"
#include "output_processing.hpp"
#include "shell_command_runner.hpp"

extern char** environ;

namespace runstep::runtime {

RunStepRunner::RunStepRunner(
    std::shared_ptr<terraform::ITerraformClient> terraformClient,
    RunStepRunnerOptions options,
    std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler)
    : terraformClient_(std::move(terraformClient)),
      options_(std::move(options)),
      outputHandler_(std::move(outputHandler)) {
    if (!outputHandler_) {
        outputHandler_ = std::make_shared<jobs::NoopProjectCommandOutputHandler>();
    }
}

auto RunStepRunner::effectiveDistribution(const models::ProjectContext& ctx) const
    -> terraform::Distribution {
    if (ctx.terraformDistribution) {
        return terraform::Distribution::fromName(
            *ctx.terraformDistribution, options_.defaultDistribution.downloader());
    }
    return options_.defaultDistribution;
}

auto RunStepRunner::effectiveVersion(const models::ProjectContext& ctx) const
    -> std::optional<terraform::Version> {
    if (ctx.terraformVersion) {
        return ctx.terraformVersion;
    }
    return options_.defaultVersion;
}

auto RunStepRunner::childEnvironment(EnvMap derived) const -> EnvMap {
    if (!options_.inheritEnvironment) {
        return derived;
    }
    EnvMap result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view var(*entry);
        auto eq = var.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        result.emplace(std::string(var.substr(0, eq)),
                       std::string(var.substr(eq + 1)));
    }
    for (auto& [key, value] : derived) {
        result[key] = std::move(value);
    }
    return result;
}

auto RunStepRunner::run(const models::ProjectContext& ctx,
                        const std::optional<CommandShell>& shell,
                        const std::string& command, const std::string& path,
                        const EnvMap& envs, bool streamOutput,
                        PostProcessRunOutput postProcess)
    -> RunResult<std::string> {
    auto logger = ctx.logger();
    auto distribution = effectiveDistribution(ctx);
    auto version = effectiveVersion(ctx);

    if (auto ensured = terraformClient_->ensureVersion(logger, distribution, version);
        !ensured) {
        logger->debug("ensuring {} {} failed: {}", distribution.binName(),
                      version ? version->toString() : "default", ensured.error());
        return std::unexpected(RunStepError::resolutionFailure(ensured.error()));
    }

    EnvironmentBuilder builder(options_.terraformBinDir, options_.inheritedPath);
    auto env = childEnvironment(builder.build(ctx, path, distribution, version, envs));

    ShellCommandRunner runner(shell.value_or(options_.shell), command,
                              std::move(env), path, streamOutput, outputHandler_);
    auto output = runner.run(ctx);

    if (streamOutput) {
        try {
            outputHandler_->send(ctx, "", true);
        } catch (const std::exception& e) {
            logger->warn("output handler failed to complete {}: {}", ctx.runId(),
                         e.what());
        }
    }

    if (!output) {
        // Policy check failures are reported by the policy check itself.
        if (!ctx.customPolicyCheck) {
            logger->debug("error: {}", output.error().message());
        }
        return std::unexpected(output.error());
    }

    return postProcessOutput(postProcess, std::move(*output), version);
}

}  // namespace runstep::runtime
