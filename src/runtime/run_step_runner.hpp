/*
 * run_step_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Custom run step execution

**************************************************/

#ifndef RUNSTEP_RUNTIME_RUN_STEP_RUNNER_HPP
#define RUNSTEP_RUNTIME_RUN_STEP_RUNNER_HPP

#include <memory>
#include <optional>
#include <string>

#include "jobs/output_handler.hpp"
#include "models/project_context.hpp"
#include "terraform/distribution.hpp"
#include "terraform/terraform_client.hpp"
#include "terraform/version.hpp"
#include "types.hpp"

namespace runstep::runtime {

/**
 * @brief Process-wide defaults of the run step runner
 */
struct RunStepRunnerOptions {
    terraform::Distribution defaultDistribution{
        terraform::DistributionKind::Terraform};
    std::optional<terraform::Version> defaultVersion;
    std::string terraformBinDir;
    std::string inheritedPath;       ///< Appended to PATH after terraformBinDir
    CommandShell shell;              ///< Used when a step names no shell
    bool inheritEnvironment{false};  ///< Pass the engine's environment through
};

/**
 * @brief Runs a user-defined shell command as a step of a project workflow.
 *
 * The effective distribution and version are ensured once, the step
 * environment is derived from the context and the command runs in `path`.
 * Safe to share between threads; each call spawns its own process.
 */
class RunStepRunner {
public:
    RunStepRunner(std::shared_ptr<terraform::ITerraformClient> terraformClient,
                  RunStepRunnerOptions options,
                  std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler);

    /**
     * @brief Execute one run step
     *
     * @param ctx Project context of the step
     * @param shell Interpreter, nullopt for the configured default
     * @param command Command text, "" is a successful no-op
     * @param path Existing directory the command runs in
     * @param envs Extra variables, overridden by the derived ones
     * @param streamOutput Forward output lines to the output handler
     * @param postProcess What to return on success
     * @return Post-processed output or the failure
     */
    auto run(const models::ProjectContext& ctx,
             const std::optional<CommandShell>& shell, const std::string& command,
             const std::string& path, const EnvMap& envs, bool streamOutput,
             PostProcessRunOutput postProcess) -> RunResult<std::string>;

    [[nodiscard]] auto options() const noexcept -> const RunStepRunnerOptions& {
        return options_;
    }

private:
    auto effectiveDistribution(const models::ProjectContext& ctx) const
        -> terraform::Distribution;
    auto effectiveVersion(const models::ProjectContext& ctx) const
        -> std::optional<terraform::Version>;
    auto childEnvironment(EnvMap derived) const -> EnvMap;

    std::shared_ptr<terraform::ITerraformClient> terraformClient_;
    RunStepRunnerOptions options_;
    std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler_;
};

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_RUN_STEP_RUNNER_HPP
