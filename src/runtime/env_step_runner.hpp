/*
 * env_step_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef RUNSTEP_RUNTIME_ENV_STEP_RUNNER_HPP
#define RUNSTEP_RUNTIME_ENV_STEP_RUNNER_HPP

#include <memory>
#include <optional>
#include <string>

#include "run_step_runner.hpp"

namespace runstep::runtime {

/**
 * @brief Computes the value of an `env` workflow step
 */
class EnvStepRunner {
public:
    explicit EnvStepRunner(std::shared_ptr<RunStepRunner> runStepRunner);

    /**
     * @brief Static value if non-empty, else the trimmed output of command
     */
    auto run(const models::ProjectContext& ctx,
             const std::optional<CommandShell>& shell, const std::string& command,
             const std::string& value, const std::string& path,
             const EnvMap& envs) -> RunResult<std::string>;

private:
    std::shared_ptr<RunStepRunner> runStepRunner_;
};

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_ENV_STEP_RUNNER_HPP
