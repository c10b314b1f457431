/*
 * env_step_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "env_step_runner.hpp"

namespace runstep::runtime {

EnvStepRunner::EnvStepRunner(std::shared_ptr<RunStepRunner> runStepRunner)
    : runStepRunner_(std::move(runStepRunner)) {}

auto EnvStepRunner::run(const models::ProjectContext& ctx,
                        const std::optional<CommandShell>& shell,
                        const std::string& command, const std::string& value,
                        const std::string& path, const EnvMap& envs)
    -> RunResult<std::string> {
    if (!value.empty()) {
        return value;
    }

    auto output = runStepRunner_->run(ctx, shell, command, path, envs, false,
                                      PostProcessRunOutput::Show);
    if (!output) {
        return output;
    }

    auto end = output->find_last_not_of(" \t\n\r\f\v");
    output->erase(end == std::string::npos ? 0 : end + 1);
    return output;
}

}  // namespace runstep::runtime
