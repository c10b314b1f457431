/*
 * env_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file env_builder.hpp
 * @brief Environment visible to run step commands
 */

#ifndef RUNSTEP_RUNTIME_ENV_BUILDER_HPP
#define RUNSTEP_RUNTIME_ENV_BUILDER_HPP

#include <optional>
#include <string>

#include "models/project_context.hpp"
#include "terraform/distribution.hpp"
#include "terraform/version.hpp"
#include "types.hpp"

namespace runstep::runtime {

/**
 * @brief Names of the variables every run step command can rely on
 */
namespace env {
inline constexpr std::string_view TERRAFORM_DISTRIBUTION = "ATLANTIS_TERRAFORM_DISTRIBUTION";
inline constexpr std::string_view TERRAFORM_VERSION = "ATLANTIS_TERRAFORM_VERSION";
inline constexpr std::string_view BASE_BRANCH_NAME = "BASE_BRANCH_NAME";
inline constexpr std::string_view BASE_REPO_NAME = "BASE_REPO_NAME";
inline constexpr std::string_view BASE_REPO_OWNER = "BASE_REPO_OWNER";
inline constexpr std::string_view COMMENT_ARGS = "COMMENT_ARGS";
inline constexpr std::string_view DIR = "DIR";
inline constexpr std::string_view HEAD_BRANCH_NAME = "HEAD_BRANCH_NAME";
inline constexpr std::string_view HEAD_COMMIT = "HEAD_COMMIT";
inline constexpr std::string_view HEAD_REPO_NAME = "HEAD_REPO_NAME";
inline constexpr std::string_view HEAD_REPO_OWNER = "HEAD_REPO_OWNER";
inline constexpr std::string_view PATH = "PATH";
inline constexpr std::string_view PLANFILE = "PLANFILE";
inline constexpr std::string_view POLICYCHECKFILE = "POLICYCHECKFILE";
inline constexpr std::string_view PROJECT_NAME = "PROJECT_NAME";
inline constexpr std::string_view PULL_AUTHOR = "PULL_AUTHOR";
inline constexpr std::string_view PULL_NUM = "PULL_NUM";
inline constexpr std::string_view PULL_URL = "PULL_URL";
inline constexpr std::string_view REPO_REL_DIR = "REPO_REL_DIR";
inline constexpr std::string_view SHOWFILE = "SHOWFILE";
inline constexpr std::string_view USER_NAME = "USER_NAME";
inline constexpr std::string_view WORKSPACE = "WORKSPACE";
}  // namespace env

/**
 * @brief Builds the environment of a run step.
 *
 * Construction captures the tool bin directory and the PATH the commands
 * inherit; build() is a pure function of its arguments.
 */
class EnvironmentBuilder {
public:
    /**
     * @param terraformBinDir Directory holding the ensured tool binaries
     * @param inheritedPath PATH of the engine process
     */
    EnvironmentBuilder(std::string terraformBinDir, std::string inheritedPath);

    /**
     * @brief Compute the variables of one run step.
     *
     * Caller variables are applied first and the derived variables last, so a
     * caller cannot replace WORKSPACE, PLANFILE, PATH and the like.
     *
     * @param ctx Project context of the run
     * @param path Directory the command runs in
     * @param distribution Effective distribution
     * @param version Effective version, unset renders as ""
     * @param extraEnvs Caller-supplied variables
     */
    [[nodiscard]] auto build(const models::ProjectContext& ctx,
                             const std::string& path,
                             const terraform::Distribution& distribution,
                             const std::optional<terraform::Version>& version,
                             const EnvMap& extraEnvs) const -> EnvMap;

    /**
     * @brief Value of PATH handed to commands: "{binDir}:{inherited}"
     */
    [[nodiscard]] auto pathValue() const -> std::string;

    [[nodiscard]] auto terraformBinDir() const noexcept -> const std::string& {
        return terraformBinDir_;
    }

private:
    std::string terraformBinDir_;
    std::string inheritedPath_;
};

/**
 * @brief Join with a separator
 */
[[nodiscard]] auto joinStrings(const std::vector<std::string>& parts,
                               std::string_view separator) -> std::string;

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_ENV_BUILDER_HPP
