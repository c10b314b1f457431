/*
 * project_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file project_context.hpp
 * @brief Per-run description of the project and triggering event
 */

#ifndef RUNSTEP_MODELS_PROJECT_CONTEXT_HPP
#define RUNSTEP_MODELS_PROJECT_CONTEXT_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "models.hpp"
#include "terraform/version.hpp"

namespace runstep::models {

/// Replacement for "/" in project names used inside file names.
inline constexpr std::string_view PLANFILE_SLASH_REPLACE = "::";

/**
 * @brief Workflow command a run step belongs to
 */
enum class CommandName { Plan, Apply, PolicyCheck, ApprovePolicies, Import, StateRm, Version };

[[nodiscard]] auto commandNameToString(CommandName name) -> std::string_view;
[[nodiscard]] auto commandNameFromString(std::string_view name) -> CommandName;

/**
 * @brief Everything a run step knows about its project and trigger.
 *
 * Built by the caller once per run step and never mutated afterwards.
 */
struct ProjectContext {
    CommandName commandName{CommandName::Plan};
    Repo baseRepo;
    Repo headRepo;
    PullRequest pull;
    User user;

    std::shared_ptr<spdlog::logger> log;  ///< Logger of this run

    std::string workspace{"default"};
    std::string repoRelDir{"."};
    std::string projectName;              ///< May be empty or contain "/"

    std::optional<std::string> terraformDistribution;  ///< Unset = default
    std::optional<terraform::Version> terraformVersion;  ///< Unset = default

    std::vector<std::string> escapedCommentArgs;
    bool customPolicyCheck{false};

    std::string jobId;  ///< Output stream id, empty = derived

    /**
     * @brief Plan file name for this project and workspace
     */
    [[nodiscard]] auto planFileName() const -> std::string;

    /**
     * @brief File name of the JSON rendering of the plan
     */
    [[nodiscard]] auto showResultFileName() const -> std::string;

    /**
     * @brief File name of the policy check output
     */
    [[nodiscard]] auto policyCheckResultFileName() const -> std::string;

    /**
     * @brief Identifier of the output stream of this run
     *
     * jobId when set, otherwise repo/pull/project/workspace.
     */
    [[nodiscard]] auto runId() const -> std::string;

    /**
     * @brief Logger of the run, or spdlog's default logger
     */
    [[nodiscard]] auto logger() const -> std::shared_ptr<spdlog::logger>;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Read a context from JSON
     * @throws atom::error::InvalidArgument on an unparseable terraformVersion
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> ProjectContext;
};

/**
 * @brief Plan file name: "{workspace}.tfplan" or "{project}-{workspace}.tfplan"
 *
 * Every "/" in the project name is replaced by "::".
 */
[[nodiscard]] auto getPlanFilename(std::string_view workspace,
                                   std::string_view projectName) -> std::string;

/**
 * @brief Project name with every "/" replaced by "::"
 */
[[nodiscard]] auto sanitizeProjectName(std::string_view projectName)
    -> std::string;

}  // namespace runstep::models

#endif  // RUNSTEP_MODELS_PROJECT_CONTEXT_HPP
