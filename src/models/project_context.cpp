/*
 * project_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "project_context.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace runstep::models {

auto commandNameToString(CommandName name) -> std::string_view {
    switch (name) {
        case CommandName::Plan: return "plan";
        case CommandName::Apply: return "apply";
        case CommandName::PolicyCheck: return "policy_check";
        case CommandName::ApprovePolicies: return "approve_policies";
        case CommandName::Import: return "import";
        case CommandName::StateRm: return "state rm";
        case CommandName::Version: return "version";
    }
    return "plan";
}

auto commandNameFromString(std::string_view name) -> CommandName {
    if (name == "apply") return CommandName::Apply;
    if (name == "policy_check") return CommandName::PolicyCheck;
    if (name == "approve_policies") return CommandName::ApprovePolicies;
    if (name == "import") return CommandName::Import;
    if (name == "state rm") return CommandName::StateRm;
    if (name == "version") return CommandName::Version;
    return CommandName::Plan;
}

auto sanitizeProjectName(std::string_view projectName) -> std::string {
    std::string result;
    result.reserve(projectName.size());
    for (char c : projectName) {
        if (c == '/') {
            result += PLANFILE_SLASH_REPLACE;
        } else {
            result += c;
        }
    }
    return result;
}

auto getPlanFilename(std::string_view workspace, std::string_view projectName)
    -> std::string {
    if (projectName.empty()) {
        return std::format("{}.tfplan", workspace);
    }
    return std::format("{}-{}.tfplan", sanitizeProjectName(projectName),
                       workspace);
}

auto ProjectContext::planFileName() const -> std::string {
    return getPlanFilename(workspace, projectName);
}

auto ProjectContext::showResultFileName() const -> std::string {
    if (projectName.empty()) {
        return std::format("{}.json", workspace);
    }
    return std::format("{}-{}.json", sanitizeProjectName(projectName), workspace);
}

auto ProjectContext::policyCheckResultFileName() const -> std::string {
    if (projectName.empty()) {
        return std::format("{}-policyout.json", workspace);
    }
    return std::format("{}-{}-policyout.json", sanitizeProjectName(projectName),
                       workspace);
}

auto ProjectContext::runId() const -> std::string {
    if (!jobId.empty()) {
        return jobId;
    }
    return std::format("{}/{}/{}/{}", baseRepo.fullName, pull.num, projectName,
                       workspace);
}

auto ProjectContext::logger() const -> std::shared_ptr<spdlog::logger> {
    return log ? log : spdlog::default_logger();
}

auto ProjectContext::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"commandName", commandNameToString(commandName)},
                        {"baseRepo", baseRepo.toJson()},
                        {"headRepo", headRepo.toJson()},
                        {"pull", pull.toJson()},
                        {"user", user.toJson()},
                        {"workspace", workspace},
                        {"repoRelDir", repoRelDir},
                        {"projectName", projectName},
                        {"escapedCommentArgs", escapedCommentArgs},
                        {"customPolicyCheck", customPolicyCheck},
                        {"jobId", jobId}};
    if (terraformDistribution) {
        j["terraformDistribution"] = *terraformDistribution;
    }
    if (terraformVersion) {
        j["terraformVersion"] = terraformVersion->toString();
    }
    return j;
}

auto ProjectContext::fromJson(const nlohmann::json& j) -> ProjectContext {
    ProjectContext ctx;
    ctx.commandName = commandNameFromString(j.value("commandName", "plan"));
    if (j.contains("baseRepo")) {
        ctx.baseRepo = Repo::fromJson(j["baseRepo"]);
    }
    if (j.contains("headRepo")) {
        ctx.headRepo = Repo::fromJson(j["headRepo"]);
    }
    if (j.contains("pull")) {
        ctx.pull = PullRequest::fromJson(j["pull"]);
    }
    if (j.contains("user")) {
        ctx.user = User::fromJson(j["user"]);
    }
    ctx.workspace = j.value("workspace", ctx.workspace);
    ctx.repoRelDir = j.value("repoRelDir", ctx.repoRelDir);
    ctx.projectName = j.value("projectName", "");
    if (j.contains("terraformDistribution") &&
        j["terraformDistribution"].is_string()) {
        ctx.terraformDistribution = j["terraformDistribution"].get<std::string>();
    }
    if (j.contains("terraformVersion") && j["terraformVersion"].is_string()) {
        ctx.terraformVersion =
            terraform::Version::parse(j["terraformVersion"].get<std::string>());
    }
    if (j.contains("escapedCommentArgs") && j["escapedCommentArgs"].is_array()) {
        ctx.escapedCommentArgs =
            j["escapedCommentArgs"].get<std::vector<std::string>>();
    }
    ctx.customPolicyCheck = j.value("customPolicyCheck", false);
    ctx.jobId = j.value("jobId", "");
    return ctx;
}

}  // namespace runstep::models
