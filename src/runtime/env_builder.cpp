/*
 * env_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "env_builder.hpp"

#include <filesystem>

namespace runstep::runtime {

auto joinStrings(const std::vector<std::string>& parts,
                 std::string_view separator) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

EnvironmentBuilder::EnvironmentBuilder(std::string terraformBinDir,
                                       std::string inheritedPath)
    : terraformBinDir_(std::move(terraformBinDir)),
      inheritedPath_(std::move(inheritedPath)) {}

auto EnvironmentBuilder::pathValue() const -> std::string {
    return terraformBinDir_ + ":" + inheritedPath_;
}

auto EnvironmentBuilder::build(const models::ProjectContext& ctx,
                               const std::string& path,
                               const terraform::Distribution& distribution,
                               const std::optional<terraform::Version>& version,
                               const EnvMap& extraEnvs) const -> EnvMap {
    namespace fs = std::filesystem;

    EnvMap result = extraEnvs;

    auto set = [&result](std::string_view key, std::string value) {
        result[std::string(key)] = std::move(value);
    };

    set(env::TERRAFORM_DISTRIBUTION, std::string(distribution.binName()));
    set(env::TERRAFORM_VERSION, version ? version->toString() : "");
    set(env::BASE_BRANCH_NAME, ctx.pull.baseBranch);
    set(env::BASE_REPO_NAME, ctx.baseRepo.name);
    set(env::BASE_REPO_OWNER, ctx.baseRepo.owner);
    set(env::COMMENT_ARGS, joinStrings(ctx.escapedCommentArgs, " "));
    set(env::DIR, path);
    set(env::HEAD_BRANCH_NAME, ctx.pull.headBranch);
    set(env::HEAD_COMMIT, ctx.pull.headCommit);
    set(env::HEAD_REPO_NAME, ctx.headRepo.name);
    set(env::HEAD_REPO_OWNER, ctx.headRepo.owner);
    set(env::PATH, pathValue());
    set(env::PLANFILE, (fs::path(path) / ctx.planFileName()).string());
    set(env::POLICYCHECKFILE,
        (fs::path(path) / ctx.policyCheckResultFileName()).string());
    set(env::PROJECT_NAME, ctx.projectName);
    set(env::PULL_AUTHOR, ctx.pull.author);
    set(env::PULL_NUM, std::to_string(ctx.pull.num));
    set(env::PULL_URL, ctx.pull.url);
    set(env::REPO_REL_DIR, ctx.repoRelDir);
    set(env::SHOWFILE, (fs::path(path) / ctx.showResultFileName()).string());
    set(env::USER_NAME, ctx.user.username);
    set(env::WORKSPACE, ctx.workspace);

    return result;
}

}  // namespace runstep::runtime
