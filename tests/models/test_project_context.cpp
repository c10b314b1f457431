/*
 * test_project_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "models/models.hpp"
#include "models/project_context.hpp"

using namespace runstep::models;
using runstep::terraform::Version;

class ProjectContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx_.baseRepo = Repo::fromFullName("baseowner/basename");
        ctx_.headRepo = Repo::fromFullName("headowner/headname");
        ctx_.pull.num = 2;
        ctx_.pull.headBranch = "add-feat";
        ctx_.pull.baseBranch = "main";
        ctx_.pull.headCommit = "12345abcdef";
        ctx_.pull.author = "acme";
        ctx_.user.username = "acme-user";
        ctx_.workspace = "myworkspace";
    }

    ProjectContext ctx_;
};

TEST_F(ProjectContextTest, FileNamesWithoutProject) {
    EXPECT_EQ(ctx_.planFileName(), "myworkspace.tfplan");
    EXPECT_EQ(ctx_.showResultFileName(), "myworkspace.json");
    EXPECT_EQ(ctx_.policyCheckResultFileName(), "myworkspace-policyout.json");
}

TEST_F(ProjectContextTest, FileNamesWithNestedProject) {
    ctx_.projectName = "my/project/name";
    EXPECT_EQ(ctx_.planFileName(), "my::project::name-myworkspace.tfplan");
    EXPECT_EQ(ctx_.showResultFileName(), "my::project::name-myworkspace.json");
    EXPECT_EQ(ctx_.policyCheckResultFileName(),
              "my::project::name-myworkspace-policyout.json");
}

TEST_F(ProjectContextTest, GetPlanFilename) {
    EXPECT_EQ(getPlanFilename("default", ""), "default.tfplan");
    EXPECT_EQ(getPlanFilename("staging", "app"), "app-staging.tfplan");
    EXPECT_EQ(sanitizeProjectName("a/b"), "a::b");
}

TEST_F(ProjectContextTest, RunIdDerivedFromPullAndProject) {
    ctx_.projectName = "app";
    EXPECT_EQ(ctx_.runId(), "baseowner/basename/2/app/myworkspace");

    ctx_.jobId = "job-42";
    EXPECT_EQ(ctx_.runId(), "job-42");
}

TEST_F(ProjectContextTest, LoggerFallsBackToDefault) {
    EXPECT_EQ(ctx_.logger(), spdlog::default_logger());
}

TEST_F(ProjectContextTest, JsonRoundTripKeepsOverrides) {
    ctx_.terraformDistribution = "opentofu";
    ctx_.terraformVersion = Version(1, 6, 2);
    ctx_.escapedCommentArgs = {"-target=resource1", "-target=resource2"};
    ctx_.customPolicyCheck = true;

    auto restored = ProjectContext::fromJson(ctx_.toJson());
    EXPECT_EQ(restored.baseRepo.owner, "baseowner");
    EXPECT_EQ(restored.headRepo.name, "headname");
    EXPECT_EQ(restored.pull.num, 2);
    EXPECT_EQ(restored.user.username, "acme-user");
    EXPECT_EQ(restored.terraformDistribution, "opentofu");
    EXPECT_EQ(restored.terraformVersion, Version(1, 6, 2));
    EXPECT_EQ(restored.escapedCommentArgs, ctx_.escapedCommentArgs);
    EXPECT_TRUE(restored.customPolicyCheck);
}

TEST_F(ProjectContextTest, FromJsonDefaults) {
    auto ctx = ProjectContext::fromJson(nlohmann::json::object());
    EXPECT_EQ(ctx.workspace, "default");
    EXPECT_EQ(ctx.repoRelDir, ".");
    EXPECT_FALSE(ctx.terraformDistribution.has_value());
    EXPECT_FALSE(ctx.terraformVersion.has_value());
}

TEST_F(ProjectContextTest, FromJsonRejectsBadVersion) {
    nlohmann::json j = {{"terraformVersion", "not-a-version"}};
    EXPECT_THROW(ProjectContext::fromJson(j), atom::error::InvalidArgument);
}

TEST(RepoTest, FromFullName) {
    auto repo = Repo::fromFullName("group/subgroup/project");
    EXPECT_EQ(repo.owner, "group/subgroup");
    EXPECT_EQ(repo.name, "project");
    EXPECT_EQ(repo.fullName, "group/subgroup/project");
}

TEST(RepoTest, VcsHostTypeNames) {
    EXPECT_EQ(vcsHostTypeFromString(vcsHostTypeToString(VcsHostType::Gitlab)),
              VcsHostType::Gitlab);
}
