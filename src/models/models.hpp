/*
 * models.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file models.hpp
 * @brief Repository, pull request and user value types
 */

#ifndef RUNSTEP_MODELS_MODELS_HPP
#define RUNSTEP_MODELS_MODELS_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace runstep::models {

/**
 * @brief Supported VCS host types
 */
enum class VcsHostType { Github, Gitlab, BitbucketCloud, BitbucketServer, AzureDevops, Gitea };

[[nodiscard]] auto vcsHostTypeToString(VcsHostType type) -> std::string_view;

/**
 * @brief Converts a host type name, falling back to Github for unknown names
 */
[[nodiscard]] auto vcsHostTypeFromString(std::string_view name) -> VcsHostType;

/**
 * @brief The VCS host a repository lives on
 */
struct VcsHost {
    std::string hostname;                 ///< e.g. github.com
    VcsHostType type{VcsHostType::Github};
};

/**
 * @brief A VCS repository
 */
struct Repo {
    std::string fullName;  ///< owner/name
    std::string owner;     ///< Owner (user, organization or group path)
    std::string name;      ///< Repository name without owner
    std::string cloneUrl;  ///< Clone URL, may embed credentials
    VcsHost vcsHost;

    /**
     * @brief Builds a repo from a full name of the form owner/name
     *
     * Nested owners (gitlab subgroups) keep every segment but the last.
     */
    [[nodiscard]] static auto fromFullName(std::string_view fullName,
                                           VcsHost host = {}) -> Repo;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> Repo;
};

enum class PullRequestState { Open, Closed };

/**
 * @brief A pull (or merge) request
 */
struct PullRequest {
    int num{0};
    std::string headCommit;
    std::string url;
    std::string headBranch;
    std::string baseBranch;
    std::string author;
    PullRequestState state{PullRequestState::Open};
    Repo baseRepo;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> PullRequest;
};

/**
 * @brief The user that triggered a command
 */
struct User {
    std::string username;
    std::vector<std::string> teams;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> User;
};

}  // namespace runstep::models

#endif  // RUNSTEP_MODELS_MODELS_HPP
