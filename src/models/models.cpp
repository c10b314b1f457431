/*
 * models.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "models.hpp"

namespace runstep::models {

auto vcsHostTypeToString(VcsHostType type) -> std::string_view {
    switch (type) {
        case VcsHostType::Github: return "Github";
        case VcsHostType::Gitlab: return "Gitlab";
        case VcsHostType::BitbucketCloud: return "BitbucketCloud";
        case VcsHostType::BitbucketServer: return "BitbucketServer";
        case VcsHostType::AzureDevops: return "AzureDevops";
        case VcsHostType::Gitea: return "Gitea";
    }
    return "Github";
}

auto vcsHostTypeFromString(std::string_view name) -> VcsHostType {
    if (name == "Gitlab") return VcsHostType::Gitlab;
    if (name == "BitbucketCloud") return VcsHostType::BitbucketCloud;
    if (name == "BitbucketServer") return VcsHostType::BitbucketServer;
    if (name == "AzureDevops") return VcsHostType::AzureDevops;
    if (name == "Gitea") return VcsHostType::Gitea;
    return VcsHostType::Github;
}

auto Repo::fromFullName(std::string_view fullName, VcsHost host) -> Repo {
    Repo repo;
    repo.fullName = std::string(fullName);
    repo.vcsHost = std::move(host);

    auto slash = fullName.rfind('/');
    if (slash == std::string_view::npos) {
        repo.name = std::string(fullName);
        return repo;
    }
    repo.owner = std::string(fullName.substr(0, slash));
    repo.name = std::string(fullName.substr(slash + 1));
    return repo;
}

auto Repo::toJson() const -> nlohmann::json {
    return {{"fullName", fullName},
            {"owner", owner},
            {"name", name},
            {"cloneUrl", cloneUrl},
            {"vcsHost",
             {{"hostname", vcsHost.hostname},
              {"type", vcsHostTypeToString(vcsHost.type)}}}};
}

auto Repo::fromJson(const nlohmann::json& j) -> Repo {
    Repo repo;
    repo.owner = j.value("owner", "");
    repo.name = j.value("name", "");
    repo.fullName = j.value("fullName", "");
    if (repo.fullName.empty() && !repo.name.empty()) {
        repo.fullName = repo.owner.empty() ? repo.name : repo.owner + "/" + repo.name;
    }
    repo.cloneUrl = j.value("cloneUrl", "");
    if (j.contains("vcsHost") && j["vcsHost"].is_object()) {
        const auto& host = j["vcsHost"];
        repo.vcsHost.hostname = host.value("hostname", "");
        repo.vcsHost.type = vcsHostTypeFromString(host.value("type", "Github"));
    }
    return repo;
}

auto PullRequest::toJson() const -> nlohmann::json {
    return {{"num", num},
            {"headCommit", headCommit},
            {"url", url},
            {"headBranch", headBranch},
            {"baseBranch", baseBranch},
            {"author", author},
            {"state", state == PullRequestState::Open ? "open" : "closed"},
            {"baseRepo", baseRepo.toJson()}};
}

auto PullRequest::fromJson(const nlohmann::json& j) -> PullRequest {
    PullRequest pull;
    pull.num = j.value("num", 0);
    pull.headCommit = j.value("headCommit", "");
    pull.url = j.value("url", "");
    pull.headBranch = j.value("headBranch", "");
    pull.baseBranch = j.value("baseBranch", "");
    pull.author = j.value("author", "");
    pull.state = j.value("state", "open") == "closed" ? PullRequestState::Closed
                                                      : PullRequestState::Open;
    if (j.contains("baseRepo")) {
        pull.baseRepo = Repo::fromJson(j["baseRepo"]);
    }
    return pull;
}

auto User::toJson() const -> nlohmann::json {
    return {{"username", username}, {"teams", teams}};
}

auto User::fromJson(const nlohmann::json& j) -> User {
    User user;
    user.username = j.value("username", "");
    if (j.contains("teams") && j["teams"].is_array()) {
        user.teams = j["teams"].get<std::vector<std::string>>();
    }
    return user;
}

}  // namespace runstep::models
