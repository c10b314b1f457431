/*
 * terraform_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file terraform_client.hpp
 * @brief Ensures terraform/tofu versions are installed before use
 */

#ifndef RUNSTEP_TERRAFORM_TERRAFORM_CLIENT_HPP
#define RUNSTEP_TERRAFORM_TERRAFORM_CLIENT_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <spdlog/logger.h>

#include "distribution.hpp"
#include "version.hpp"

namespace runstep::terraform {

/**
 * @brief The "ensure version" capability used by run steps
 */
class ITerraformClient {
public:
    virtual ~ITerraformClient() = default;

    /**
     * @brief Make sure a version of a distribution is installed.
     *
     * Must be idempotent: calling it for an installed version is cheap.
     *
     * @param logger Logger of the calling run
     * @param distribution Distribution to install
     * @param version Version to install, nullopt for the client's default
     * @return Empty on success, the error message otherwise
     */
    virtual auto ensureVersion(const std::shared_ptr<spdlog::logger>& logger,
                               const Distribution& distribution,
                               const std::optional<Version>& version)
        -> std::expected<void, std::string> = 0;
};

/**
 * @brief Options of the default client
 */
struct TerraformClientOptions {
    std::filesystem::path binDir;          ///< Where downloaded binaries live
    std::string downloadUrl;               ///< Empty = distribution default
    bool allowDownloads{true};             ///< Download missing versions
    std::optional<Version> defaultVersion; ///< Used when no version is given
};

/**
 * @brief Default ITerraformClient.
 *
 * Looks for "<bin><version>" (e.g. terraform1.5.7) on PATH and in the bin
 * directory before asking the distribution's downloader for it. Resolved
 * paths are remembered for the lifetime of the client.
 */
class DefaultTerraformClient : public ITerraformClient {
public:
    explicit DefaultTerraformClient(TerraformClientOptions options);

    auto ensureVersion(const std::shared_ptr<spdlog::logger>& logger,
                       const Distribution& distribution,
                       const std::optional<Version>& version)
        -> std::expected<void, std::string> override;

    /**
     * @brief Path of an already ensured binary
     */
    [[nodiscard]] auto binaryPath(const Distribution& distribution,
                                  const Version& version) const
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto options() const noexcept -> const TerraformClientOptions& {
        return options_;
    }

private:
    auto ensureLocked(spdlog::logger& logger, const Distribution& distribution,
                      const Version& version)
        -> std::expected<std::filesystem::path, std::string>;

    static auto versionKey(const Distribution& distribution,
                           const Version& version) -> std::string;

    TerraformClientOptions options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::filesystem::path> versions_;
};

/**
 * @brief Search a PATH-style list of directories for an executable
 */
[[nodiscard]] auto lookPath(const std::string& file, const std::string& pathList)
    -> std::optional<std::filesystem::path>;

}  // namespace runstep::terraform

#endif  // RUNSTEP_TERRAFORM_TERRAFORM_CLIENT_HPP
