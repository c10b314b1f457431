/*
 * distribution.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file distribution.hpp
 * @brief Terraform-compatible tool distributions
 */

#ifndef RUNSTEP_TERRAFORM_DISTRIBUTION_HPP
#define RUNSTEP_TERRAFORM_DISTRIBUTION_HPP

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "downloader.hpp"

namespace runstep::terraform {

/**
 * @brief The closed set of supported distributions
 */
enum class DistributionKind {
    Terraform,  ///< HashiCorp Terraform, binary "terraform"
    OpenTofu    ///< OpenTofu, binary "tofu"
};

/**
 * @brief Configuration name of a distribution ("terraform", "opentofu")
 */
[[nodiscard]] constexpr std::string_view distributionKindToString(
    DistributionKind kind) noexcept {
    switch (kind) {
        case DistributionKind::Terraform: return "terraform";
        case DistributionKind::OpenTofu: return "opentofu";
    }
    return "terraform";
}

/**
 * @brief Strict lookup used by configuration validation
 */
[[nodiscard]] auto distributionKindFromString(std::string_view name)
    -> std::optional<DistributionKind>;

/**
 * @brief A distribution together with the downloader that installs it
 *
 * Two distributions compare equal when they are the same kind; the
 * downloader is an installation detail.
 */
class Distribution {
public:
    explicit Distribution(DistributionKind kind,
                          std::shared_ptr<IDownloader> downloader = nullptr);

    /**
     * @brief Resolves a project's distribution name.
     *
     * "opentofu" selects OpenTofu, every other name selects Terraform.
     */
    [[nodiscard]] static auto fromName(std::string_view name,
                                       std::shared_ptr<IDownloader> downloader = nullptr)
        -> Distribution;

    [[nodiscard]] auto kind() const noexcept -> DistributionKind { return kind_; }

    /**
     * @brief Name of the executable, e.g. "terraform" or "tofu"
     */
    [[nodiscard]] auto binName() const noexcept -> std::string_view;

    /**
     * @brief Name used in configuration, e.g. "terraform" or "opentofu"
     */
    [[nodiscard]] auto name() const noexcept -> std::string_view {
        return distributionKindToString(kind_);
    }

    /**
     * @brief Default release download base URL for this distribution
     */
    [[nodiscard]] auto defaultDownloadUrl() const noexcept -> std::string_view;

    [[nodiscard]] auto downloader() const noexcept
        -> const std::shared_ptr<IDownloader>& {
        return downloader_;
    }

    [[nodiscard]] auto operator==(const Distribution& other) const noexcept
        -> bool {
        return kind_ == other.kind_;
    }

private:
    DistributionKind kind_;
    std::shared_ptr<IDownloader> downloader_;
};

auto operator<<(std::ostream& os, const Distribution& distribution)
    -> std::ostream&;

}  // namespace runstep::terraform

#endif  // RUNSTEP_TERRAFORM_DISTRIBUTION_HPP
