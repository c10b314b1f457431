/*
 * distribution.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "distribution.hpp"

#include <ostream>

namespace runstep::terraform {

auto distributionKindFromString(std::string_view name)
    -> std::optional<DistributionKind> {
    if (name == "terraform") return DistributionKind::Terraform;
    if (name == "opentofu") return DistributionKind::OpenTofu;
    return std::nullopt;
}

Distribution::Distribution(DistributionKind kind,
                           std::shared_ptr<IDownloader> downloader)
    : kind_(kind), downloader_(std::move(downloader)) {}

auto Distribution::fromName(std::string_view name,
                            std::shared_ptr<IDownloader> downloader)
    -> Distribution {
    if (name == "opentofu") {
        return Distribution(DistributionKind::OpenTofu, std::move(downloader));
    }
    return Distribution(DistributionKind::Terraform, std::move(downloader));
}

auto Distribution::binName() const noexcept -> std::string_view {
    switch (kind_) {
        case DistributionKind::Terraform: return "terraform";
        case DistributionKind::OpenTofu: return "tofu";
    }
    return "terraform";
}

auto Distribution::defaultDownloadUrl() const noexcept -> std::string_view {
    switch (kind_) {
        case DistributionKind::Terraform: return "https://releases.hashicorp.com";
        case DistributionKind::OpenTofu: return "https://get.opentofu.org";
    }
    return "https://releases.hashicorp.com";
}

auto operator<<(std::ostream& os, const Distribution& distribution)
    -> std::ostream& {
    return os << distribution.name();
}

}  // namespace runstep::terraform
