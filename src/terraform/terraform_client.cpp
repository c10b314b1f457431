/*
 * terraform_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "terraform_client.hpp"

#include <cstdlib>
#include <format>

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace runstep::terraform {

namespace fs = std::filesystem;

auto lookPath(const std::string& file, const std::string& pathList)
    -> std::optional<fs::path> {
    size_t start = 0;
    while (start <= pathList.size()) {
        auto colon = pathList.find(':', start);
        auto dir = pathList.substr(
            start, colon == std::string::npos ? std::string::npos : colon - start);
        // An empty entry means the current directory.
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / file;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return std::nullopt;
}

DefaultTerraformClient::DefaultTerraformClient(TerraformClientOptions options)
    : options_(std::move(options)) {}

auto DefaultTerraformClient::versionKey(const Distribution& distribution,
                                        const Version& version) -> std::string {
    return std::string(distribution.binName()) + version.toString();
}

auto DefaultTerraformClient::ensureVersion(
    const std::shared_ptr<spdlog::logger>& logger,
    const Distribution& distribution, const std::optional<Version>& version)
    -> std::expected<void, std::string> {
    auto& log = logger ? *logger : *spdlog::default_logger();

    auto effective = version ? version : options_.defaultVersion;
    if (!effective) {
        return std::unexpected(std::format(
            "no {} version requested and no default version configured",
            distribution.binName()));
    }

    std::lock_guard lock(mutex_);
    auto result = ensureLocked(log, distribution, *effective);
    if (!result) {
        return std::unexpected(std::format("downloading {} version {}: {}",
                                           distribution.binName(),
                                           effective->toString(), result.error()));
    }
    return {};
}

auto DefaultTerraformClient::ensureLocked(spdlog::logger& logger,
                                          const Distribution& distribution,
                                          const Version& version)
    -> std::expected<fs::path, std::string> {
    auto key = versionKey(distribution, version);
    if (auto it = versions_.find(key); it != versions_.end()) {
        return it->second;
    }

    // The version may already be on disk even though this client has not
    // seen it yet.
    const char* envPath = std::getenv("PATH");
    if (auto found = lookPath(key, envPath ? envPath : "")) {
        logger.debug("found {} on PATH at {}", key, found->string());
        versions_[key] = *found;
        return *found;
    }

    auto dest = options_.binDir / key;
    std::error_code ec;
    if (fs::exists(dest, ec)) {
        logger.debug("found {} at {}", key, dest.string());
        versions_[key] = dest;
        return dest;
    }

    if (!options_.allowDownloads) {
        return std::unexpected(std::format(
            "could not find {} version {} in PATH or {}, and downloads are disabled",
            distribution.binName(), version.toString(), options_.binDir.string()));
    }

    const auto& downloader = distribution.downloader();
    if (!downloader) {
        return std::unexpected(std::format(
            "could not find {} version {} in PATH or {}, and no downloader is configured",
            distribution.binName(), version.toString(), options_.binDir.string()));
    }

    std::string url = options_.downloadUrl.empty()
                          ? std::string(distribution.defaultDownloadUrl())
                          : options_.downloadUrl;
    logger.info("could not find {} version {} in PATH or {}, downloading from {}",
                distribution.binName(), version.toString(),
                options_.binDir.string(), url);

    auto installed = downloader->install(options_.binDir, url, version);
    if (!installed) {
        return std::unexpected(installed.error());
    }

    logger.info("downloaded {} {} to {}", distribution.binName(),
                version.toString(), installed->string());
    versions_[key] = *installed;
    return *installed;
}

auto DefaultTerraformClient::binaryPath(const Distribution& distribution,
                                        const Version& version) const
    -> std::optional<fs::path> {
    std::lock_guard lock(mutex_);
    if (auto it = versions_.find(versionKey(distribution, version));
        it != versions_.end()) {
        return it->second;
    }
    return std::nullopt;
}

}  // namespace runstep::terraform
