/*
 * downloader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file downloader.hpp
 * @brief Interface of the component that installs tool releases
 */

#ifndef RUNSTEP_TERRAFORM_DOWNLOADER_HPP
#define RUNSTEP_TERRAFORM_DOWNLOADER_HPP

#include <expected>
#include <filesystem>
#include <string>

namespace runstep::terraform {

struct Version;

/**
 * @brief Installs a release of a distribution into a bin directory.
 *
 * Fetching, verification and unpacking belong to the implementation; the
 * terraform client only decides when an install is needed.
 */
class IDownloader {
public:
    virtual ~IDownloader() = default;

    /**
     * @brief Install a version
     * @param binDir Directory the executable is placed in
     * @param downloadUrl Release base URL
     * @param version Version to install
     * @return Path of the installed executable, or an error message
     */
    virtual auto install(const std::filesystem::path& binDir,
                         const std::string& downloadUrl, const Version& version)
        -> std::expected<std::filesystem::path, std::string> = 0;
};

}  // namespace runstep::terraform

#endif  // RUNSTEP_TERRAFORM_DOWNLOADER_HPP
