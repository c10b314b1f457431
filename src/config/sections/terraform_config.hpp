/*
 * terraform_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Default terraform distribution and version installation

**************************************************/

#ifndef RUNSTEP_CONFIG_SECTIONS_TERRAFORM_CONFIG_HPP
#define RUNSTEP_CONFIG_SECTIONS_TERRAFORM_CONFIG_HPP

#include <optional>
#include <string>

#include "../core/config_section.hpp"
#include "terraform/distribution.hpp"
#include "terraform/version.hpp"

namespace runstep::config {

/**
 * @brief Process-wide terraform defaults
 *
 * @example
 * ```json
 * "terraform": {
 *   "defaultDistribution": "opentofu",
 *   "defaultVersion": "1.6.2",
 *   "binDir": "/var/lib/runstep/bin",
 *   "allowDownloads": false
 * }
 * ```
 */
struct TerraformConfig : ConfigSection<TerraformConfig> {
    static constexpr std::string_view PATH = "/runstep/terraform";

    std::string defaultDistribution{"terraform"};  ///< "terraform" or "opentofu"
    std::string defaultVersion;                    ///< Empty = none configured
    std::string binDir{"bin"};                     ///< Installed binaries
    std::string downloadUrl;                       ///< Empty = distribution default
    bool allowDownloads{true};

    [[nodiscard]] json serialize() const {
        return {{"defaultDistribution", defaultDistribution},
                {"defaultVersion", defaultVersion},
                {"binDir", binDir},
                {"downloadUrl", downloadUrl},
                {"allowDownloads", allowDownloads}};
    }

    [[nodiscard]] static TerraformConfig deserialize(const json& j) {
        TerraformConfig cfg;
        cfg.defaultDistribution =
            j.value("defaultDistribution", cfg.defaultDistribution);
        cfg.defaultVersion = j.value("defaultVersion", cfg.defaultVersion);
        cfg.binDir = j.value("binDir", cfg.binDir);
        cfg.downloadUrl = j.value("downloadUrl", cfg.downloadUrl);
        cfg.allowDownloads = j.value("allowDownloads", cfg.allowDownloads);
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        auto distribution = property("string", "terraform");
        distribution["enum"] = json::array({"terraform", "opentofu"});
        return {{"type", "object"},
                {"properties",
                 {{"defaultDistribution", distribution},
                  {"defaultVersion",
                   property("string", "", "Version used when a project sets none")},
                  {"binDir", property("string", "bin")},
                  {"downloadUrl", property("string", "")},
                  {"allowDownloads", property("boolean", true)}}}};
    }

    [[nodiscard]] ConfigValidationResult check() const {
        ConfigValidationResult result;
        if (!terraform::distributionKindFromString(defaultDistribution)) {
            result.addError(keyPath("defaultDistribution"),
                            "unknown distribution \"" + defaultDistribution + "\"");
        }
        if (!defaultVersion.empty() &&
            !terraform::Version::tryParse(defaultVersion)) {
            result.addError(keyPath("defaultVersion"),
                            "invalid version \"" + defaultVersion + "\"");
        }
        if (binDir.empty()) {
            result.addError(keyPath("binDir"), "must not be empty");
        }
        return result;
    }

    /**
     * @brief Parsed defaultVersion, nullopt when empty
     */
    [[nodiscard]] std::optional<terraform::Version> version() const {
        if (defaultVersion.empty()) {
            return std::nullopt;
        }
        return terraform::Version::parse(defaultVersion);
    }
};

}  // namespace runstep::config

#endif  // RUNSTEP_CONFIG_SECTIONS_TERRAFORM_CONFIG_HPP
