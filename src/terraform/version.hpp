/*
 * version.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file version.hpp
 * @brief Terraform/OpenTofu version numbers
 */

#ifndef RUNSTEP_TERRAFORM_VERSION_HPP
#define RUNSTEP_TERRAFORM_VERSION_HPP

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "atom/error/exception.hpp"

namespace runstep::terraform {

/**
 * @brief A tool version in the relaxed semantic form accepted by terraform
 * release tooling.
 *
 * Accepts an optional leading "v" and one to three numeric segments; missing
 * segments are zero, so "0.8" and "v0.8.0" are the same version. A prerelease
 * follows "-" and build metadata follows "+".
 */
struct Version {
    int major;               ///< Major version number
    int minor;               ///< Minor version number
    int patch;               ///< Patch version number
    std::string prerelease;  ///< Prerelease information (e.g., alpha1, rc2)
    std::string build;       ///< Build metadata

    constexpr Version() noexcept : major(0), minor(0), patch(0) {}

    constexpr Version(int maj, int min, int pat, std::string pre = "",
                      std::string bld = "") noexcept
        : major(maj),
          minor(min),
          patch(pat),
          prerelease(std::move(pre)),
          build(std::move(bld)) {}

    /**
     * @brief Parses a version string into a Version object.
     * @param versionStr The version string to parse
     * @return Parsed Version object
     * @throws atom::error::InvalidArgument if the version string is invalid
     */
    static auto parse(std::string_view versionStr) -> Version;

    /**
     * @brief Non-throwing variant of parse().
     */
    [[nodiscard]] static auto tryParse(std::string_view versionStr) noexcept
        -> std::optional<Version>;

    /**
     * @brief Canonical form without the "v" prefix, e.g. "0.11.0".
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] constexpr auto isPrerelease() const noexcept -> bool {
        return !prerelease.empty();
    }

    constexpr auto operator<(const Version& other) const noexcept -> bool;
    constexpr auto operator>(const Version& other) const noexcept -> bool;
    constexpr auto operator==(const Version& other) const noexcept -> bool;
    constexpr auto operator<=(const Version& other) const noexcept -> bool;
    constexpr auto operator>=(const Version& other) const noexcept -> bool;
};

auto operator<<(std::ostream& os, const Version& version) -> std::ostream&;

/**
 * @brief Parses a non-negative decimal segment.
 * @throws atom::error::InvalidArgument if the segment is not a number
 */
constexpr auto parseSegment(std::string_view str) -> int {
    int result = 0;
    auto [ptr, ec] =
        std::from_chars(str.data(), str.data() + str.size(), result);
    if (ec != std::errc{} || ptr != str.data() + str.size() || str.empty()) {
        THROW_INVALID_ARGUMENT("Invalid version segment: ", std::string(str));
    }
    return result;
}

constexpr auto Version::operator<(const Version& other) const noexcept -> bool {
    if (major != other.major)
        return major < other.major;
    if (minor != other.minor)
        return minor < other.minor;
    if (patch != other.patch)
        return patch < other.patch;

    if (prerelease.empty() && other.prerelease.empty())
        return false;
    if (prerelease.empty())
        return false;
    if (other.prerelease.empty())
        return true;

    return prerelease < other.prerelease;
}

constexpr auto Version::operator>(const Version& other) const noexcept -> bool {
    return other < *this;
}

// Build metadata does not take part in precedence.
constexpr auto Version::operator==(const Version& other) const noexcept
    -> bool {
    return major == other.major && minor == other.minor &&
           patch == other.patch && prerelease == other.prerelease;
}

constexpr auto Version::operator<=(const Version& other) const noexcept
    -> bool {
    return !(other < *this);
}

constexpr auto Version::operator>=(const Version& other) const noexcept
    -> bool {
    return !(*this < other);
}

}  // namespace runstep::terraform

#endif  // RUNSTEP_TERRAFORM_VERSION_HPP
