/*
 * version.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "version.hpp"

#include <format>

namespace runstep::terraform {

auto Version::parse(std::string_view versionStr) -> Version {
    std::string_view rest = versionStr;
    if (!rest.empty() && rest.front() == 'v') {
        rest.remove_prefix(1);
    }
    if (rest.empty()) {
        THROW_INVALID_ARGUMENT("Empty version string");
    }

    Version version;

    auto plus = rest.find('+');
    if (plus != std::string_view::npos) {
        version.build = std::string(rest.substr(plus + 1));
        rest = rest.substr(0, plus);
        if (version.build.empty()) {
            THROW_INVALID_ARGUMENT("Empty build metadata in version: ",
                                   std::string(versionStr));
        }
    }

    auto dash = rest.find('-');
    if (dash != std::string_view::npos) {
        version.prerelease = std::string(rest.substr(dash + 1));
        rest = rest.substr(0, dash);
        if (version.prerelease.empty()) {
            THROW_INVALID_ARGUMENT("Empty prerelease in version: ",
                                   std::string(versionStr));
        }
    }

    int* segments[] = {&version.major, &version.minor, &version.patch};
    size_t index = 0;
    size_t pos = 0;
    while (true) {
        if (index == 3) {
            THROW_INVALID_ARGUMENT("Too many segments in version: ",
                                   std::string(versionStr));
        }
        auto dot = rest.find('.', pos);
        auto segment = rest.substr(
            pos, dot == std::string_view::npos ? std::string_view::npos
                                               : dot - pos);
        *segments[index++] = parseSegment(segment);
        if (dot == std::string_view::npos) {
            break;
        }
        pos = dot + 1;
    }

    return version;
}

auto Version::tryParse(std::string_view versionStr) noexcept
    -> std::optional<Version> {
    try {
        return parse(versionStr);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

auto Version::toString() const -> std::string {
    auto result = std::format("{}.{}.{}", major, minor, patch);
    if (!prerelease.empty()) {
        result += "-" + prerelease;
    }
    if (!build.empty()) {
        result += "+" + build;
    }
    return result;
}

auto operator<<(std::ostream& outputStream,
                const Version& version) -> std::ostream& {
    return outputStream << version.toString();
}

}  // namespace runstep::terraform
