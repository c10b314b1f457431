/*
 * output_processing.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file output_processing.hpp
 * @brief Cleanup of captured command output
 */

#ifndef RUNSTEP_RUNTIME_OUTPUT_PROCESSING_HPP
#define RUNSTEP_RUNTIME_OUTPUT_PROCESSING_HPP

#include <optional>
#include <string>
#include <string_view>

#include "terraform/version.hpp"
#include "types.hpp"

namespace runstep::runtime {

/// Marker of the lines terraform prints while refreshing state.
inline constexpr std::string_view REFRESH_KEYWORD = "Refreshing state...";

/**
 * @brief Remove ANSI escape sequences (colors, cursor movement) from text
 */
[[nodiscard]] auto stripAnsi(std::string_view text) -> std::string;

/**
 * @brief Drop the refresh preamble of plan output.
 *
 * For terraform 0.14.0 and newer every line up to and including the last
 * line containing REFRESH_KEYWORD is removed. Older or unknown versions
 * return the output unchanged.
 */
[[nodiscard]] auto stripRefreshingFromPlanOutput(
    const std::string& output, const std::optional<terraform::Version>& version)
    -> std::string;

/**
 * @brief Apply a post-processing mode to a successful run's output
 */
[[nodiscard]] auto postProcessOutput(
    PostProcessRunOutput mode, std::string output,
    const std::optional<terraform::Version>& version) -> std::string;

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_OUTPUT_PROCESSING_HPP
