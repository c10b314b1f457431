/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Common type definitions for run step execution
 */

#ifndef RUNSTEP_RUNTIME_TYPES_HPP
#define RUNSTEP_RUNTIME_TYPES_HPP

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace runstep::runtime {

/// Environment variable name to value.
using EnvMap = std::map<std::string, std::string>;

/// Exit status of POSIX shells for a command that was not found.
inline constexpr int EXIT_COMMAND_NOT_FOUND = 127;

/// Exit status of POSIX shells for a syntax error in the command text.
inline constexpr int EXIT_SYNTAX_ERROR = 2;

/**
 * @brief What is done with a run step's output before it is returned
 */
enum class PostProcessRunOutput {
    Show,            ///< Return the output unchanged
    Hide,            ///< Return nothing (output is still streamed)
    StripRefreshing  ///< Drop terraform's "Refreshing state..." preamble
};

[[nodiscard]] constexpr std::string_view postProcessRunOutputToString(
    PostProcessRunOutput mode) noexcept {
    switch (mode) {
        case PostProcessRunOutput::Show: return "show";
        case PostProcessRunOutput::Hide: return "hide";
        case PostProcessRunOutput::StripRefreshing: return "strip_refreshing";
    }
    return "show";
}

[[nodiscard]] auto postProcessRunOutputFromString(std::string_view name)
    -> std::optional<PostProcessRunOutput>;

/**
 * @brief Shell used to interpret run step commands
 *
 * The command text is appended as the last argument: shell shellArgs... cmd
 */
struct CommandShell {
    std::string shell{"sh"};
    std::vector<std::string> shellArgs{"-c"};

    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * @brief Failure classes of a run step
 */
enum class RunStepErrorKind {
    ResolutionFailure,  ///< The tool version could not be made available
    LaunchFailure,      ///< The command could not be found or started (127)
    SyntaxFailure,      ///< The shell rejected the command text (2)
    NonZeroExit         ///< The command ran and failed
};

[[nodiscard]] constexpr std::string_view runStepErrorKindToString(
    RunStepErrorKind kind) noexcept {
    switch (kind) {
        case RunStepErrorKind::ResolutionFailure: return "ResolutionFailure";
        case RunStepErrorKind::LaunchFailure: return "LaunchFailure";
        case RunStepErrorKind::SyntaxFailure: return "SyntaxFailure";
        case RunStepErrorKind::NonZeroExit: return "NonZeroExit";
    }
    return "NonZeroExit";
}

/**
 * @brief Failure of a run step.
 *
 * Execution failures render as
 * `exit status {N}: running "{command}" in {workingDir}: {detail}`.
 * Resolution failures render as the ensure error text, unchanged.
 */
struct RunStepError {
    RunStepErrorKind kind{RunStepErrorKind::NonZeroExit};
    std::optional<int> exitCode;   ///< Unset when killed by a signal
    std::optional<int> signal;     ///< Terminating signal, if any
    std::string command;
    std::string workingDir;
    std::string detail;            ///< Output or OS error text

    [[nodiscard]] auto message() const -> std::string;

    /**
     * @brief Failure of a command that exited with a status
     */
    [[nodiscard]] static auto fromExitCode(int exitCode, std::string command,
                                           std::string workingDir,
                                           std::string detail) -> RunStepError;

    /**
     * @brief Failure of a command that could not be started at all
     */
    [[nodiscard]] static auto launchFailure(std::string command,
                                            std::string workingDir,
                                            std::string detail) -> RunStepError;

    /**
     * @brief Failure of a command terminated by a signal
     */
    [[nodiscard]] static auto fromSignal(int signal, std::string command,
                                         std::string workingDir,
                                         std::string detail) -> RunStepError;

    /**
     * @brief Failure of the ensure-version collaborator
     */
    [[nodiscard]] static auto resolutionFailure(std::string message)
        -> RunStepError;
};

/**
 * @brief Map a shell exit status to its failure class
 */
[[nodiscard]] constexpr auto classifyExitCode(int exitCode) noexcept
    -> RunStepErrorKind {
    switch (exitCode) {
        case EXIT_COMMAND_NOT_FOUND: return RunStepErrorKind::LaunchFailure;
        case EXIT_SYNTAX_ERROR: return RunStepErrorKind::SyntaxFailure;
        default: return RunStepErrorKind::NonZeroExit;
    }
}

/**
 * @brief Result of a run step: the output or the failure
 */
template <typename T>
using RunResult = std::expected<T, RunStepError>;

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_TYPES_HPP
