/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <cstring>
#include <format>

namespace runstep::runtime {

auto postProcessRunOutputFromString(std::string_view name)
    -> std::optional<PostProcessRunOutput> {
    if (name == "show") return PostProcessRunOutput::Show;
    if (name == "hide") return PostProcessRunOutput::Hide;
    if (name == "strip_refreshing") return PostProcessRunOutput::StripRefreshing;
    return std::nullopt;
}

auto CommandShell::toString() const -> std::string {
    std::string result = shell;
    for (const auto& arg : shellArgs) {
        result += " " + arg;
    }
    return result;
}

auto RunStepError::message() const -> std::string {
    if (kind == RunStepErrorKind::ResolutionFailure) {
        return detail;
    }

    std::string status;
    if (exitCode) {
        status = std::format("exit status {}", *exitCode);
    } else if (signal) {
        status = std::format("signal: {}", strsignal(*signal));
    } else {
        status = "unknown failure";
    }
    return std::format("{}: running \"{}\" in {}: {}", status, command,
                       workingDir, detail);
}

auto RunStepError::fromExitCode(int exitCode, std::string command,
                                std::string workingDir, std::string detail)
    -> RunStepError {
    RunStepError error;
    error.kind = classifyExitCode(exitCode);
    error.exitCode = exitCode;
    error.command = std::move(command);
    error.workingDir = std::move(workingDir);
    error.detail = std::move(detail);
    return error;
}

auto RunStepError::launchFailure(std::string command, std::string workingDir,
                                 std::string detail) -> RunStepError {
    auto error = fromExitCode(EXIT_COMMAND_NOT_FOUND, std::move(command),
                              std::move(workingDir), std::move(detail));
    error.kind = RunStepErrorKind::LaunchFailure;
    return error;
}

auto RunStepError::fromSignal(int signal, std::string command,
                              std::string workingDir, std::string detail)
    -> RunStepError {
    RunStepError error;
    error.kind = RunStepErrorKind::NonZeroExit;
    error.signal = signal;
    error.command = std::move(command);
    error.workingDir = std::move(workingDir);
    error.detail = std::move(detail);
    return error;
}

auto RunStepError::resolutionFailure(std::string message) -> RunStepError {
    RunStepError error;
    error.kind = RunStepErrorKind::ResolutionFailure;
    error.detail = std::move(message);
    return error;
}

}  // namespace runstep::runtime
