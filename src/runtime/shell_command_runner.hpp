/*
 * shell_command_runner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_command_runner.hpp
 * @brief Runs one shell command while streaming and capturing its output
 */

#ifndef RUNSTEP_RUNTIME_SHELL_COMMAND_RUNNER_HPP
#define RUNSTEP_RUNTIME_SHELL_COMMAND_RUNNER_HPP

#include <memory>
#include <string>

#include "jobs/output_handler.hpp"
#include "models/project_context.hpp"
#include "types.hpp"

namespace runstep::runtime {

/**
 * @brief Shell command executor
 *
 * Runs `shell shellArgs... command` with exactly the given environment in
 * the given directory. stdout and stderr share one pipe which a reader
 * thread drains line by line; every line has its ANSI escapes removed, is
 * terminated with '\n', optionally forwarded to the output handler and
 * appended to the returned output. The handler therefore sees exactly the
 * bytes that run() returns.
 *
 * A runner executes one command; run() may be called again after it returns.
 */
class ShellCommandRunner {
public:
    /**
     * @param shell Interpreter and its arguments
     * @param command Command text passed to the shell as one argument
     * @param env Complete environment of the child
     * @param workingDir Existing directory the command runs in
     * @param streamOutput Forward lines to outputHandler
     * @param outputHandler Live output subscriber, may be null
     */
    ShellCommandRunner(CommandShell shell, std::string command, EnvMap env,
                       std::string workingDir, bool streamOutput,
                       std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler);
    ~ShellCommandRunner();

    // Non-copyable, movable
    ShellCommandRunner(const ShellCommandRunner&) = delete;
    ShellCommandRunner& operator=(const ShellCommandRunner&) = delete;
    ShellCommandRunner(ShellCommandRunner&&) noexcept;
    ShellCommandRunner& operator=(ShellCommandRunner&&) noexcept;

    /**
     * @brief Run the command and wait for it
     *
     * An empty command returns "" without starting a process.
     *
     * @param ctx Context of the run, used for logging and streaming
     * @return Full output, or the failure with command and directory
     */
    auto run(const models::ProjectContext& ctx) -> RunResult<std::string>;

    /**
     * @brief Kill the running command and everything it started
     */
    void abort();

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    [[nodiscard]] auto command() const noexcept -> const std::string&;

    [[nodiscard]] auto workingDir() const noexcept -> const std::string&;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace runstep::runtime

#endif  // RUNSTEP_RUNTIME_SHELL_COMMAND_RUNNER_HPP
