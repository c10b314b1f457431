/*
 * shell_command_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file shell_command_runner.cpp
 * @brief Shell command executor implementation
 */

#include "shell_command_runner.hpp"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "output_processing.hpp"
#include "terraform/terraform_client.hpp"

namespace runstep::runtime {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

auto errnoMessage(int err) -> std::string {
    return std::system_category().message(err);
}

}  // namespace

class ShellCommandRunner::Impl {
public:
    CommandShell shell_;
    std::string command_;
    EnvMap env_;
    std::string workingDir_;
    bool streamOutput_{false};
    std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler_;

    std::atomic<pid_t> pid_{-1};
    std::atomic<bool> running_{false};
    // Held while signalling or reaping, so a reaped pid is never signalled.
    std::mutex processMutex_;

    /**
     * @brief Wait for the child, clear pid_ while it is still a zombie, reap
     */
    auto reap(pid_t pid, int& status) -> bool {
        siginfo_t info{};
        int rc;
        do {
            rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
        } while (rc < 0 && errno == EINTR);

        {
            std::lock_guard lock(processMutex_);
            running_ = false;
            pid_ = -1;
        }

        pid_t waited;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
        return waited >= 0;
    }

    /**
     * @brief Absolute path of the shell, looked up on the child's PATH
     */
    auto resolveShell() const -> std::optional<std::string> {
        if (shell_.shell.find('/') != std::string::npos) {
            return shell_.shell;
        }
        auto pathIt = env_.find("PATH");
        std::string pathList;
        if (pathIt != env_.end()) {
            pathList = pathIt->second;
        } else if (const char* own = std::getenv("PATH")) {
            pathList = own;
        }
        if (auto found = terraform::lookPath(shell_.shell, pathList)) {
            return found->string();
        }
        return std::nullopt;
    }

    void emitLine(const models::ProjectContext& ctx, std::string_view raw,
                  std::string& output) {
        std::string line = stripAnsi(raw);
        ctx.logger()->debug("{}", line);
        line += '\n';

        if (streamOutput_ && outputHandler_) {
            try {
                outputHandler_->send(ctx, line, false);
            } catch (const std::exception& e) {
                ctx.logger()->warn("output handler failed for {}: {}",
                                   ctx.runId(), e.what());
            }
        }
        output += line;
    }

    /**
     * @brief Drain the output pipe until every writer has closed it.
     *
     * Runs on the reader thread, which is the only owner of the returned
     * buffer until it is joined.
     */
    auto readOutput(const models::ProjectContext& ctx, int fd) -> std::string {
        std::string output;
        std::string pending;
        char buffer[READ_CHUNK_SIZE];

        while (true) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                ctx.logger()->error("reading output of \"{}\" failed: {}",
                                    command_, errnoMessage(errno));
                break;
            }
            if (n == 0) {
                break;
            }

            pending.append(buffer, static_cast<size_t>(n));
            size_t start = 0;
            size_t newline;
            while ((newline = pending.find('\n', start)) != std::string::npos) {
                emitLine(ctx, std::string_view(pending).substr(start, newline - start),
                         output);
                start = newline + 1;
            }
            pending.erase(0, start);
        }

        if (!pending.empty()) {
            emitLine(ctx, pending, output);
        }
        return output;
    }

    auto run(const models::ProjectContext& ctx) -> RunResult<std::string> {
        auto logger = ctx.logger();

        if (command_.empty()) {
            return std::string{};
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(workingDir_, ec)) {
            auto error = RunStepError::launchFailure(
                command_, workingDir_,
                std::format("chdir {}: no such file or directory", workingDir_));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }

        auto shellPath = resolveShell();
        if (!shellPath) {
            auto error = RunStepError::launchFailure(
                command_, workingDir_,
                std::format("exec: \"{}\": executable file not found in $PATH",
                            shell_.shell));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }

        // Everything the child needs is allocated before fork().
        std::vector<std::string> args;
        args.push_back(shell_.shell);
        args.insert(args.end(), shell_.shellArgs.begin(), shell_.shellArgs.end());
        args.push_back(command_);
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::vector<std::string> envStrings;
        envStrings.reserve(env_.size());
        for (const auto& [key, value] : env_) {
            envStrings.push_back(key + "=" + value);
        }
        std::vector<char*> envp;
        for (auto& entry : envStrings) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        const std::string execFailure =
            std::format("{}: cannot execute {}\n", shell_.shell, *shellPath);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            auto error = RunStepError::launchFailure(
                command_, workingDir_, std::format("pipe: {}", errnoMessage(errno)));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }
        auto [readFd, writeFd] = fds;

        logger->debug("running \"{}\" in \"{}\" with {}", command_, workingDir_,
                      shell_.toString());

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            ::close(readFd);
            ::close(writeFd);
            auto error = RunStepError::launchFailure(
                command_, workingDir_, std::format("fork: {}", errnoMessage(err)));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }

        if (pid == 0) {
            // Child process: only async-signal-safe calls from here on.
            ::setpgid(0, 0);
            int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devNull >= 0) {
                ::dup2(devNull, STDIN_FILENO);
                if (devNull != STDIN_FILENO) {
                    ::close(devNull);
                }
            }
            ::dup2(writeFd, STDOUT_FILENO);
            ::dup2(writeFd, STDERR_FILENO);
            if (::chdir(workingDir_.c_str()) != 0) {
                _exit(EXIT_COMMAND_NOT_FOUND);
            }
            ::execve(shellPath->c_str(), argv.data(), envp.data());
            [[maybe_unused]] auto written =
                ::write(STDERR_FILENO, execFailure.data(), execFailure.size());
            _exit(EXIT_COMMAND_NOT_FOUND);
        }

        // Parent process
        ::setpgid(pid, pid);
        ::close(writeFd);
        {
            std::lock_guard lock(processMutex_);
            pid_ = pid;
            running_ = true;
        }

        std::string output;
        std::thread reader;
        try {
            reader = std::thread([this, &ctx, &output, readFd] {
                output = readOutput(ctx, readFd);
            });
        } catch (const std::system_error& e) {
            ::close(readFd);
            ::kill(-pid, SIGKILL);
            int ignored = 0;
            reap(pid, ignored);
            auto error = RunStepError::launchFailure(
                command_, workingDir_,
                std::format("starting output reader: {}", e.what()));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }
        reader.join();
        ::close(readFd);

        int status = 0;
        if (!reap(pid, status)) {
            auto error = RunStepError::launchFailure(
                command_, workingDir_, std::format("wait: {}", errnoMessage(errno)));
            logger->error("{}", error.message());
            return std::unexpected(error);
        }

        if (WIFSIGNALED(status)) {
            auto error = RunStepError::fromSignal(WTERMSIG(status), command_,
                                                  workingDir_, output);
            logger->error("{}", error.message());
            return std::unexpected(error);
        }

        int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        if (exitCode != 0) {
            return std::unexpected(RunStepError::fromExitCode(
                exitCode, command_, workingDir_, output));
        }

        logger->info("successfully ran \"{}\" in \"{}\"", command_, workingDir_);
        return output;
    }
};

ShellCommandRunner::ShellCommandRunner(
    CommandShell shell, std::string command, EnvMap env, std::string workingDir,
    bool streamOutput,
    std::shared_ptr<jobs::IProjectCommandOutputHandler> outputHandler)
    : pImpl_(std::make_unique<Impl>()) {
    pImpl_->shell_ = std::move(shell);
    pImpl_->command_ = std::move(command);
    pImpl_->env_ = std::move(env);
    pImpl_->workingDir_ = std::move(workingDir);
    pImpl_->streamOutput_ = streamOutput;
    pImpl_->outputHandler_ = std::move(outputHandler);
}

ShellCommandRunner::~ShellCommandRunner() = default;

ShellCommandRunner::ShellCommandRunner(ShellCommandRunner&&) noexcept = default;
ShellCommandRunner& ShellCommandRunner::operator=(ShellCommandRunner&&) noexcept =
    default;

auto ShellCommandRunner::run(const models::ProjectContext& ctx)
    -> RunResult<std::string> {
    return pImpl_->run(ctx);
}

void ShellCommandRunner::abort() {
    std::lock_guard lock(pImpl_->processMutex_);
    pid_t pid = pImpl_->pid_.load();
    if (pid > 0 && pImpl_->running_.load()) {
        spdlog::debug("ShellCommandRunner: killing process group {}", pid);
        ::kill(-pid, SIGKILL);
    }
}

auto ShellCommandRunner::isRunning() const noexcept -> bool {
    return pImpl_->running_.load();
}

auto ShellCommandRunner::command() const noexcept -> const std::string& {
    return pImpl_->command_;
}

auto ShellCommandRunner::workingDir() const noexcept -> const std::string& {
    return pImpl_->workingDir_;
}

}  // namespace runstep::runtime
