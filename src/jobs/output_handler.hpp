/*
 * output_handler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Fan-out of live run step output to subscribers

**************************************************/

#ifndef RUNSTEP_JOBS_OUTPUT_HANDLER_HPP
#define RUNSTEP_JOBS_OUTPUT_HANDLER_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "models/project_context.hpp"

namespace runstep::jobs {

/**
 * @brief Receives the live output of run steps
 */
class IProjectCommandOutputHandler {
public:
    virtual ~IProjectCommandOutputHandler() = default;

    /**
     * @brief Deliver one output line of a run
     * @param ctx Context of the run producing the line
     * @param line Output line, including its terminating newline
     * @param operationComplete True once the run has finished; line is empty
     */
    virtual void send(const models::ProjectContext& ctx, const std::string& line,
                      bool operationComplete) = 0;
};

/**
 * @brief Handler for callers that do not stream output
 */
class NoopProjectCommandOutputHandler : public IProjectCommandOutputHandler {
public:
    void send(const models::ProjectContext& /*ctx*/, const std::string& /*line*/,
              bool /*operationComplete*/) override {}
};

/**
 * @brief Callback of a job subscriber: (line, operationComplete)
 */
using OutputReceiver = std::function<void(std::string_view, bool)>;

/**
 * @brief Snapshot of one job's output
 */
struct JobInfo {
    std::string runId;
    std::string repoFullName;
    int pullNum{0};
    std::vector<std::string> lines;
    bool complete{false};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief In-process output handler keyed by run id.
 *
 * Keeps the history of every job so that late subscribers first receive
 * what was already produced and then follow the live lines. Receivers are
 * called with the handler's lock held and must not call back into it.
 */
class ProjectCommandOutputHandler : public IProjectCommandOutputHandler {
public:
    /**
     * @param maxLinesPerJob History kept per job, 0 = unlimited
     */
    explicit ProjectCommandOutputHandler(size_t maxLinesPerJob = 0);

    void send(const models::ProjectContext& ctx, const std::string& line,
              bool operationComplete) override;

    /**
     * @brief Subscribe to a job, replaying its history first
     */
    void registerReceiver(const std::string& runId, const std::string& receiverId,
                          OutputReceiver receiver);

    void deregisterReceiver(const std::string& runId,
                            const std::string& receiverId);

    /**
     * @brief Forget every job of a pull request
     */
    void cleanUp(const std::string& repoFullName, int pullNum);

    [[nodiscard]] auto isKeyExists(const std::string& runId) const -> bool;

    [[nodiscard]] auto getJobInfo(const std::string& runId) const
        -> std::optional<JobInfo>;

    [[nodiscard]] auto getReceiverCount(const std::string& runId) const -> size_t;

    [[nodiscard]] auto getStats() const -> nlohmann::json;

private:
    struct Job {
        JobInfo info;
        std::unordered_map<std::string, OutputReceiver> receivers;
    };

    size_t maxLinesPerJob_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Job> jobs_;

    std::atomic<size_t> totalLinesSent_{0};
};

}  // namespace runstep::jobs

#endif  // RUNSTEP_JOBS_OUTPUT_HANDLER_HPP
