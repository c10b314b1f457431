/*
 * output_handler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "output_handler.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace runstep::jobs {

auto JobInfo::toJson() const -> nlohmann::json {
    return {{"runId", runId},
            {"repoFullName", repoFullName},
            {"pullNum", pullNum},
            {"lineCount", lines.size()},
            {"complete", complete}};
}

ProjectCommandOutputHandler::ProjectCommandOutputHandler(size_t maxLinesPerJob)
    : maxLinesPerJob_(maxLinesPerJob) {}

void ProjectCommandOutputHandler::send(const models::ProjectContext& ctx,
                                       const std::string& line,
                                       bool operationComplete) {
    auto runId = ctx.runId();
    std::unique_lock lock(mutex_);

    auto& job = jobs_[runId];
    // A receiver may have created the job before its first line.
    if (job.info.runId.empty() || job.info.repoFullName.empty()) {
        job.info.runId = runId;
        job.info.repoFullName = ctx.baseRepo.fullName;
        job.info.pullNum = ctx.pull.num;
    }

    if (operationComplete) {
        job.info.complete = true;
    } else {
        job.info.lines.push_back(line);
        if (maxLinesPerJob_ > 0 && job.info.lines.size() > maxLinesPerJob_) {
            job.info.lines.erase(job.info.lines.begin());
        }
        ++totalLinesSent_;
    }

    for (const auto& [receiverId, receiver] : job.receivers) {
        receiver(operationComplete ? std::string_view{} : std::string_view(line),
                 operationComplete);
    }
}

void ProjectCommandOutputHandler::registerReceiver(const std::string& runId,
                                                   const std::string& receiverId,
                                                   OutputReceiver receiver) {
    std::unique_lock lock(mutex_);

    auto [it, inserted] = jobs_.try_emplace(runId);
    auto& job = it->second;
    if (inserted) {
        job.info.runId = runId;
    }

    for (const auto& line : job.info.lines) {
        receiver(line, false);
    }
    if (job.info.complete) {
        receiver({}, true);
    }

    job.receivers[receiverId] = std::move(receiver);
    spdlog::debug("registered output receiver {} for job {}", receiverId, runId);
}

void ProjectCommandOutputHandler::deregisterReceiver(const std::string& runId,
                                                     const std::string& receiverId) {
    std::unique_lock lock(mutex_);
    if (auto it = jobs_.find(runId); it != jobs_.end()) {
        it->second.receivers.erase(receiverId);
    }
}

void ProjectCommandOutputHandler::cleanUp(const std::string& repoFullName,
                                          int pullNum) {
    std::unique_lock lock(mutex_);
    size_t removed = std::erase_if(jobs_, [&](const auto& entry) {
        const auto& info = entry.second.info;
        return info.repoFullName == repoFullName && info.pullNum == pullNum;
    });
    spdlog::debug("cleaned up {} jobs of {}#{}", removed, repoFullName, pullNum);
}

auto ProjectCommandOutputHandler::isKeyExists(const std::string& runId) const
    -> bool {
    std::shared_lock lock(mutex_);
    return jobs_.contains(runId);
}

auto ProjectCommandOutputHandler::getJobInfo(const std::string& runId) const
    -> std::optional<JobInfo> {
    std::shared_lock lock(mutex_);
    if (auto it = jobs_.find(runId); it != jobs_.end()) {
        return it->second.info;
    }
    return std::nullopt;
}

auto ProjectCommandOutputHandler::getReceiverCount(const std::string& runId) const
    -> size_t {
    std::shared_lock lock(mutex_);
    if (auto it = jobs_.find(runId); it != jobs_.end()) {
        return it->second.receivers.size();
    }
    return 0;
}

auto ProjectCommandOutputHandler::getStats() const -> nlohmann::json {
    std::shared_lock lock(mutex_);
    size_t receivers = 0;
    for (const auto& [runId, job] : jobs_) {
        receivers += job.receivers.size();
    }
    return {{"job_count", jobs_.size()},
            {"receiver_count", receivers},
            {"total_lines_sent", totalLinesSent_.load()}};
}

}  // namespace runstep::jobs
