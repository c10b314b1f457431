/*
 * test_output_handler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Description: Tests for run step output fan-out

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "jobs/output_handler.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace runstep::jobs;
using runstep::models::ProjectContext;
using runstep::models::Repo;

class OutputHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ctx_.baseRepo = Repo::fromFullName("owner/repo");
        ctx_.pull.num = 7;
        ctx_.projectName = "app";
        ctx_.workspace = "default";
        runId_ = ctx_.runId();
    }

    ProjectCommandOutputHandler handler_;
    ProjectContext ctx_;
    std::string runId_;
};

TEST_F(OutputHandlerTest, SendCreatesJob) {
    EXPECT_FALSE(handler_.isKeyExists(runId_));
    handler_.send(ctx_, "line 1\n", false);

    ASSERT_TRUE(handler_.isKeyExists(runId_));
    auto info = handler_.getJobInfo(runId_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->repoFullName, "owner/repo");
    EXPECT_EQ(info->pullNum, 7);
    EXPECT_EQ(info->lines, std::vector<std::string>{"line 1\n"});
    EXPECT_FALSE(info->complete);
}

TEST_F(OutputHandlerTest, CompletionMarksJob) {
    handler_.send(ctx_, "line\n", false);
    handler_.send(ctx_, "", true);

    auto info = handler_.getJobInfo(runId_);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->complete);
    EXPECT_EQ(info->lines.size(), 1u);
}

TEST_F(OutputHandlerTest, ReceiverGetsLiveLines) {
    std::vector<std::string> received;
    bool completed = false;
    handler_.registerReceiver(runId_, "r1", [&](std::string_view line, bool done) {
        if (done) {
            completed = true;
        } else {
            received.emplace_back(line);
        }
    });

    handler_.send(ctx_, "a\n", false);
    handler_.send(ctx_, "b\n", false);
    handler_.send(ctx_, "", true);

    EXPECT_EQ(received, (std::vector<std::string>{"a\n", "b\n"}));
    EXPECT_TRUE(completed);
}

TEST_F(OutputHandlerTest, LateReceiverGetsHistoryFirst) {
    handler_.send(ctx_, "early\n", false);
    handler_.send(ctx_, "", true);

    std::vector<std::string> received;
    int completions = 0;
    handler_.registerReceiver(runId_, "late", [&](std::string_view line, bool done) {
        if (done) {
            ++completions;
        } else {
            received.emplace_back(line);
        }
    });

    EXPECT_EQ(received, std::vector<std::string>{"early\n"});
    EXPECT_EQ(completions, 1);
}

TEST_F(OutputHandlerTest, DeregisteredReceiverStopsReceiving) {
    int calls = 0;
    handler_.registerReceiver(runId_, "r1",
                              [&](std::string_view, bool) { ++calls; });
    EXPECT_EQ(handler_.getReceiverCount(runId_), 1u);

    handler_.deregisterReceiver(runId_, "r1");
    handler_.send(ctx_, "ignored\n", false);

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(handler_.getReceiverCount(runId_), 0u);
}

TEST_F(OutputHandlerTest, JobIdKeysTheStream) {
    ctx_.jobId = "job-1";
    handler_.send(ctx_, "x\n", false);
    EXPECT_TRUE(handler_.isKeyExists("job-1"));
    EXPECT_FALSE(handler_.isKeyExists(runId_));
}

TEST_F(OutputHandlerTest, CleanUpRemovesPullJobsOnly) {
    handler_.send(ctx_, "a\n", false);

    auto other = ctx_;
    other.workspace = "staging";
    handler_.send(other, "b\n", false);

    auto otherPull = ctx_;
    otherPull.pull.num = 8;
    handler_.send(otherPull, "c\n", false);

    handler_.cleanUp("owner/repo", 7);

    EXPECT_FALSE(handler_.isKeyExists(ctx_.runId()));
    EXPECT_FALSE(handler_.isKeyExists(other.runId()));
    EXPECT_TRUE(handler_.isKeyExists(otherPull.runId()));
}

TEST_F(OutputHandlerTest, HistoryLimit) {
    ProjectCommandOutputHandler limited(2);
    limited.send(ctx_, "1\n", false);
    limited.send(ctx_, "2\n", false);
    limited.send(ctx_, "3\n", false);

    auto info = limited.getJobInfo(runId_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->lines, (std::vector<std::string>{"2\n", "3\n"}));
}

TEST_F(OutputHandlerTest, Stats) {
    handler_.registerReceiver(runId_, "r", [](std::string_view, bool) {});
    handler_.send(ctx_, "a\n", false);
    handler_.send(ctx_, "b\n", false);
    handler_.send(ctx_, "", true);

    auto stats = handler_.getStats();
    EXPECT_EQ(stats["job_count"], 1);
    EXPECT_EQ(stats["receiver_count"], 1);
    EXPECT_EQ(stats["total_lines_sent"], 2);

    auto info = handler_.getJobInfo(runId_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->toJson()["lineCount"], 2);
}

TEST_F(OutputHandlerTest, ConcurrentSenders) {
    std::atomic<int> received{0};
    handler_.registerReceiver(runId_, "counter",
                              [&](std::string_view, bool done) {
                                  if (!done) {
                                      ++received;
                                  }
                              });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 100; ++i) {
                handler_.send(ctx_, "line\n", false);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(received.load(), 400);
    EXPECT_EQ(handler_.getJobInfo(runId_)->lines.size(), 400u);
}

TEST(NoopOutputHandlerTest, AcceptsEverything) {
    NoopProjectCommandOutputHandler handler;
    ProjectContext ctx;
    handler.send(ctx, "line\n", false);
    handler.send(ctx, "", true);
    SUCCEED();
}

TEST_F(OutputHandlerTest, EarlyReceiverJobIsCleanedUpWithPull) {
    handler_.registerReceiver(runId_, "early", [](std::string_view, bool) {});
    handler_.send(ctx_, "a\n", false);

    auto info = handler_.getJobInfo(runId_);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->repoFullName, "owner/repo");

    handler_.cleanUp("owner/repo", 7);
    EXPECT_FALSE(handler_.isKeyExists(runId_));
}
