/*
 * test_output_processing.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "runtime/output_processing.hpp"

using namespace runstep::runtime;
using runstep::terraform::Version;

TEST(StripAnsiTest, RemovesColorCodes) {
    EXPECT_EQ(stripAnsi("\x1b[31mred\x1b[0m"), "red");
    EXPECT_EQ(stripAnsi("\x1b[1;32mPlan:\x1b[0m 1 to add"), "Plan: 1 to add");
}

TEST(StripAnsiTest, RemovesOscSequences) {
    EXPECT_EQ(stripAnsi("\x1b]0;title\x07text"), "text");
    EXPECT_EQ(stripAnsi("\x1b]8;;http://x\x1b\\link"), "link");
}

TEST(StripAnsiTest, RemovesCharsetDesignations) {
    EXPECT_EQ(stripAnsi("\x1b(B\x1b[m"), "");
    EXPECT_EQ(stripAnsi("\x1b[1mbold\x1b(B\x1b[m done"), "bold done");
    EXPECT_EQ(stripAnsi("\x1b)0line\x1b#8"), "line");
}

TEST(StripAnsiTest, RemovesTwoByteEscapes) {
    EXPECT_EQ(stripAnsi("\x1b" "7saved\x1b" "8"), "saved");
}

TEST(StripAnsiTest, KeepsPlainText) {
    EXPECT_EQ(stripAnsi("no escapes here"), "no escapes here");
    EXPECT_EQ(stripAnsi(""), "");
}

TEST(StripRefreshingTest, DropsEverythingUpToLastRefresh) {
    std::string output =
        "Refreshing state... [id=a]\n"
        "Refreshing state... [id=b]\n"
        "\n"
        "Plan: 1 to add\n";
    EXPECT_EQ(stripRefreshingFromPlanOutput(output, Version(0, 14, 0)),
              "\nPlan: 1 to add\n");
}

TEST(StripRefreshingTest, OldVersionsUnchanged) {
    std::string output = "Refreshing state...\nPlan: 1 to add\n";
    EXPECT_EQ(stripRefreshingFromPlanOutput(output, Version(0, 13, 7)), output);
    EXPECT_EQ(stripRefreshingFromPlanOutput(output, std::nullopt), output);
}

TEST(StripRefreshingTest, NoRefreshLines) {
    std::string output = "Plan: 1 to add\n";
    EXPECT_EQ(stripRefreshingFromPlanOutput(output, Version(1, 0, 0)), output);
}

TEST(PostProcessTest, Modes) {
    std::string output = "Refreshing state...\nresult\n";
    EXPECT_EQ(postProcessOutput(PostProcessRunOutput::Show, output, Version(1, 0, 0)),
              output);
    EXPECT_EQ(postProcessOutput(PostProcessRunOutput::Hide, output, Version(1, 0, 0)),
              "");
    EXPECT_EQ(postProcessOutput(PostProcessRunOutput::StripRefreshing, output,
                                Version(1, 0, 0)),
              "result\n");
}

TEST(PostProcessTest, ModeNames) {
    EXPECT_EQ(postProcessRunOutputFromString("strip_refreshing"),
              PostProcessRunOutput::StripRefreshing);
    EXPECT_EQ(postProcessRunOutputToString(PostProcessRunOutput::Hide), "hide");
    EXPECT_FALSE(postProcessRunOutputFromString("verbose").has_value());
}
