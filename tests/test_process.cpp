/*
 * Child process tests - AI-AutoBuilder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <ai-autobuilder/exec/process.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>

using namespace autobuilder;

TEST(ProcessResolve, FindsShellOnPath) {
    auto sh = resolve_executable("sh", std::getenv("PATH"));
    ASSERT_TRUE(sh.has_value());
    EXPECT_NE(sh->find("/sh"), std::string::npos);
    EXPECT_FALSE(resolve_executable("definitely-not-a-command-xyz", std::getenv("PATH")).has_value());
    EXPECT_FALSE(resolve_executable("sh", nullptr).has_value());
}

TEST(ProcessRun, FeedsStdinAndCapturesStdout) {
    ProcessSpec spec; spec.argv = {"cat"}; spec.input = "prompt text\nsecond line";
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "prompt text\nsecond line");
    EXPECT_TRUE(r.err.empty());
}

TEST(ProcessRun, LargeInputDoesNotDeadlock) {
    ProcessSpec spec; spec.argv = {"cat"}; spec.input.assign(1 << 20, 'x');
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out.size(), spec.input.size());
}

TEST(ProcessRun, NonZeroStatusAndStderr) {
    ProcessSpec spec; spec.argv = {"sh", "-c", "echo out; echo err 1>&2; exit 3"};
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 3);
    EXPECT_EQ(r.out, "out\n");
    EXPECT_EQ(r.err, "err\n");
}

TEST(ProcessRun, EnvironmentOverrides) {
    ProcessSpec spec; spec.argv = {"sh", "-c", "printf '%s' \"$LANG\""};
    spec.env = {{"LANG", "C.UTF-8"}};
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 0);
    EXPECT_EQ(r.out, "C.UTF-8");
}

TEST(ProcessRun, MissingExecutableIs127) {
    ProcessSpec spec; spec.argv = {"definitely-not-a-command-xyz"};
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 127);
    EXPECT_NE(r.err.find("command not found"), std::string::npos);
}

TEST(ProcessRun, ChildIgnoringStdin) {
    ProcessSpec spec; spec.argv = {"true"}; spec.input.assign(1 << 20, 'y');
    auto r = run_process(spec);
    EXPECT_EQ(r.status, 0);
}

TEST(ProcessRun, TimeoutKillsChild) {
    ProcessSpec spec; spec.argv = {"sleep", "10"}; spec.timeout_seconds = 1;
    auto start = std::chrono::steady_clock::now();
    auto r = run_process(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_NE(r.status, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessRun, TimeoutAppliesAfterStreamsClose) {
    ProcessSpec spec; spec.argv = {"sh", "-c", "exec >&- 2>&-; sleep 6"}; spec.timeout_seconds = 1;
    auto start = std::chrono::steady_clock::now();
    auto r = run_process(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.status, 128 + SIGKILL);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(ProcessRun, QuickChildWithTimeoutIsNotKilled) {
    ProcessSpec spec; spec.argv = {"sh", "-c", "exec >&- 2>&-; exit 4"}; spec.timeout_seconds = 5;
    auto r = run_process(spec);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.status, 4);
}
