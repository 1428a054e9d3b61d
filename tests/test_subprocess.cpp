#include <gtest/gtest.h>
#include "utils/SubProcess.hpp"

using namespace code_agent;
using namespace std::chrono_literals;

TEST(SubProcessTest, CapturesBothStreamsAndExitCode) {
    auto r = SubProcess::run({"/bin/sh", "-c", "echo hello; echo oops 1>&2; exit 3"}, 5s);
    ASSERT_TRUE(r.spawned);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.std_out, "hello\n");
    EXPECT_EQ(r.std_err, "oops\n");
}

TEST(SubProcessTest, KillsTheProcessGroupOnTimeout) {
    auto r = SubProcess::run({"/bin/sh", "-c", "sleep 10; echo never"}, 300ms);
    ASSERT_TRUE(r.spawned);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_LT(r.elapsed_ms, 3000.0);
    EXPECT_EQ(r.std_out.find("never"), std::string::npos);
}

TEST(SubProcessTest, DeadlineHoldsWhenTheChildClosesItsStreams) {
    auto r = SubProcess::run({"/bin/sh", "-c", "exec >&- 2>&-; sleep 10"}, 300ms);
    ASSERT_TRUE(r.spawned);
    EXPECT_TRUE(r.timed_out);
    EXPECT_LT(r.elapsed_ms, 3000.0);
}

TEST(SubProcessTest, MissingBinaryIsReportedAsNotSpawned) {
    auto r = SubProcess::run({"/nonexistent/definitely-not-here"}, 2s);
    EXPECT_FALSE(r.spawned);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_NE(r.std_err.find("failed to execute"), std::string::npos);
}

TEST(SubProcessTest, OutputIsCappedButFullyDrained) {
    auto r = SubProcess::run({"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\000' a; echo done 1>&2"},
                             10s, 1000);
    ASSERT_TRUE(r.spawned);
    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.std_out.size(), 1000u);
    EXPECT_EQ(r.std_err, "done\n");
}

TEST(SubProcessTest, EmptyArgvIsRejected) {
    auto r = SubProcess::run({}, 1s);
    EXPECT_FALSE(r.spawned);
}

TEST(SubProcessTest, ImmediateDeadlineStillKillsBackgroundChildren) {
    auto r = SubProcess::run({"/bin/sh", "-c", "sleep 10 & sleep 10 & wait"}, 1ms);
    ASSERT_TRUE(r.spawned);
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_LT(r.elapsed_ms, 3000.0);
}
