#include <gtest/gtest.h>
#include <string>
#include "job_table.hpp"

using namespace code_agent;

namespace {

nlohmann::json job(const std::string& id, const std::string& status) {
    return {{"job_id", id}, {"status", status}};
}

} // namespace

TEST(JobTableTest, LatestStateWins) {
    JobTable table;
    table.set("job-1", job("job-1", "queued"));
    table.set("job-1", job("job-1", "running"));
    ASSERT_TRUE(table.get("job-1").has_value());
    EXPECT_EQ((*table.get("job-1"))["status"], "running");
    EXPECT_FALSE(table.get("job-2").has_value());
}

TEST(JobTableTest, OldestFinishedJobsAreForgottenPastTheCap) {
    JobTable table(2);
    for (int i = 1; i <= 5; ++i) {
        std::string id = "job-" + std::to_string(i);
        table.set(id, job(id, "queued"));
        table.set(id, job(id, i % 2 ? "completed" : "failed"));
    }
    EXPECT_EQ(table.size(), 2u);
    EXPECT_FALSE(table.get("job-3").has_value());
    EXPECT_EQ((*table.get("job-4"))["status"], "failed");
    EXPECT_EQ((*table.get("job-5"))["status"], "completed");
}

TEST(JobTableTest, UnfinishedJobsAreNeverEvicted) {
    JobTable table(1);
    table.set("job-1", job("job-1", "running"));
    table.set("job-2", job("job-2", "queued"));
    table.set("job-3", job("job-3", "needs attention"));
    table.set("job-4", job("job-4", "completed"));

    EXPECT_EQ(table.size(), 3u);
    EXPECT_TRUE(table.get("job-1").has_value());
    EXPECT_TRUE(table.get("job-2").has_value());
    EXPECT_FALSE(table.get("job-3").has_value());
}

TEST(JobTableTest, ThousandsOfFinishedJobsStayBounded) {
    JobTable table(100);
    for (int i = 0; i < 5000; ++i) {
        std::string id = "job-" + std::to_string(i);
        table.set(id, job(id, "completed"));
    }
    EXPECT_EQ(table.size(), 100u);
    EXPECT_TRUE(table.get("job-4999").has_value());
}
