#include <gtest/gtest.h>
#include "database.h"
#include "utils.h"

TEST(SqliteResultStore, WriteAndReplace) {
  SqliteResultStore store(MakeTempDir("db") / "results.sqlite");
  EXPECT_FALSE(store.Get("a"));

  ExecutionReport report;
  report.request_id = "a";
  report.verdict = Verdict::MLE;
  report.metrics = {120'000, 262'144, 150'000};
  report.stdout_truncated = true;
  report.started_at = 1'700'000'000'000'000;
  report.finished_at = 1'700'000'000'500'000;
  store.Write(report);

  auto row = store.Get("a");
  ASSERT_TRUE(row);
  EXPECT_EQ(row->verdict, "MLE");
  EXPECT_EQ(row->cpu_time, 120'000);
  EXPECT_EQ(row->memory_peak, 262'144);
  EXPECT_EQ(row->wall_time, 150'000);
  EXPECT_TRUE(row->stdout_truncated);
  EXPECT_FALSE(row->stderr_truncated);
  EXPECT_EQ(row->finished_at, 1'700'000'000'500'000);

  // a redelivered request replaces its row
  report.verdict = Verdict::AC;
  report.message = "second run";
  store.Write(report);
  row = store.Get("a");
  ASSERT_TRUE(row);
  EXPECT_EQ(row->verdict, "AC");
  EXPECT_EQ(row->message, "second run");
}
