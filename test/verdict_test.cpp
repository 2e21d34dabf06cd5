#include <signal.h>
#include <gtest/gtest.h>
#include <invoker/utils.h>
#include <invoker/verdict.h>
#include "utils.h"

namespace {

StageResult Stage(StageKind kind, int exit_code = 0, int sig = 0, LimitKind breach = LimitKind::NONE) {
  StageResult res;
  res.stage_name = StageKindName(kind);
  res.kind = kind;
  res.executed = true;
  res.exit_code = exit_code;
  res.signal = sig;
  res.breach = breach;
  return res;
}

struct VerdictParam {
  std::string name;
  Verdict verdict;
  std::vector<StageResult> results;
};

std::string ParamName(const ::testing::TestParamInfo<VerdictParam>& info) {
  return std::string(VerdictToAbr(info.param.verdict)) + "_" + info.param.name;
}

const StageResult kPrepare = Stage(StageKind::PREPARE);
const StageResult kCompile = Stage(StageKind::COMPILE);
const StageResult kRun = Stage(StageKind::RUN);
const StageResult kVerify = Stage(StageKind::VERIFY);
const StageResult kCleanup = Stage(StageKind::CLEANUP);

StageResult Error(StageKind kind) {
  StageResult res = Stage(kind);
  res.error = "SPAWN_FAILED: exec: No such file or directory";
  return res;
}

StageResult Cancelled(StageKind kind) {
  StageResult res = Stage(kind, 0, SIGKILL);
  res.cancelled = true;
  return res;
}

} // namespace

class EvaluateVerdictTest : public testing::TestWithParam<VerdictParam> {};
TEST_P(EvaluateVerdictTest, Precedence) {
  auto& param = GetParam();
  std::string message;
  EXPECT_EQ(EvaluateVerdict(param.results, &message), param.verdict) << message;
  // deterministic
  EXPECT_EQ(EvaluateVerdict(param.results), param.verdict);
}

INSTANTIATE_TEST_SUITE_P(Stages, EvaluateVerdictTest,
    testing::Values(
      (VerdictParam){"all_passed", Verdict::AC, {kPrepare, kCompile, kRun, kVerify, kCleanup}},
      (VerdictParam){"cleanup_failure_ignored", Verdict::AC,
        {kPrepare, kRun, kVerify, Stage(StageKind::CLEANUP, 3)}},
      (VerdictParam){"compile_exit", Verdict::CE, {kPrepare, Stage(StageKind::COMPILE, 1), kCleanup}},
      (VerdictParam){"compile_timeout", Verdict::CE,
        {kPrepare, Stage(StageKind::COMPILE, 0, SIGKILL, LimitKind::WALL_TIME), kCleanup}},
      (VerdictParam){"run_exit", Verdict::RE, {kPrepare, kCompile, Stage(StageKind::RUN, 1), kCleanup}},
      (VerdictParam){"run_segv", Verdict::RE, {kPrepare, kCompile, Stage(StageKind::RUN, 0, SIGSEGV), kCleanup}},
      (VerdictParam){"run_cpu", Verdict::TLE,
        {kPrepare, Stage(StageKind::RUN, 0, SIGKILL, LimitKind::CPU_TIME), kCleanup}},
      (VerdictParam){"run_wall", Verdict::TLE,
        {kPrepare, Stage(StageKind::RUN, 0, SIGKILL, LimitKind::WALL_TIME), kCleanup}},
      // the breach decides even if the program exited with an error itself
      (VerdictParam){"run_memory", Verdict::MLE,
        {kPrepare, Stage(StageKind::RUN, 134, 0, LimitKind::MEMORY), kCleanup}},
      (VerdictParam){"run_output", Verdict::OLE,
        {kPrepare, Stage(StageKind::RUN, 0, SIGKILL, LimitKind::OUTPUT), kCleanup}},
      (VerdictParam){"run_sigxfsz", Verdict::OLE, {kPrepare, Stage(StageKind::RUN, 0, SIGXFSZ), kCleanup}},
      (VerdictParam){"run_processes", Verdict::RE,
        {kPrepare, Stage(StageKind::RUN, 1, 0, LimitKind::PROCESSES), kCleanup}},
      (VerdictParam){"verify_rejected", Verdict::WA, {kPrepare, kRun, Stage(StageKind::VERIFY, 1), kCleanup}},
      (VerdictParam){"checker_crashed", Verdict::SE,
        {kPrepare, kRun, Stage(StageKind::VERIFY, 0, SIGSEGV), kCleanup}},
      (VerdictParam){"checker_exit_2", Verdict::SE, {kPrepare, kRun, Stage(StageKind::VERIFY, 2), kCleanup}},
      (VerdictParam){"prepare_failed", Verdict::SE, {Stage(StageKind::PREPARE, 1), kCleanup}},
      (VerdictParam){"spawn_failed", Verdict::SE, {kPrepare, Error(StageKind::RUN), kCleanup}},
      // an engine failure anywhere overrides a verdict decided earlier
      (VerdictParam){"cleanup_error", Verdict::SE,
        {kPrepare, Stage(StageKind::RUN, 0, 0, LimitKind::WALL_TIME), Error(StageKind::CLEANUP)}},
      (VerdictParam){"cancelled", Verdict::SE, {kPrepare, kCompile, Cancelled(StageKind::RUN), kCleanup}}
    ),
    ParamName);

TEST(EvaluateVerdict, Messages) {
  std::string message;
  EvaluateVerdict({kPrepare, Cancelled(StageKind::RUN), kCleanup}, &message);
  EXPECT_EQ(message, "cancelled");
  StageResult verify = Stage(StageKind::VERIFY, 1);
  verify.message = "Line 1 differ.";
  EXPECT_EQ(EvaluateVerdict({kPrepare, kRun, verify}, &message), Verdict::WA);
  EXPECT_EQ(message, "Line 1 differ.");
  EXPECT_EQ(EvaluateVerdict({kPrepare, kRun, kVerify}, &message), Verdict::AC);
  EXPECT_TRUE(message.empty());
}

TEST(SummarizeMetrics, RunStagesOnly) {
  StageResult compile = Stage(StageKind::COMPILE);
  compile.cpu_time = 5'000'000;
  compile.wall_time = 6'000'000;
  compile.peak_memory = 500'000;
  StageResult run1 = Stage(StageKind::RUN), run2 = Stage(StageKind::RUN);
  run1.cpu_time = 100;
  run1.wall_time = 200;
  run1.peak_memory = 3000;
  run2.cpu_time = 50;
  run2.wall_time = 70;
  run2.peak_memory = 4000;
  RunMetrics metrics = SummarizeMetrics({kPrepare, compile, run1, run2, kVerify});
  EXPECT_EQ(metrics.cpu_time, 150);
  EXPECT_EQ(metrics.wall_time, 270);
  EXPECT_EQ(metrics.memory_peak, 4000);
}

TEST(Verdict, Names) {
  EXPECT_STREQ(VerdictToAbr(Verdict::TLE), "TLE");
  EXPECT_STREQ(VerdictToDesc(Verdict::WA), "Wrong Output");
  EXPECT_EQ(AbrToVerdict("MLE"), Verdict::MLE);
  EXPECT_EQ(AbrToVerdict("XX"), Verdict::NUL);
}
