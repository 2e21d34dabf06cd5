#include <signal.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>
#include <thread>
#include <gtest/gtest.h>
#include <invoker/reporter.h>
#include <invoker/pipeline.h>
#include <invoker/verdict.h>
#include "utils.h"

namespace {

class StageRecorder : public Reporter {
 public:
  std::vector<std::string> stages;
  void ReportStageResult(const ExecutionRequest&, const StageResult& res) override {
    stages.push_back(res.stage_name);
  }
};

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

// answers every stage of the given kind by func, other stages like the default environment
FakeEnvironment::Handler OnStage(const std::string& first_arg,
                                 std::function<StageResult(const ProcessSpec&)> func) {
  return [first_arg, func](FakeEnvironment&, const ProcessSpec& spec) {
    if (!spec.command.empty() && spec.command[0] == first_arg) return func(spec);
    std::string input;
    if (!spec.stdin_file.empty()) input = ReadAll(spec.stdin_file);
    return ExitResult(0, input);
  };
}

} // namespace

TEST(ExecutionPipeline, Accepted) {
  ExecutionRequest req = MakeRequest("accepted");
  req.stages.push_back({StageKind::CLEANUP, {"/bin/true"}, {}, std::nullopt});
  FakeEnvironment env("accepted", nullptr);
  StageRecorder recorder;
  ExecutionPipeline pipeline(req, env, &recorder);
  EXPECT_EQ(pipeline.State(), PipelineState::PREPARING);
  auto results = pipeline.Run();
  EXPECT_EQ(pipeline.State(), PipelineState::DONE);
  EXPECT_EQ(recorder.stages, (std::vector<std::string>{"prepare", "compile", "run", "verify", "cleanup"}));
  ASSERT_EQ(results.size(), 5u);
  EXPECT_FALSE(results[0].executed);
  EXPECT_FALSE(results[3].executed);
  EXPECT_EQ(EvaluateVerdict(results), Verdict::AC);

  // inputs were written before anything ran
  EXPECT_EQ(ReadAll(env.Workdir() / "prog.cpp"), "int main() {}\n");
  EXPECT_EQ(ReadAll(env.PrivateDir() / "stdin"), "1 2\n");
  // compile, run, cleanup
  ASSERT_EQ(env.executed.size(), 3u);
  EXPECT_FALSE(env.executed[0].limit_output);
  EXPECT_TRUE(env.executed[1].limit_output);
  EXPECT_EQ(env.executed[1].stdin_file, env.PrivateDir() / "stdin");
  EXPECT_EQ(env.executed[1].limits.cpu_time, req.limits.cpu_time);
  EXPECT_THROW(pipeline.Run(), EngineError);
}

TEST(ExecutionPipeline, PrepareWithoutStage) {
  ExecutionRequest req = MakeRequest("no-prepare");
  req.stages.erase(req.stages.begin());
  req.files.push_back({"data/in.txt", "x", true});
  FakeEnvironment env("no-prepare", nullptr);
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  ASSERT_FALSE(results.empty());
  EXPECT_EQ(results[0].kind, StageKind::PREPARE);
  EXPECT_EQ(ReadAll(env.Workdir() / "data" / "in.txt"), "x");
  auto perms = fs::status(env.Workdir() / "data" / "in.txt").permissions();
  EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
  EXPECT_EQ(EvaluateVerdict(results), Verdict::AC);
}

TEST(ExecutionPipeline, CompileErrorSkipsToCleanup) {
  ExecutionRequest req = MakeRequest("ce");
  req.stages.push_back({StageKind::CLEANUP, {"/bin/true"}, {}, std::nullopt});
  FakeEnvironment env("ce", OnStage("/usr/bin/g++", [](const ProcessSpec&) {
    StageResult res = ExitResult(1);
    res.stderr_data = "prog.cpp:1:1: error";
    return res;
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[1].kind, StageKind::COMPILE);
  EXPECT_EQ(results[2].kind, StageKind::CLEANUP);
  EXPECT_EQ(pipeline.State(), PipelineState::DONE);
  EXPECT_EQ(EvaluateVerdict(results), Verdict::CE);
}

TEST(ExecutionPipeline, WrongOutput) {
  ExecutionRequest req = MakeRequest("wa");
  req.expected_output = "3\n";
  FakeEnvironment env("wa", nullptr);
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[3].exit_code, 1);
  EXPECT_FALSE(results[3].message.empty());
  EXPECT_EQ(EvaluateVerdict(results), Verdict::WA);
}

TEST(ExecutionPipeline, CheckerCommand) {
  ExecutionRequest req = MakeRequest("checker");
  req.stages[3].command = {"./checker"};
  std::vector<std::string> checker_args;
  FakeEnvironment env("checker", OnStage("./checker", [&](const ProcessSpec& spec) {
    checker_args = spec.command;
    return ExitResult(1, "expected 1 2");
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  EXPECT_EQ(checker_args, (std::vector<std::string>{
      "./checker", "/workdir/.verify/output", "/workdir/.verify/answer"}));
  EXPECT_EQ(ReadAll(env.Workdir() / ".verify" / "answer"), "1 2\n");
  EXPECT_EQ(ReadAll(env.Workdir() / ".verify" / "output"), "1 2\n");
  std::string message;
  EXPECT_EQ(EvaluateVerdict(results, &message), Verdict::WA);
  EXPECT_EQ(message, "expected 1 2");
}

TEST(ExecutionPipeline, CheckerInputNotFollowingSymlinks) {
  ExecutionRequest req = MakeRequest("verify-link");
  req.stages[3].command = {"./checker"};
  fs::path outside = MakeTempDir("outside");
  fs::permissions(outside, fs::perms::owner_all);
  bool checker_ran = false;
  FakeEnvironment env("verify-link", [&](FakeEnvironment& self, const ProcessSpec& spec) {
    if (spec.command[0] == "./checker") checker_ran = true;
    if (spec.command[0] != "./prog") return ExitResult(0);
    // the program replaces the checker input directory with a link out of the workdir
    fs::create_directory_symlink(outside, self.Workdir() / ".verify");
    return ExitResult(0, "1 2\n");
  });
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  EXPECT_FALSE(checker_ran);
  EXPECT_FALSE(fs::exists(outside / "output"));
  EXPECT_FALSE(fs::exists(outside / "answer"));
  EXPECT_EQ(fs::status(outside).permissions() & fs::perms::mask, fs::perms::owner_all);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_FALSE(results[3].error.empty());
  EXPECT_EQ(EvaluateVerdict(results), Verdict::SE);
}

TEST(ExecutionPipeline, CheckerInputReplacesSpecialFiles) {
  ExecutionRequest req = MakeRequest("verify-fifo");
  req.stages[3].command = {"./checker"};
  FakeEnvironment env("verify-fifo", OnStage("./prog", [&](const ProcessSpec&) {
    fs::create_directory(env.Workdir() / ".verify");
    EXPECT_EQ(mkfifo((env.Workdir() / ".verify" / "output").c_str(), 0666), 0);
    return ExitResult(0, "1 2\n");
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  EXPECT_TRUE(fs::is_regular_file(fs::symlink_status(env.Workdir() / ".verify" / "output")));
  EXPECT_EQ(ReadAll(env.Workdir() / ".verify" / "output"), "1 2\n");
  EXPECT_EQ(EvaluateVerdict(results), Verdict::AC);
}

TEST(ExecutionPipeline, RepeatedPrepareNotFollowingSymlinks) {
  ExecutionRequest req = MakeRequest("prepare-link");
  req.stages.insert(req.stages.begin() + 1, {StageKind::PREPARE, {}, {}, std::nullopt});
  req.stages[0].command = {"./setup"};
  req.files.push_back({"data/in.txt", "x", false});
  fs::path outside = MakeTempDir("outside");
  FakeEnvironment env("prepare-link", OnStage("./setup", [&](const ProcessSpec&) {
    fs::remove_all(env.Workdir() / "data");
    fs::create_directory_symlink(outside, env.Workdir() / "data");
    return ExitResult(0);
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  EXPECT_FALSE(fs::exists(outside / "in.txt"));
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].stage_name, "prepare.1");
  EXPECT_FALSE(results[1].error.empty());
  EXPECT_EQ(EvaluateVerdict(results), Verdict::SE);
}

TEST(ExecutionPipeline, InfrastructureErrorInStage) {
  ExecutionRequest req = MakeRequest("spawn");
  FakeEnvironment env("spawn", OnStage("./prog", [](const ProcessSpec&) -> StageResult {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED, "pids controller missing");
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  ASSERT_EQ(results.size(), 3u);
  EXPECT_FALSE(results[2].error.empty());
  EXPECT_EQ(pipeline.State(), PipelineState::DONE);
  EXPECT_EQ(EvaluateVerdict(results), Verdict::SE);
}

TEST(ExecutionPipeline, OutputBreachStopsPipeline) {
  ExecutionRequest req = MakeRequest("ole");
  FakeEnvironment env("ole", OnStage("./prog", [](const ProcessSpec& spec) {
    EXPECT_TRUE(spec.limit_output);
    StageResult res = ExitResult(0);
    res.signal = SIGKILL;
    res.breach = LimitKind::OUTPUT;
    res.stdout_truncated = true;
    return res;
  }));
  ExecutionPipeline pipeline(req, env);
  auto results = pipeline.Run();
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(EvaluateVerdict(results), Verdict::OLE);
}

TEST(ExecutionPipeline, SeparateCompileEnvironment) {
  ExecutionRequest req = MakeRequest("separate");
  FakeEnvironment env("separate", nullptr);
  std::atomic_int live = 0;
  int built = 0;
  ExecutionPipeline pipeline(req, env);
  pipeline.SetCompileEnvironmentFactory([&]() -> std::unique_ptr<IsolationEnvironment> {
    built++;
    return std::make_unique<FakeEnvironment>("separate-compile",
        [](FakeEnvironment& self, const ProcessSpec&) {
      // the compile environment sees the sources and leaves a binary
      EXPECT_TRUE(fs::exists(self.Workdir() / "prog.cpp"));
      std::ofstream(self.Workdir() / "prog") << "binary";
      return ExitResult(0);
    }, &live);
  });
  auto results = pipeline.Run();
  EXPECT_EQ(built, 1);
  // destroyed right after the stage
  EXPECT_EQ(live, 0);
  EXPECT_EQ(ReadAll(env.Workdir() / "prog"), "binary");
  // compile ran elsewhere; run in the main environment
  ASSERT_EQ(env.executed.size(), 1u);
  EXPECT_EQ(env.executed[0].command[0], "./prog");
  EXPECT_EQ(EvaluateVerdict(results), Verdict::AC);
}

TEST(ExecutionPipeline, CompileEnvironmentUnavailable) {
  ExecutionRequest req = MakeRequest("no-compile-env");
  FakeEnvironment env("no-compile-env", nullptr);
  StageRecorder recorder;
  ExecutionPipeline pipeline(req, env, &recorder);
  pipeline.SetCompileEnvironmentFactory([]() -> std::unique_ptr<IsolationEnvironment> {
    throw EngineError(ErrorCode::NAMESPACE_ALLOCATION_EXHAUSTED, "no ids");
  });
  try {
    pipeline.Run();
    FAIL() << "build failure turned into a stage result";
  } catch (const EngineError& err) {
    EXPECT_EQ(err.code(), ErrorCode::NAMESPACE_ALLOCATION_EXHAUSTED);
  }
  EXPECT_EQ(recorder.stages, (std::vector<std::string>{"prepare"}));
  EXPECT_TRUE(env.executed.empty());
}

TEST(ExecutionPipeline, CancelWhileRunning) {
  ExecutionRequest req = MakeRequest("cancel");
  req.stages.push_back({StageKind::CLEANUP, {}, {}, std::nullopt});
  std::atomic_bool running = false;
  FakeEnvironment env("cancel", OnStage("./prog", [&](const ProcessSpec&) {
    running = true;
    while (!env.Cancelled()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    StageResult res = ExitResult(0);
    res.signal = SIGKILL;
    res.cancelled = true;
    return res;
  }));
  ExecutionPipeline pipeline(req, env);
  std::thread canceller([&]() {
    while (!running) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    pipeline.Cancel();
  });
  auto results = pipeline.Run();
  canceller.join();
  ASSERT_EQ(results.size(), 4u);
  EXPECT_TRUE(results[2].cancelled);
  EXPECT_EQ(results[3].kind, StageKind::CLEANUP);
  EXPECT_EQ(pipeline.State(), PipelineState::DONE);
  std::string message;
  EXPECT_EQ(EvaluateVerdict(results, &message), Verdict::SE);
  EXPECT_EQ(message, "cancelled");
}

TEST(ExecutionPipeline, CancelBeforeRun) {
  ExecutionRequest req = MakeRequest("early-cancel");
  FakeEnvironment env("early-cancel", nullptr);
  ExecutionPipeline pipeline(req, env);
  pipeline.Cancel();
  auto results = pipeline.Run();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0].cancelled);
  EXPECT_TRUE(env.executed.empty());
  EXPECT_EQ(EvaluateVerdict(results), Verdict::SE);
}

TEST(PipelineState, Names) {
  EXPECT_STREQ(PipelineStateName(PipelineState::CLEANING_UP), "CLEANING_UP");
  EXPECT_STREQ(PipelineStateName(PipelineState::DONE), "DONE");
}
