#include <invoker/pipeline.h>

#include <spdlog/spdlog.h>
#include <invoker/errors.h>
#include <invoker/compare.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr fs::perms kPerm644 = fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 = fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// files handed to a checker, relative to the workdir
const char kVerifyDir[] = ".verify";

PipelineState StageState(StageKind kind) {
  switch (kind) {
    case StageKind::PREPARE: return PipelineState::PREPARING;
    case StageKind::COMPILE: return PipelineState::COMPILING;
    case StageKind::RUN: return PipelineState::RUNNING;
    case StageKind::VERIFY: return PipelineState::VERIFYING;
    case StageKind::CLEANUP: return PipelineState::CLEANING_UP;
  }
  __builtin_unreachable();
}

} // namespace

const char* PipelineStateName(PipelineState state) {
  static const char* kTable[] = {
#define X(name) #name,
    ENUM_PIPELINE_STATE_
#undef X
  };
  return kTable[(int)state];
}

ExecutionPipeline::ExecutionPipeline(const ExecutionRequest& req, IsolationEnvironment& env,
                                     Reporter* reporter) :
    req_(req), env_(env), reporter_(reporter),
    state_(PipelineState::PREPARING), cancelled_(false),
    current_env_(nullptr), ran_(false) {}

void ExecutionPipeline::Transition_(PipelineState next) {
  if ((int)next <= (int)state_.load()) return;
  spdlog::debug("Request {}: {} -> {}", req_.id, PipelineStateName(state_), PipelineStateName(next));
  state_ = next;
}

void ExecutionPipeline::Cancel() {
  cancelled_ = true;
  std::lock_guard lck(env_mtx_);
  if (current_env_) current_env_->Cancel();
}

StageResult ExecutionPipeline::Execute_(IsolationEnvironment& env, const StageSpec& spec,
                                        const std::string& name) {
  ProcessSpec proc;
  proc.command = spec.command;
  proc.envs = spec.envs;
  proc.limits = req_.StageLimits(spec);
  if (spec.kind == StageKind::RUN) {
    proc.stdin_file = env.PrivateDir() / "stdin";
    proc.limit_output = true;
  }
  // Cancel() reaches the environment only while it is current
  class CurrentEnv {
    ExecutionPipeline& pipeline_;
   public:
    CurrentEnv(ExecutionPipeline& pipeline, IsolationEnvironment& env) : pipeline_(pipeline) {
      std::lock_guard lck(pipeline_.env_mtx_);
      pipeline_.current_env_ = &env;
      if (pipeline_.cancelled_) env.Cancel();
    }
    ~CurrentEnv() {
      std::lock_guard lck(pipeline_.env_mtx_);
      pipeline_.current_env_ = nullptr;
    }
  } current(*this, env);
  StageResult res = env.Execute(proc);
  res.stage_name = name;
  res.kind = spec.kind;
  return res;
}

StageResult ExecutionPipeline::Prepare_(const StageSpec& spec, const std::string& name) {
  fs::path workdir = env_.Workdir();
  for (auto& file : req_.files) {
    if (!WriteFileBeneath(workdir, file.path, file.content, file.executable ? kPerm755 : kPerm644,
                        env_.HostUid(), env_.HostGid())) {
      StageResult res;
      res.stage_name = name;
      res.kind = StageKind::PREPARE;
      res.error = "cannot write input file " + file.path;
      return res;
    }
  }
  // stdin is opened by the engine, so it never has to be readable by the program
  if (!WriteFile(env_.PrivateDir() / "stdin", req_.stdin_data,
                 fs::perms::owner_read | fs::perms::owner_write)) {
    StageResult res;
    res.stage_name = name;
    res.kind = StageKind::PREPARE;
    res.error = "cannot write stdin payload";
    return res;
  }
  if (!spec.command.empty()) return Execute_(env_, spec, name);
  StageResult res;
  res.stage_name = name;
  res.kind = StageKind::PREPARE;
  return res;
}

StageResult ExecutionPipeline::Compile_(const StageSpec& spec, const std::string& name,
                                        std::unique_ptr<IsolationEnvironment> env) {
  if (!env) return Execute_(env_, spec, name);

  spdlog::debug("Request {}: compiling in {}", req_.id, env->Name());
  StageResult res;
  res.stage_name = name;
  res.kind = spec.kind;
  if (!CopyTree(env_.Workdir(), env->Workdir(), env->HostUid(), env->HostGid())) {
    res.error = "cannot copy the workdir into the compile environment";
  } else {
    res = Execute_(*env, spec, name);
    if (!res.Failed() &&
        !CopyTree(env->Workdir(), env_.Workdir(), env_.HostUid(), env_.HostGid())) {
      res.error = "cannot copy the compile result back";
    }
  }
  env->Teardown();
  return res;
}

StageResult ExecutionPipeline::Verify_(const StageSpec& spec, const std::string& name,
                                       const std::vector<StageResult>& results) {
  const StageResult* run = nullptr;
  for (auto& i : results) {
    if (i.kind == StageKind::RUN) run = &i;
  }
  StageResult res;
  res.stage_name = name;
  res.kind = spec.kind;
  if (!run) {
    res.error = "no program output to verify";
    return res;
  }

  if (!spec.command.empty()) {
    fs::path rel = kVerifyDir;
    if (!WriteFileBeneath(env_.Workdir(), rel / "output", run->stdout_data, kPerm644,
                        env_.HostUid(), env_.HostGid()) ||
        !WriteFileBeneath(env_.Workdir(), rel / "answer", req_.expected_output, kPerm644,
                        env_.HostUid(), env_.HostGid())) {
      res.error = "cannot write checker input";
      return res;
    }
    // checker <output> <answer>
    StageSpec checker = spec;
    fs::path inside = BoxWorkdir("", true) / rel;
    checker.command.push_back((inside / "output").string());
    checker.command.push_back((inside / "answer").string());
    res = Execute_(env_, checker, name);
    if (res.exit_code == 1 && res.signal == 0) res.message = res.stdout_data;
    return res;
  }

  std::string message;
  bool accepted = CompareOutput(run->stdout_data, req_.expected_output,
                                req_.compare_mode, req_.compare_threshold, &message);
  res.exit_code = accepted ? 0 : 1;
  res.message = std::move(message);
  return res;
}

StageResult ExecutionPipeline::RunStage_(const StageSpec& spec, const std::string& name) {
  switch (spec.kind) {
    case StageKind::COMPILE: return Compile_(spec, name, nullptr);
    case StageKind::RUN: return Execute_(env_, spec, name);
    case StageKind::PREPARE: return Prepare_(spec, name);
    case StageKind::VERIFY: break; // needs the earlier results
    case StageKind::CLEANUP: {
      if (!spec.command.empty()) return Execute_(env_, spec, name);
      StageResult res;
      res.stage_name = name;
      res.kind = spec.kind;
      return res;
    }
  }
  __builtin_unreachable();
}

std::vector<StageResult> ExecutionPipeline::Run() {
  if (ran_) throw EngineError(ErrorCode::INVALID_REQUEST, "pipeline of " + req_.id + " already ran");
  ran_ = true;

  std::vector<StageResult> results;
  bool failed = false;
  int kind_count[5] = {};
  auto run_stage = [&](const StageSpec& spec) {
    int& count = kind_count[(int)spec.kind];
    std::string name = StageKindName(spec.kind);
    if (count++) name += "." + std::to_string(count - 1);

    StageResult res;
    if (cancelled_ && spec.kind != StageKind::CLEANUP) {
      res.stage_name = name;
      res.kind = spec.kind;
      res.cancelled = true;
    } else {
      // not a stage failure: escapes Run() so that the request can be requeued
      std::unique_ptr<IsolationEnvironment> compile_env;
      if (spec.kind == StageKind::COMPILE && compile_env_factory_) compile_env = compile_env_factory_();
      try {
        if (compile_env) {
          res = Compile_(spec, name, std::move(compile_env));
        } else if (spec.kind == StageKind::VERIFY) {
          res = Verify_(spec, name, results);
        } else {
          res = RunStage_(spec, name);
        }
      } catch (const EngineError& err) {
        spdlog::warn("Request {}: stage {} failed: {}", req_.id, name, err.what());
        res = StageResult();
        res.stage_name = name;
        res.kind = spec.kind;
        res.error = err.what();
      }
    }
    spdlog::info("Request {}: stage {} exit={} signal={} breach={} cpu={}us mem={}KiB{}",
        req_.id, name, res.exit_code, res.signal, LimitKindName(res.breach),
        res.cpu_time, res.peak_memory, res.cancelled ? " cancelled" : "");
    if (res.Failed()) failed = true;
    if (reporter_) reporter_->ReportStageResult(req_, res);
    results.push_back(std::move(res));
  };

  // input payloads are written even if the request has no prepare stage
  if (req_.stages.empty() || req_.stages[0].kind != StageKind::PREPARE) {
    run_stage(StageSpec{StageKind::PREPARE, {}, {}, std::nullopt});
  }
  for (auto& spec : req_.stages) {
    if (spec.kind == StageKind::CLEANUP) continue;
    if (failed) break;
    Transition_(StageState(spec.kind));
    run_stage(spec);
  }
  Transition_(PipelineState::CLEANING_UP);
  for (auto& spec : req_.stages) {
    if (spec.kind == StageKind::CLEANUP) run_stage(spec);
  }
  Transition_(PipelineState::DONE);
  return results;
}
