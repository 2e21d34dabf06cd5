#ifndef INCLUDE_INVOKER_PIPELINE_H_
#define INCLUDE_INVOKER_PIPELINE_H_

#include <mutex>
#include <atomic>
#include <memory>
#include <vector>
#include <functional>

#include "request.h"
#include "reporter.h"
#include "environment.h"

#define ENUM_PIPELINE_STATE_ \
  X(PREPARING) \
  X(COMPILING) \
  X(RUNNING) \
  X(VERIFYING) \
  X(CLEANING_UP) \
  X(DONE)
enum class PipelineState {
#define X(name) name,
  ENUM_PIPELINE_STATE_
#undef X
};

const char* PipelineStateName(PipelineState);

// Runs the stages of one request in order inside one environment.
// A failed stage skips everything up to the cleanup stage, which always runs.
class ExecutionPipeline {
 public:
  // builds a separate environment for the compile stage; it is torn down right after the stage.
  // An EngineError it throws is not turned into a stage result: it escapes Run().
  using CompileEnvironmentFactory = std::function<std::unique_ptr<IsolationEnvironment>()>;

 private:
  const ExecutionRequest& req_;
  IsolationEnvironment& env_;
  CompileEnvironmentFactory compile_env_factory_;
  Reporter* reporter_;

  std::atomic<PipelineState> state_;
  std::atomic_bool cancelled_;
  std::mutex env_mtx_;
  IsolationEnvironment* current_env_;
  bool ran_;

  void Transition_(PipelineState);
  StageResult RunStage_(const StageSpec&, const std::string& name);
  StageResult Prepare_(const StageSpec&, const std::string& name);
  // env: separate compile environment, or nullptr to compile in the main one
  StageResult Compile_(const StageSpec&, const std::string& name, std::unique_ptr<IsolationEnvironment> env);
  StageResult Verify_(const StageSpec&, const std::string& name, const std::vector<StageResult>&);
  StageResult Execute_(IsolationEnvironment&, const StageSpec&, const std::string& name);
 public:
  ExecutionPipeline(const ExecutionRequest& req, IsolationEnvironment& env, Reporter* reporter = nullptr);

  void SetCompileEnvironmentFactory(CompileEnvironmentFactory factory) {
    compile_env_factory_ = std::move(factory);
  }

  // Can only be called once. Returns one result per stage reached, in order; the input
  // payloads are written by a leading prepare result even if the request has no prepare stage.
  // Throws EngineError only if the compile environment cannot be built.
  std::vector<StageResult> Run();
  PipelineState State() const { return state_; }
  // thread-safe
  void Cancel();
};

#endif  // INCLUDE_INVOKER_PIPELINE_H_
