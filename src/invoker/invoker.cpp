#include <invoker/invoker.h>

#include <chrono>
#include <random>
#include <thread>
#include <functional>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <invoker/utils.h>
#include <invoker/verdict.h>
#include "utils.h"

int kMaxParallel = 1;
int kMaxAttempts = 3;
bool kSeparateCompileEnvironment = false;

namespace {

constexpr long kIdleMinMs = 800, kIdleMaxMs = 1200;
constexpr long kBackoffBaseMs = 100, kBackoffMaxMs = 10000;
// give up on an unavailable queue after this many tries if not looping
constexpr int kOneShotTries = 3;

long Jitter(long lo, long hi) {
  thread_local std::mt19937 gen(std::random_device{}());
  return std::uniform_int_distribution<long>(lo, hi)(gen);
}

ExecutionReport ErrorReport(const std::string& id, const std::string& message, int64_t started_at) {
  ExecutionReport report;
  report.request_id = id;
  report.verdict = Verdict::SE;
  report.message = message;
  report.started_at = started_at;
  return report;
}

} // namespace

Invoker::Invoker(QueueConsumer& queue, ResultStore& store, EnvironmentBuilder& builder,
                 Reporter* reporter) :
    queue_(queue), store_(store), builder_(builder), reporter_(reporter), stop_(false) {}

bool Invoker::Sleep_(long ms) {
  std::unique_lock lck(mtx_);
  return !cv_.wait_for(lck, std::chrono::milliseconds(ms), [this]() { return stop_.load(); });
}

void Invoker::Stop() {
  {
    std::lock_guard lck(mtx_);
    stop_ = true;
  }
  spdlog::info("Stopping; running requests will be finished");
  cv_.notify_all();
}

bool Invoker::Cancel(const std::string& request_id) {
  std::lock_guard lck(mtx_);
  auto it = running_.find(request_id);
  if (it == running_.end() || !it->second) return false;
  spdlog::info("Cancelling request {}", request_id);
  it->second->Cancel();
  return true;
}

std::optional<ExecutionRequest> Invoker::Dequeue_(bool loop) {
  long backoff = kBackoffBaseMs;
  for (int tries = 1; !stop_; tries++) {
    try {
      return queue_.Dequeue();
    } catch (const EngineError& err) {
      spdlog::error("Cannot dequeue: {}", err.what());
      if (reporter_) reporter_->ReportAlert("", err);
      if (!loop && tries >= kOneShotTries) return std::nullopt;
    }
    if (!Sleep_(Jitter(backoff / 2, backoff))) break;
    backoff = std::min(backoff * 2, kBackoffMaxMs);
  }
  return std::nullopt;
}

void Invoker::WorkerLoop_(bool loop, SlotPool& slots) {
  while (!stop_) {
    WorkerSlot slot = slots.Acquire();
    std::optional<ExecutionRequest> req = Dequeue_(loop);
    if (!req) {
      if (!loop) break;
      slot.Release();
      Sleep_(Jitter(kIdleMinMs, kIdleMaxMs));
      continue;
    }
    spdlog::debug("Request {} in slot {}", req->id, slot.Index());
    try {
      Process(*req);
    } catch (const std::exception& err) {
      // the verdict could not be delivered; the queue redelivers the request
      spdlog::error("Request {} aborted: {}", req->id, err.what());
    }
  }
}

void Invoker::WorkLoop(bool loop) {
  int parallel = std::max(kMaxParallel, 1);
  spdlog::info("Starting {} workers", parallel);
  SlotPool slots(parallel);
  std::vector<std::thread> workers;
  for (int i = 0; i < parallel; i++) {
    workers.emplace_back(&Invoker::WorkerLoop_, this, loop, std::ref(slots));
  }
  for (auto& thr : workers) thr.join();
  spdlog::info("All workers stopped");
}

void Invoker::Finish_(const ExecutionRequest& req, ExecutionReport& report) {
  report.finished_at = UnixMicroseconds();
  spdlog::info("Request {} finished: {} cpu={}us mem={}KiB wall={}us{}", req.id,
      VerdictToAbr(report.verdict), report.metrics.cpu_time, report.metrics.memory_peak,
      report.metrics.wall_time, report.message.empty() ? "" : " (" + report.message + ")");
  try {
    store_.Write(report);
  } catch (const std::exception& err) {
    // the queue acknowledgement carries the report as well
    spdlog::error("Cannot persist the result of {}: {}", req.id, err.what());
  }
  queue_.Ack(req.id, report);
  if (reporter_) reporter_->ReportVerdict(req, report);
}

void Invoker::FailBuild_(const ExecutionRequest& req, const EngineError& err, int64_t started_at) {
  spdlog::error("Cannot build environment for {} (attempt {}): {}", req.id, req.attempt, err.what());
  if (reporter_) reporter_->ReportAlert(req.id, err);
  if (!err.IsInfrastructure() || req.attempt + 1 >= kMaxAttempts) {
    ExecutionReport report = ErrorReport(req.id, err.what(), started_at);
    Finish_(req, report);
  } else {
    queue_.Nack(req.id, err.what());
  }
}

void Invoker::Process(const ExecutionRequest& req) {
  int64_t started_at = UnixMicroseconds();
  spdlog::info("Processing request {} (attempt {})", req.id, req.attempt);
  try {
    ValidateRequest(req);
  } catch (const EngineError& err) {
    spdlog::warn("Rejecting request {}: {}", req.id, err.what());
    ExecutionReport report = ErrorReport(req.id, err.what(), started_at);
    Finish_(req, report);
    return;
  }

  // destroyed in reverse order: unregister, then the pipeline, then the environment
  std::unique_ptr<IsolationEnvironment> env;
  std::optional<ExecutionPipeline> pipeline;
  {
    std::lock_guard lck(mtx_);
    if (!running_.emplace(req.id, nullptr).second) {
      spdlog::warn("Request {} is already running", req.id);
      queue_.Nack(req.id, "already running");
      return;
    }
  }
  struct Unregister {
    Invoker& self;
    const std::string& id;
    ~Unregister() {
      std::lock_guard lck(self.mtx_);
      self.running_.erase(id);
    }
  } unregister{*this, req.id};

  const std::string name = req.id + "-" + std::to_string(req.attempt);
  try {
    env = builder_.Build(name, req.limits, kRootfsTemplate);
  } catch (const EngineError& err) {
    FailBuild_(req, err, started_at);
    return;
  }

  ExecutionReport report;
  std::optional<EngineError> build_error;
  try {
    pipeline.emplace(req, *env, reporter_);
    if (kSeparateCompileEnvironment) {
      pipeline->SetCompileEnvironmentFactory([this, &req, name]() {
        return builder_.Build(name + "-compile", req.limits, kRootfsTemplate);
      });
    }
    {
      std::lock_guard lck(mtx_);
      running_[req.id] = &*pipeline;
    }
    std::vector<StageResult> results;
    try {
      results = pipeline->Run();
    } catch (const EngineError& err) {
      // the compile environment could not be built
      build_error = err;
    }
    try {
      env->Teardown();
    } catch (const EngineError& err) {
      // the verdict stands; the environment is abandoned
      spdlog::error("Teardown of {} failed: {}", name, err.what());
      if (reporter_) reporter_->ReportAlert(req.id, err);
    }
    if (!build_error) {
      report.request_id = req.id;
      report.started_at = started_at;
      report.verdict = EvaluateVerdict(results, &report.message);
      report.metrics = SummarizeMetrics(results);
      for (auto& res : results) {
        report.stdout_truncated |= res.stdout_truncated;
        report.stderr_truncated |= res.stderr_truncated;
      }
      report.stages = std::move(results);
    }
  } catch (const std::exception& err) {
    spdlog::error("Request {} failed in the engine: {}", req.id, err.what());
    report = ErrorReport(req.id, err.what(), started_at);
  }
  if (build_error) {
    FailBuild_(req, *build_error, started_at);
    return;
  }
  Finish_(req, report);
}
