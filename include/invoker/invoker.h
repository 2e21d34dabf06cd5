#ifndef INCLUDE_INVOKER_INVOKER_H_
#define INCLUDE_INVOKER_INVOKER_H_

#include <mutex>
#include <atomic>
#include <string>
#include <optional>
#include <unordered_map>
#include <condition_variable>

#include "errors.h"
#include "request.h"
#include "reporter.h"
#include "pipeline.h"
#include "slots.h"
#include "environment.h"

extern int kMaxParallel;
// a request failing to get an environment this many times is given a SystemError
extern int kMaxAttempts;
extern bool kSeparateCompileEnvironment;

class QueueConsumer {
 public:
  virtual ~QueueConsumer() = default;
  // std::nullopt if nothing is pending; throws EngineError(QUEUE_UNAVAILABLE)
  virtual std::optional<ExecutionRequest> Dequeue() = 0;
  // final: the request will not be delivered again
  virtual void Ack(const std::string& request_id, const ExecutionReport& report) = 0;
  // requeue with the attempt counter increased
  virtual void Nack(const std::string& request_id, const std::string& reason) = 0;
};

class ResultStore {
 public:
  virtual ~ResultStore() = default;
  virtual void Write(const ExecutionReport&) = 0;
};

class Invoker {
  QueueConsumer& queue_;
  ResultStore& store_;
  EnvironmentBuilder& builder_;
  Reporter* reporter_;

  std::atomic_bool stop_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::unordered_map<std::string, ExecutionPipeline*> running_;

  // returns false if stopped during the sleep
  bool Sleep_(long ms);
  std::optional<ExecutionRequest> Dequeue_(bool loop);
  void WorkerLoop_(bool loop, SlotPool& slots);
  void Finish_(const ExecutionRequest&, ExecutionReport&);
  void FailBuild_(const ExecutionRequest&, const EngineError&, int64_t started_at);
 public:
  Invoker(QueueConsumer& queue, ResultStore& store, EnvironmentBuilder& builder,
          Reporter* reporter = nullptr);

  // Run kMaxParallel workers until Stop() (loop = true) or until the queue is empty (loop = false).
  void WorkLoop(bool loop = true);
  // Stop dequeuing; running requests are finished first. Can be called from any thread.
  void Stop();
  // returns false if the request is not running
  bool Cancel(const std::string& request_id);
  // handle one dequeued request; exactly one of Ack/Nack is called
  void Process(const ExecutionRequest& req);
};

#endif  // INCLUDE_INVOKER_INVOKER_H_
