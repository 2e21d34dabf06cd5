#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <deque>
#include <mutex>
#include <atomic>
#include <functional>
#include <unordered_map>

#include <gtest/gtest.h>
#include <invoker/invoker.h>
#include <invoker/environment.h>

// scratch directory of the whole test run; removed at exit
fs::path TestRoot();
// a new empty directory under TestRoot()
fs::path MakeTempDir(const std::string& prefix);

// {cpu=1s, memory=256MB, wall=2s}; prepare, compile, run & verify stages
ExecutionRequest MakeRequest(const std::string& id);

StageResult ExitResult(int exit_code, const std::string& out = "");

// Environment running nothing. Stages are answered by handler (exit 0 by default).
class FakeEnvironment : public IsolationEnvironment {
 public:
  using Handler = std::function<StageResult(FakeEnvironment&, const ProcessSpec&)>;

 private:
  std::string name_;
  fs::path root_;
  Handler handler_;
  std::atomic_bool cancelled_;
  std::atomic_int* live_;

 public:
  std::vector<ProcessSpec> executed;
  int teardowns;
  bool fail_teardown;

  FakeEnvironment(const std::string& name, Handler handler, std::atomic_int* live = nullptr);
  ~FakeEnvironment() override;

  const std::string& Name() const override { return name_; }
  fs::path Workdir() const override { return root_ / "workdir"; }
  fs::path PrivateDir() const override { return root_ / "private"; }
  int HostUid() const override;
  int HostGid() const override;

  StageResult Execute(const ProcessSpec& spec) override;
  void Cancel() override { cancelled_ = true; }
  void Teardown() override;
  bool Cancelled() const { return cancelled_; }
};

class FakeEnvironmentBuilder : public EnvironmentBuilder {
  std::mutex mtx_;
 public:
  FakeEnvironment::Handler handler;
  // the next build_failures builds throw EngineError(failure_code)
  int build_failures;
  // same for builds of a separate compile environment
  int compile_build_failures;
  ErrorCode failure_code;
  std::vector<std::string> built;
  std::atomic_int live;
  int reconciles;

  FakeEnvironmentBuilder() : build_failures(0), compile_build_failures(0), failure_code(ErrorCode::NAMESPACE_ALLOCATION_EXHAUSTED),
      live(0), reconciles(0) {}

  std::unique_ptr<IsolationEnvironment> Build(
      const std::string& name, const ResourceLimits& limits, const fs::path& rootfs_template) override;
  void Reconcile() override { reconciles++; }
};

class MemoryQueue : public QueueConsumer {
  std::mutex mtx_;
  std::deque<ExecutionRequest> pending_;
  std::unordered_map<std::string, ExecutionRequest> claimed_;
 public:
  std::unordered_map<std::string, ExecutionReport> acked;
  std::vector<std::pair<std::string, std::string>> nacked;
  // the next unavailable Dequeue calls throw QUEUE_UNAVAILABLE
  int unavailable;

  MemoryQueue() : unavailable(0) {}

  void Push(const ExecutionRequest& req);
  size_t Pending();
  size_t Acked();

  std::optional<ExecutionRequest> Dequeue() override;
  void Ack(const std::string& request_id, const ExecutionReport& report) override;
  void Nack(const std::string& request_id, const std::string& reason) override;
};

class MemoryStore : public ResultStore {
  std::mutex mtx_;
 public:
  std::vector<ExecutionReport> reports;
  void Write(const ExecutionReport& report) override {
    std::lock_guard lck(mtx_);
    reports.push_back(report);
  }
};

#endif // TEST_UTILS_H_
