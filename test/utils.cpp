#include "utils.h"

#include <unistd.h>
#include <fstream>
#include <sstream>

fs::path TestRoot() {
  static const fs::path root = fs::temp_directory_path() / ("invoker_test." + std::to_string(getpid()));
  return root;
}

fs::path MakeTempDir(const std::string& prefix) {
  static std::atomic_int counter = 0;
  fs::path dir = TestRoot() / (prefix + "." + std::to_string(counter++));
  fs::create_directories(dir);
  return dir;
}

ExecutionRequest MakeRequest(const std::string& id) {
  ExecutionRequest req;
  req.id = id;
  req.limits.cpu_time = 1'000'000;
  req.limits.wall_time = 2'000'000;
  req.limits.memory = 256 * 1024;
  req.stages = {
    {StageKind::PREPARE, {}, {}, std::nullopt},
    {StageKind::COMPILE, {"/usr/bin/g++", "-O2", "-o", "prog", "prog.cpp"}, {}, std::nullopt},
    {StageKind::RUN, {"./prog"}, {}, std::nullopt},
    {StageKind::VERIFY, {}, {}, std::nullopt},
  };
  req.files.push_back({"prog.cpp", "int main() {}\n", false});
  req.stdin_data = "1 2\n";
  req.expected_output = "1 2\n";
  return req;
}

StageResult ExitResult(int exit_code, const std::string& out) {
  StageResult res;
  res.executed = true;
  res.exit_code = exit_code;
  res.stdout_data = out;
  return res;
}

FakeEnvironment::FakeEnvironment(const std::string& name, Handler handler, std::atomic_int* live) :
    name_(name), root_(MakeTempDir("env-" + name)), handler_(std::move(handler)),
    cancelled_(false), live_(live), teardowns(0), fail_teardown(false) {
  fs::create_directories(Workdir());
  fs::create_directories(PrivateDir());
  if (live_) ++*live_;
}

FakeEnvironment::~FakeEnvironment() {
  if (live_) --*live_;
  std::error_code ec;
  fs::remove_all(root_, ec);
}

int FakeEnvironment::HostUid() const {
  return getuid();
}

int FakeEnvironment::HostGid() const {
  return getgid();
}

StageResult FakeEnvironment::Execute(const ProcessSpec& spec) {
  executed.push_back(spec);
  if (cancelled_) {
    StageResult res;
    res.cancelled = true;
    return res;
  }
  if (handler_) return handler_(*this, spec);
  // behaves like cat
  std::string input;
  if (!spec.stdin_file.empty()) {
    std::ifstream fin(spec.stdin_file);
    std::stringstream ss;
    ss << fin.rdbuf();
    input = ss.str();
  }
  return ExitResult(0, input);
}

void FakeEnvironment::Teardown() {
  teardowns++;
  if (fail_teardown) throw EngineError(ErrorCode::TEARDOWN_TIMEOUT, name_ + " cannot be torn down");
}

std::unique_ptr<IsolationEnvironment> FakeEnvironmentBuilder::Build(
    const std::string& name, const ResourceLimits& limits, const fs::path&) {
  limits.Validate();
  std::lock_guard lck(mtx_);
  bool compile = name.size() > 8 && name.compare(name.size() - 8, 8, "-compile") == 0;
  int& failures = compile ? compile_build_failures : build_failures;
  if (failures > 0) {
    failures--;
    throw EngineError(failure_code, "injected failure for " + name);
  }
  built.push_back(name);
  return std::make_unique<FakeEnvironment>(name, handler, &live);
}

void MemoryQueue::Push(const ExecutionRequest& req) {
  std::lock_guard lck(mtx_);
  pending_.push_back(req);
}

size_t MemoryQueue::Pending() {
  std::lock_guard lck(mtx_);
  return pending_.size();
}

size_t MemoryQueue::Acked() {
  std::lock_guard lck(mtx_);
  return acked.size();
}

std::optional<ExecutionRequest> MemoryQueue::Dequeue() {
  std::lock_guard lck(mtx_);
  if (unavailable > 0) {
    unavailable--;
    throw EngineError(ErrorCode::QUEUE_UNAVAILABLE, "injected failure");
  }
  if (pending_.empty()) return std::nullopt;
  ExecutionRequest req = std::move(pending_.front());
  pending_.pop_front();
  claimed_[req.id] = req;
  return req;
}

void MemoryQueue::Ack(const std::string& request_id, const ExecutionReport& report) {
  std::lock_guard lck(mtx_);
  claimed_.erase(request_id);
  acked[request_id] = report;
}

void MemoryQueue::Nack(const std::string& request_id, const std::string& reason) {
  std::lock_guard lck(mtx_);
  nacked.emplace_back(request_id, reason);
  auto it = claimed_.find(request_id);
  if (it == claimed_.end()) return;
  it->second.attempt++;
  pending_.push_back(std::move(it->second));
  claimed_.erase(it);
}
