#ifndef INCLUDE_INVOKER_REQUEST_H_
#define INCLUDE_INVOKER_REQUEST_H_

#include <string>
#include <vector>
#include <optional>

#include "limits.h"

// stages must appear in this order in a request
#define ENUM_STAGE_KIND_ \
  X(PREPARE, "prepare") \
  X(COMPILE, "compile") \
  X(RUN, "run") \
  X(VERIFY, "verify") \
  X(CLEANUP, "cleanup")
enum class StageKind {
#define X(name, str) name,
  ENUM_STAGE_KIND_
#undef X
};

#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Output") \
  X(CE, "CE", "Compile Error") \
  X(RE, "RE", "Runtime Error") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(MLE, "MLE", "Memory Limit Exceeded") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(SE, "SE", "System Error")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

#define ENUM_LIMIT_KIND_ \
  X(NONE) \
  X(CPU_TIME) \
  X(WALL_TIME) \
  X(MEMORY) \
  X(PROCESSES) \
  X(OUTPUT)
enum class LimitKind {
#define X(name) name,
  ENUM_LIMIT_KIND_
#undef X
};

// built-in output comparison used by a verify stage without a command
#define ENUM_COMPARE_MODE_ \
  X(LINE, "line") \
  X(STRICT, "strict") \
  X(WHITE_DIFF, "white-diff") \
  X(FLOAT_ABSOLUTE, "float-absolute") \
  X(FLOAT_RELATIVE, "float-relative") \
  X(FLOAT_ABSOLUTE_RELATIVE, "float-absolute-relative")
enum class CompareMode {
#define X(name, str) name,
  ENUM_COMPARE_MODE_
#undef X
};

struct StageSpec {
  StageKind kind;
  std::vector<std::string> command; // may be empty for prepare/verify/cleanup
  std::vector<std::string> envs;
  std::optional<ResourceLimits> limits; // request limits if not set
};

class ExecutionRequest {
 public:
  // used in cgroup & directory names; see ValidRequestId
  std::string id;
  // number of times the request has been requeued
  int attempt;

  std::vector<StageSpec> stages;
  ResourceLimits limits;

  // payloads
  struct InputFile {
    std::string path; // relative to workdir
    std::string content;
    bool executable;
  };
  std::vector<InputFile> files;
  std::string stdin_data;
  std::string expected_output;
  CompareMode compare_mode;
  double compare_threshold;

  ExecutionRequest() :
      attempt(0),
      limits(kDefaultLimits),
      compare_mode(CompareMode::LINE),
      compare_threshold(1e-6) {}

  const ResourceLimits& StageLimits(const StageSpec& stage) const {
    return stage.limits ? *stage.limits : limits;
  }
};

class StageResult {
 public:
  std::string stage_name;
  StageKind kind;
  bool executed; // false if the stage has nothing to run inside the sandbox
  // exit status of the main process; signal = 0 if it exited normally
  int exit_code;
  int signal;
  int64_t wall_time, cpu_time; // us
  int64_t peak_memory; // KiB
  std::string stdout_data, stderr_data;
  bool stdout_truncated, stderr_truncated;
  LimitKind breach;
  bool cancelled;
  // failure of the engine itself (never of the executed program); empty if none
  std::string error;
  std::string message;

  StageResult() :
      kind(StageKind::PREPARE), executed(false),
      exit_code(0), signal(0),
      wall_time(0), cpu_time(0), peak_memory(0),
      stdout_truncated(false), stderr_truncated(false),
      breach(LimitKind::NONE), cancelled(false) {}

  bool truncated() const { return stdout_truncated || stderr_truncated; }
  bool Failed() const {
    return !error.empty() || cancelled || breach != LimitKind::NONE || signal != 0 || exit_code != 0;
  }
};

struct RunMetrics {
  int64_t cpu_time; // us
  int64_t memory_peak; // KiB
  int64_t wall_time; // us
};

class ExecutionReport {
 public:
  std::string request_id;
  Verdict verdict;
  RunMetrics metrics;
  bool stdout_truncated, stderr_truncated;
  std::vector<StageResult> stages;
  std::string message;
  int64_t started_at, finished_at; // UNIX timestamp, microseconds

  ExecutionReport() :
      verdict(Verdict::NUL), metrics{},
      stdout_truncated(false), stderr_truncated(false),
      started_at(0), finished_at(0) {}
};

// [A-Za-z0-9_.-]{1,64}, not starting with '.'
bool ValidRequestId(const std::string&);

// throws EngineError(INVALID_REQUEST / INVALID_LIMITS)
void ValidateRequest(const ExecutionRequest&);

#endif  // INCLUDE_INVOKER_REQUEST_H_
