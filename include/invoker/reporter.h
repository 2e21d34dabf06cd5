#ifndef INCLUDE_INVOKER_REPORTER_H_
#define INCLUDE_INVOKER_REPORTER_H_

#include <string>

class EngineError;
class ExecutionRequest;
class ExecutionReport;
class StageResult;

class Reporter {
 public:
  virtual ~Reporter() = default;
  // these functions should not block; they can be called from any worker thread
  virtual void ReportStageResult(const ExecutionRequest&, const StageResult&) {}
  virtual void ReportVerdict(const ExecutionRequest&, const ExecutionReport&) {}
  // operational alert: an infrastructure failure that needs attention
  virtual void ReportAlert(const std::string& request_id, const EngineError&) {}
};

#endif  // INCLUDE_INVOKER_REPORTER_H_
