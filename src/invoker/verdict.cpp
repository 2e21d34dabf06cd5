#include <invoker/verdict.h>

#include <signal.h>
#include <algorithm>

#include <invoker/utils.h>

namespace {

std::string ExitMessage(const StageResult& res) {
  if (res.signal) return "killed by signal " + std::to_string(res.signal);
  return "exit code " + std::to_string(res.exit_code);
}

Verdict RunVerdict(const StageResult& res) {
  switch (res.breach) {
    case LimitKind::CPU_TIME: [[fallthrough]];
    case LimitKind::WALL_TIME: return Verdict::TLE;
    case LimitKind::MEMORY: return Verdict::MLE;
    case LimitKind::OUTPUT: return Verdict::OLE;
    case LimitKind::PROCESSES: return Verdict::RE;
    case LimitKind::NONE: break;
  }
  if (res.signal == SIGXFSZ) return Verdict::OLE;
  return Verdict::RE;
}

} // namespace

Verdict EvaluateVerdict(const std::vector<StageResult>& results, std::string* message) {
  auto set_message = [&](const std::string& str) {
    if (message) *message = str;
  };
  set_message("");
  // engine failures override everything, including the cleanup stage
  for (auto& res : results) {
    if (!res.error.empty()) {
      set_message(res.stage_name + ": " + res.error);
      return Verdict::SE;
    }
  }
  for (auto& res : results) {
    if (res.cancelled) {
      set_message("cancelled");
      return Verdict::SE;
    }
  }
  for (auto& res : results) {
    if (res.kind == StageKind::CLEANUP || !res.Failed()) continue;
    std::string reason = res.breach != LimitKind::NONE ?
        std::string(LimitKindName(res.breach)) + " limit exceeded" : ExitMessage(res);
    switch (res.kind) {
      case StageKind::PREPARE:
        set_message(res.stage_name + ": " + reason);
        return Verdict::SE;
      case StageKind::COMPILE:
        set_message(reason);
        return Verdict::CE;
      case StageKind::RUN:
        set_message(reason);
        return RunVerdict(res);
      case StageKind::VERIFY:
        // exit code 1 is the only rejection; anything else is a broken checker
        if (res.breach == LimitKind::NONE && res.signal == 0 && res.exit_code == 1) {
          set_message(res.message);
          return Verdict::WA;
        }
        set_message("checker failed: " + reason);
        return Verdict::SE;
      case StageKind::CLEANUP:
        break;
    }
  }
  return Verdict::AC;
}

RunMetrics SummarizeMetrics(const std::vector<StageResult>& results) {
  RunMetrics metrics{};
  for (auto& res : results) {
    if (res.kind != StageKind::RUN) continue;
    metrics.cpu_time += res.cpu_time;
    metrics.wall_time += res.wall_time;
    metrics.memory_peak = std::max(metrics.memory_peak, res.peak_memory);
  }
  return metrics;
}
