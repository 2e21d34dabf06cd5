#include <invoker/serialize.h>

#include <invoker/errors.h>
#include <invoker/utils.h>

using nlohmann::json;

namespace {

int64_t ParseMemory(const json& val, int64_t orig) {
  if (val.is_string()) {
    if (val.get<std::string>() == "unlimited") return ResourceLimits::kUnlimited;
    throw EngineError(ErrorCode::INVALID_LIMITS, "invalid memory limit " + val.dump());
  }
  return val.is_null() ? orig : val.get<int64_t>();
}

// missing fields are taken from base
ResourceLimits LimitsFromJSON(const json& data, const ResourceLimits& base) {
  ResourceLimits lim = base;
  if (data.is_null()) return lim;
  lim.cpu_time = data.value("cpu_time", lim.cpu_time);
  lim.wall_time = data.value("wall_time", lim.wall_time);
  lim.memory = ParseMemory(data.value("memory", json()), lim.memory);
  lim.processes = data.value("processes", lim.processes);
  lim.open_files = data.value("open_files", lim.open_files);
  lim.output = data.value("output", lim.output);
  return lim;
}

json LimitsJSON(const ResourceLimits& lim) {
  json data{
    {"cpu_time", lim.cpu_time},
    {"wall_time", lim.wall_time},
    {"processes", lim.processes},
    {"open_files", lim.open_files},
    {"output", lim.output},
  };
  if (lim.HasMemoryLimit()) {
    data["memory"] = lim.memory;
  } else {
    data["memory"] = "unlimited";
  }
  return data;
}

// at most kCaptureLimit KiB of a stream goes into a report
std::string CapStream(const std::string& str, bool& truncated) {
  size_t limit = kCaptureLimit * 1024;
  if (str.size() <= limit) return str;
  truncated = true;
  return str.substr(0, limit);
}

} // namespace

ExecutionRequest RequestFromJSON(const json& data) {
  ExecutionRequest req;
  req.id = data.at("id").get<std::string>();
  req.attempt = data.value("attempt", 0);
  req.limits = LimitsFromJSON(data.value("limits", json()), kDefaultLimits);
  for (auto& item : data.at("stages")) {
    StageSpec stage;
    std::string kind = item.at("kind").get<std::string>();
    if (!GetStageKind(kind, stage.kind)) {
      throw EngineError(ErrorCode::INVALID_REQUEST, "unknown stage kind \"" + kind + "\"");
    }
    stage.command = item.value("command", std::vector<std::string>());
    stage.envs = item.value("envs", std::vector<std::string>());
    if (item.contains("limits")) stage.limits = LimitsFromJSON(item.at("limits"), req.limits);
    req.stages.push_back(std::move(stage));
  }
  if (data.contains("files")) {
    for (auto& item : data.at("files")) {
      ExecutionRequest::InputFile file;
      file.path = item.at("path").get<std::string>();
      file.content = item.at("content").get<std::string>();
      file.executable = item.value("executable", false);
      req.files.push_back(std::move(file));
    }
  }
  req.stdin_data = data.value("stdin", "");
  req.expected_output = data.value("expected_output", "");
  if (data.contains("compare")) {
    auto& compare = data.at("compare");
    std::string mode = compare.value("mode", CompareModeName(CompareMode::LINE));
    if (!GetCompareMode(mode, req.compare_mode)) {
      throw EngineError(ErrorCode::INVALID_REQUEST, "unknown compare mode \"" + mode + "\"");
    }
    req.compare_threshold = compare.value("threshold", req.compare_threshold);
  }
  return req;
}

json RequestJSON(const ExecutionRequest& req) {
  json stages = json::array();
  for (auto& stage : req.stages) {
    json item{
      {"kind", StageKindName(stage.kind)},
      {"command", stage.command},
      {"envs", stage.envs},
    };
    if (stage.limits) item.at("limits") = LimitsJSON(*stage.limits);
    stages.push_back(std::move(item));
  }
  json files = json::array();
  for (auto& file : req.files) {
    files.push_back({{"path", file.path}, {"content", file.content}, {"executable", file.executable}});
  }
  return {
    {"id", req.id},
    {"attempt", req.attempt},
    {"limits", LimitsJSON(req.limits)},
    {"stages", std::move(stages)},
    {"files", std::move(files)},
    {"stdin", req.stdin_data},
    {"expected_output", req.expected_output},
    {"compare", {{"mode", CompareModeName(req.compare_mode)}, {"threshold", req.compare_threshold}}},
  };
}

json StageResultJSON(const StageResult& res) {
  bool stdout_truncated = res.stdout_truncated, stderr_truncated = res.stderr_truncated;
  json data{
    {"name", res.stage_name},
    {"kind", StageKindName(res.kind)},
    {"executed", res.executed},
    {"exit_code", res.exit_code},
    {"signal", res.signal},
    {"cpu_time", res.cpu_time},
    {"wall_time", res.wall_time},
    {"peak_memory", res.peak_memory},
    {"stdout", CapStream(res.stdout_data, stdout_truncated)},
    {"stderr", CapStream(res.stderr_data, stderr_truncated)},
    {"cancelled", res.cancelled},
  };
  data["stdout_truncated"] = stdout_truncated;
  data["stderr_truncated"] = stderr_truncated;
  if (res.breach != LimitKind::NONE) data["breach"] = LimitKindName(res.breach);
  if (!res.error.empty()) data["error"] = res.error;
  if (!res.message.empty()) data["message"] = res.message;
  return data;
}

json ReportJSON(const ExecutionReport& report) {
  json stages = json::array();
  for (auto& res : report.stages) stages.push_back(StageResultJSON(res));
  json data{
    {"request_id", report.request_id},
    {"verdict", VerdictToAbr(report.verdict)},
    {"verdict_desc", VerdictToDesc(report.verdict)},
    {"metrics", {
      {"cpu_time", report.metrics.cpu_time},
      {"memory_peak", report.metrics.memory_peak},
      {"wall_time", report.metrics.wall_time},
    }},
    {"stdout_truncated", report.stdout_truncated},
    {"stderr_truncated", report.stderr_truncated},
    {"stages", std::move(stages)},
    {"started_at", report.started_at},
    {"finished_at", report.finished_at},
  };
  if (!report.message.empty()) data["message"] = report.message;
  return data;
}
