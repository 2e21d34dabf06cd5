#include <invoker/request.h>

#include <cctype>

#include <invoker/errors.h>
#include <invoker/utils.h>
#include <invoker/paths.h>

bool ValidRequestId(const std::string& id) {
  if (id.empty() || id.size() > 64 || id[0] == '.') return false;
  for (char c : id) {
    if (!isalnum((unsigned char)c) && c != '_' && c != '.' && c != '-') return false;
  }
  return true;
}

void ValidateRequest(const ExecutionRequest& req) {
  if (!ValidRequestId(req.id)) {
    throw EngineError(ErrorCode::INVALID_REQUEST, "invalid request id \"" + req.id + "\"");
  }
  if (req.attempt < 0) {
    throw EngineError(ErrorCode::INVALID_REQUEST, "negative attempt counter");
  }
  req.limits.Validate();
  bool has_run = false;
  int last_kind = -1;
  for (auto& stage : req.stages) {
    if ((int)stage.kind < last_kind) {
      throw EngineError(ErrorCode::INVALID_REQUEST,
          std::string("stage ") + StageKindName(stage.kind) + " is out of order");
    }
    last_kind = (int)stage.kind;
    if (stage.limits) stage.limits->Validate();
    switch (stage.kind) {
      case StageKind::COMPILE: [[fallthrough]];
      case StageKind::RUN:
        if (stage.command.empty()) {
          throw EngineError(ErrorCode::INVALID_REQUEST,
              std::string(StageKindName(stage.kind)) + " stage without a command");
        }
        if (stage.kind == StageKind::RUN) has_run = true;
        break;
      default: break;
    }
  }
  if (!has_run) throw EngineError(ErrorCode::INVALID_REQUEST, "no run stage");
  for (auto& file : req.files) {
    fs::path path = fs::path(file.path).lexically_normal();
    if (path.empty() || path.is_absolute() || *path.begin() == "..") {
      throw EngineError(ErrorCode::INVALID_REQUEST, "invalid input file path \"" + file.path + "\"");
    }
  }
}
