#include "database.h"

#include <spdlog/spdlog.h>
#include <invoker/utils.h>

void SqliteResultStore::Init_() {
  if (db_) return;
  spdlog::info("Opening result database {}", path_.c_str());
  db_ = std::make_unique<Storage>(InitStorage(path_));
}

void SqliteResultStore::Write(const ExecutionReport& report) {
  ResultRow row{
    report.request_id,
    VerdictToAbr(report.verdict),
    report.metrics.cpu_time,
    report.metrics.memory_peak,
    report.metrics.wall_time,
    report.stdout_truncated,
    report.stderr_truncated,
    report.started_at,
    report.finished_at,
    report.message,
  };
  std::lock_guard lck(mtx_);
  Init_();
  db_->replace(row);
}

std::optional<ResultRow> SqliteResultStore::Get(const std::string& request_id) {
  std::lock_guard lck(mtx_);
  Init_();
  if (auto row = db_->get_pointer<ResultRow>(request_id)) return *row;
  return std::nullopt;
}
