#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <optional>

#include <sqlite_orm/sqlite_orm.h>
#include <invoker/invoker.h>
#include "paths.h"

// one row per completed request
struct ResultRow {
  std::string request_id;
  std::string verdict;
  int64_t cpu_time; // us
  int64_t memory_peak; // KiB
  int64_t wall_time; // us
  bool stdout_truncated;
  bool stderr_truncated;
  int64_t started_at;
  int64_t finished_at;
  std::string message;
};

namespace {

inline auto InitStorage(const fs::path& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_results_finished_at", &ResultRow::finished_at),
      make_table("results",
                 make_column("request_id", &ResultRow::request_id, primary_key()),
                 make_column("verdict", &ResultRow::verdict),
                 make_column("cpu_time", &ResultRow::cpu_time),
                 make_column("memory_peak", &ResultRow::memory_peak),
                 make_column("wall_time", &ResultRow::wall_time),
                 make_column("stdout_truncated", &ResultRow::stdout_truncated, default_value(false)),
                 make_column("stderr_truncated", &ResultRow::stderr_truncated, default_value(false)),
                 make_column("started_at", &ResultRow::started_at),
                 make_column("finished_at", &ResultRow::finished_at),
                 make_column("message", &ResultRow::message, default_value(""))));
  storage.sync_schema(true);
  return storage;
}

} // namespace

class SqliteResultStore : public ResultStore {
 public:
  using Storage = decltype(InitStorage(fs::path()));

 private:
  fs::path path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

  void Init_();
 public:
  SqliteResultStore(const fs::path& path = DatabasePath()) : path_(path) {}

  // a request written again (redelivered after a crash) replaces its row
  void Write(const ExecutionReport&) override;
  std::optional<ResultRow> Get(const std::string& request_id);
};

#endif  // DATABASE_H_
