#ifndef SPOOL_QUEUE_H_
#define SPOOL_QUEUE_H_

#include <mutex>
#include <unordered_map>

#include <invoker/invoker.h>
#include "paths.h"

// Directory-backed queue:
//   incoming/*.json: pending requests, taken in modification time order
//   processing/: claimed requests, moved there by rename
//   done/<name>.json: the report of an acknowledged request
// Only one consumer process may use a spool at a time.
class SpoolQueue : public QueueConsumer {
  fs::path root_;
  std::mutex mtx_;
  // request id -> claimed file in processing/
  std::unordered_map<std::string, fs::path> claimed_;

  void CheckDirs_() const;
  void WriteReport_(const std::string& name, const ExecutionReport& report);
  void Reject_(const fs::path& file, const std::string& message);
 public:
  SpoolQueue(const fs::path& root) : root_(root) {}

  // move requests left in processing/ by a previous run back to incoming/
  void Recover();

  std::optional<ExecutionRequest> Dequeue() override;
  void Ack(const std::string& request_id, const ExecutionReport& report) override;
  void Nack(const std::string& request_id, const std::string& reason) override;
};

#endif  // SPOOL_QUEUE_H_
