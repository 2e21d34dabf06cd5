#include "paths.h"

fs::path kDataDir = fs::path(INVOKER_DATA_DIR);
fs::path kSpoolDir = fs::path(INVOKER_SPOOL_DIR);
fs::path kDatabasePath;

fs::path DatabasePath() {
  return kDatabasePath.empty() ? kDataDir / "results.sqlite" : kDatabasePath;
}
fs::path LockFilePath() {
  return kDataDir / "lock";
}

fs::path SpoolIncoming(const fs::path& spool) {
  return spool / "incoming";
}
fs::path SpoolProcessing(const fs::path& spool) {
  return spool / "processing";
}
fs::path SpoolDone(const fs::path& spool) {
  return spool / "done";
}
