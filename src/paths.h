#ifndef PATHS_H_
#define PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kDataDir;
extern fs::path kSpoolDir;
// if empty, results.sqlite in kDataDir
extern fs::path kDatabasePath;

fs::path DatabasePath();
fs::path LockFilePath();

// spool layout
fs::path SpoolIncoming(const fs::path& spool);
fs::path SpoolProcessing(const fs::path& spool);
fs::path SpoolDone(const fs::path& spool);

#endif
