#ifndef INCLUDE_INVOKER_PATHS_H_
#define INCLUDE_INVOKER_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// per-environment scratch directories are created under this
extern fs::path kBoxRoot;
// pre-created by deployment; leaves are created under it
extern fs::path kCgroupParent;
// every leaf and box name starts with this; used to recognize stale ones
extern std::string kCgroupPrefix;
// read-only lower layer of the sandbox root
extern fs::path kRootfsTemplate;

#endif  // INCLUDE_INVOKER_PATHS_H_
