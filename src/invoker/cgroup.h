#ifndef INVOKER_CGROUP_H_
#define INVOKER_CGROUP_H_

#include <string>
#include <vector>
#include <sys/types.h>

#include <invoker/limits.h>
#include "paths.h"

struct CgroupStats {
  int64_t cpu_usage; // us
  int64_t memory_current; // KiB
  long oom_kill;
  long pids_max; // number of refused forks
};

// One cgroup v2 leaf owned by the engine.
class CgroupLeaf {
  fs::path path_;
  bool created_;

  bool Write_(const char* file, const std::string& value) const;
 public:
  CgroupLeaf(const fs::path& path) : path_(path), created_(false) {}
  CgroupLeaf(const CgroupLeaf&) = delete;
  CgroupLeaf& operator=(const CgroupLeaf&) = delete;
  // best effort; a leaf that cannot be removed is left for the reconcile sweep
  ~CgroupLeaf();

  const fs::path& Path() const { return path_; }
  bool Created() const { return created_; }
  // take ownership of an existing leaf (left by a previous run)
  void Adopt() { created_ = true; }

  // throws EngineError(CGROUP_CREATE_FAILED); fails if the leaf already exists
  void Create();
  // throws EngineError(LIMIT_APPLY_FAILED)
  void ApplyLimits(const ResourceLimits&);

  bool Stats(CgroupStats&) const;
  // Open memory.peak and reset it for the returned fd. Returns -1 if the kernel
  // does not support per-fd reset.
  int OpenPeak() const;
  // KiB; -1 on error
  static int64_t ReadPeak(int fd);

  std::vector<pid_t> Procs() const;
  bool Empty() const;
  // SIGKILL to every process in the leaf
  bool KillAll() const;
  // true if the leaf became empty in time
  bool WaitEmpty(int retries, int poll_ms) const;
  bool Remove();
};

// write "+memory +pids" into the parent's subtree_control if they are not there yet
bool EnableControllers(const fs::path& parent);
// names of the direct child cgroups of parent starting with prefix
std::vector<std::string> ListLeaves(const fs::path& parent, const std::string& prefix);

#endif  // INVOKER_CGROUP_H_
