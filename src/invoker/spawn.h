#ifndef INVOKER_SPAWN_H_
#define INVOKER_SPAWN_H_

#include <string>
#include <vector>
#include <sys/types.h>

#include "paths.h"

struct SpawnOptions {
  std::vector<std::string> command;
  std::vector<std::string> envs;
  fs::path root; // host path of the new root directory
  fs::path workdir; // path inside root
  fs::path stdin_file; // host path
  fs::path cgroup; // leaf to join before anything runs
  int host_uid, host_gid;
  int inside_uid, inside_gid;
  int stdout_fd, stderr_fd; // write ends
  // 0 for no limit
  int64_t cpu_time; // us
  int64_t open_files;
  int64_t file_size; // bytes

  SpawnOptions() :
      host_uid(-1), host_gid(-1), inside_uid(-1), inside_gid(-1),
      stdout_fd(-1), stderr_fd(-1),
      cpu_time(0), open_files(0), file_size(0) {}
};

// Start the command in a new user/mount/IPC/UTS namespace, mapped to inside_uid/gid.
// Returns after the program is successfully exec'd.
// throws EngineError(SPAWN_FAILED); the child is reaped on failure
pid_t Spawn(const SpawnOptions&);

// Look up a command without a slash in PATH of envs (or a default PATH), inside root.
// Returns the command as is if it is not found.
std::string ResolveCommand(const fs::path& root, const std::string& cmd,
                           const std::vector<std::string>& envs);

#endif  // INVOKER_SPAWN_H_
