#include "spawn.h"

#include <fcntl.h>
#include <grp.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <invoker/errors.h>
#include "utils.h"

namespace {

#define ENUM_SPAWN_STEP_ \
  X(JOIN_CGROUP, "join cgroup") \
  X(SETGROUPS, "setgroups") \
  X(OPEN_STDIN, "open stdin") \
  X(UNSHARE, "unshare") \
  X(SYNC, "sync") \
  X(MOUNT_PRIVATE, "make mounts private") \
  X(CHROOT, "chroot") \
  X(CHDIR, "chdir") \
  X(DUP, "dup2") \
  X(RLIMIT, "setrlimit") \
  X(NO_NEW_PRIVS, "no_new_privs") \
  X(SETUID, "setuid") \
  X(EXEC, "exec")
enum class SpawnStep {
#define X(name, desc) name,
  ENUM_SPAWN_STEP_
#undef X
};

const char* kSpawnStepDesc[] = {
#define X(name, desc) desc,
  ENUM_SPAWN_STEP_
#undef X
};

struct ChildError {
  SpawnStep step;
  int err;
};

// everything below runs between fork and exec: async-signal-safe calls only
[[noreturn]] void ChildFail(int err_fd, SpawnStep step) {
  ChildError error{step, errno};
  IGNORE_RETURN(write(err_fd, &error, sizeof(error)));
  _exit(127);
}

bool SetLimit(int resource, rlim_t soft, rlim_t hard) {
  struct rlimit cur;
  if (getrlimit(resource, &cur) < 0) return false;
  // only lowering is possible without privileges in the initial namespace
  struct rlimit lim;
  lim.rlim_max = cur.rlim_max == RLIM_INFINITY ? hard : std::min(hard, cur.rlim_max);
  lim.rlim_cur = std::min(soft, lim.rlim_max);
  return setrlimit(resource, &lim) == 0;
}

struct ChildArgs {
  const SpawnOptions* opt;
  const char* procs_file;
  const char* root;
  const char* workdir;
  const char* stdin_file;
  char* const* argv;
  char* const* envp;
  int sync_fd, err_fd;
};

[[noreturn]] void ChildMain(const ChildArgs& args) {
  const SpawnOptions& opt = *args.opt;
  int err_fd = args.err_fd;
  prctl(PR_SET_PDEATHSIG, SIGKILL);

  {
    int fd = open(args.procs_file, O_WRONLY | O_CLOEXEC);
    if (fd < 0 || write(fd, "0", 1) != 1) ChildFail(err_fd, SpawnStep::JOIN_CGROUP);
    close(fd);
  }
  // drop the supplementary groups while still privileged; they cannot be changed later
  if (setgroups(0, nullptr) < 0) ChildFail(err_fd, SpawnStep::SETGROUPS);
  int in_fd = open(args.stdin_file, O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  if (in_fd < 0) ChildFail(err_fd, SpawnStep::OPEN_STDIN);

  if (unshare(CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWIPC | CLONE_NEWUTS) < 0) {
    ChildFail(err_fd, SpawnStep::UNSHARE);
  }
  // wait for the parent to write uid_map & gid_map
  {
    char ch = 0;
    if (write(args.sync_fd, &ch, 1) != 1 || read(args.sync_fd, &ch, 1) != 1) {
      ChildFail(err_fd, SpawnStep::SYNC);
    }
  }

  if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) < 0) {
    ChildFail(err_fd, SpawnStep::MOUNT_PRIVATE);
  }
  if (chroot(args.root) < 0) ChildFail(err_fd, SpawnStep::CHROOT);
  if (chdir(args.workdir) < 0) ChildFail(err_fd, SpawnStep::CHDIR);

  if (dup2(in_fd, 0) < 0 || dup2(opt.stdout_fd, 1) < 0 || dup2(opt.stderr_fd, 2) < 0 ||
      dup2(err_fd, 3) < 0) {
    ChildFail(err_fd, SpawnStep::DUP);
  }
  err_fd = 3;
  if (fcntl(err_fd, F_SETFD, FD_CLOEXEC) < 0) ChildFail(err_fd, SpawnStep::DUP);
  if (CloseFrom(4) < 0) ChildFail(err_fd, SpawnStep::DUP);

  if (!SetLimit(RLIMIT_CORE, 0, 0)) ChildFail(err_fd, SpawnStep::RLIMIT);
  if (opt.cpu_time > 0) {
    // SIGXCPU at the limit, SIGKILL one second later
    rlim_t sec = (opt.cpu_time + 999'999) / 1'000'000;
    if (!SetLimit(RLIMIT_CPU, sec, sec + 1)) ChildFail(err_fd, SpawnStep::RLIMIT);
  }
  if (opt.open_files > 0 && !SetLimit(RLIMIT_NOFILE, opt.open_files, opt.open_files)) {
    ChildFail(err_fd, SpawnStep::RLIMIT);
  }
  if (opt.file_size > 0 && !SetLimit(RLIMIT_FSIZE, opt.file_size, opt.file_size)) {
    ChildFail(err_fd, SpawnStep::RLIMIT);
  }
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) ChildFail(err_fd, SpawnStep::NO_NEW_PRIVS);
  if (setresgid(opt.inside_gid, opt.inside_gid, opt.inside_gid) < 0 ||
      setresuid(opt.inside_uid, opt.inside_uid, opt.inside_uid) < 0) {
    ChildFail(err_fd, SpawnStep::SETUID);
  }
  signal(SIGPIPE, SIG_DFL);
  // the daemon blocks its termination signals in every thread
  sigset_t mask;
  sigemptyset(&mask);
  sigprocmask(SIG_SETMASK, &mask, nullptr);
  execve(args.argv[0], args.argv, args.envp);
  ChildFail(err_fd, SpawnStep::EXEC);
}

bool WriteMap(pid_t pid, const char* file, int inside, int host) {
  fs::path path = fs::path("/proc") / std::to_string(pid) / file;
  std::string content = std::to_string(inside) + " " + std::to_string(host) + " 1\n";
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  bool ret = fd >= 0 && write(fd, content.data(), content.size()) == (ssize_t)content.size();
  if (!ret) spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  if (fd >= 0) close(fd);
  return ret;
}

void Reap(pid_t pid) {
  kill(pid, SIGKILL);
  while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
}

} // namespace

std::string ResolveCommand(const fs::path& root, const std::string& cmd,
                           const std::vector<std::string>& envs) {
  if (cmd.empty() || cmd.find('/') != std::string::npos) return cmd;
  std::string path_env = "/usr/local/bin:/usr/bin:/bin";
  for (auto& env : envs) {
    if (env.compare(0, 5, "PATH=") == 0) path_env = env.substr(5);
  }
  for (size_t pos = 0; pos <= path_env.size();) {
    size_t end = path_env.find(':', pos);
    if (end == std::string::npos) end = path_env.size();
    std::string dir = path_env.substr(pos, end - pos);
    pos = end + 1;
    if (dir.empty() || dir[0] != '/') continue;
    fs::path candidate = fs::path(dir) / cmd;
    struct stat st;
    // lexical join: symlinks of the sandbox root are resolved on the host here
    if (stat((root / candidate.relative_path()).c_str(), &st) == 0 &&
        S_ISREG(st.st_mode) && (st.st_mode & 0111)) {
      return candidate;
    }
  }
  return cmd;
}

pid_t Spawn(const SpawnOptions& opt) {
  if (opt.command.empty()) throw EngineError(ErrorCode::SPAWN_FAILED, "empty command");

  // prepare everything before fork; the child must not allocate
  std::vector<std::string> command = opt.command;
  command[0] = ResolveCommand(opt.root, command[0], opt.envs);
  std::vector<char*> argv, envp;
  for (auto& i : command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  fs::path procs_file = opt.cgroup / "cgroup.procs";
  fs::path stdin_file = opt.stdin_file.empty() ? fs::path("/dev/null") : opt.stdin_file;

  int sync_fds[2], err_pipe[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sync_fds) < 0) {
    throw EngineError(ErrorCode::SPAWN_FAILED, std::string("socketpair: ") + strerror(errno));
  }
  if (pipe2(err_pipe, O_CLOEXEC) < 0) {
    int err = errno;
    close(sync_fds[0]);
    close(sync_fds[1]);
    throw EngineError(ErrorCode::SPAWN_FAILED, std::string("pipe: ") + strerror(err));
  }
  ChildArgs args{&opt, procs_file.c_str(), opt.root.c_str(), opt.workdir.c_str(),
                 stdin_file.c_str(), argv.data(), envp.data(), sync_fds[1], err_pipe[1]};

  spdlog::debug("Spawn root={} cgroup={} uid={} command={}",
      opt.root.c_str(), opt.cgroup.c_str(), opt.host_uid, fmt::format("{}", command));
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    for (int fd : {sync_fds[0], sync_fds[1], err_pipe[0], err_pipe[1]}) close(fd);
    throw EngineError(ErrorCode::SPAWN_FAILED, std::string("fork: ") + strerror(err));
  }
  if (pid == 0) {
    close(sync_fds[0]);
    close(err_pipe[0]);
    ChildMain(args);
  }
  close(sync_fds[1]);
  close(err_pipe[1]);

  std::string failure;
  {
    char ch;
    ssize_t ret;
    while ((ret = read(sync_fds[0], &ch, 1)) < 0 && errno == EINTR);
    if (ret == 1) {
      if (!WriteMap(pid, "uid_map", opt.inside_uid, opt.host_uid) ||
          !WriteMap(pid, "gid_map", opt.inside_gid, opt.host_gid)) {
        failure = "cannot write id map";
      } else if (write(sync_fds[0], &ch, 1) != 1) {
        failure = std::string("sync: ") + strerror(errno);
      }
    }
    // otherwise the child failed before unshare and reported it
  }
  close(sync_fds[0]);
  if (failure.empty()) {
    ChildError error;
    ssize_t ret;
    while ((ret = read(err_pipe[0], &error, sizeof(error))) < 0 && errno == EINTR);
    if (ret == sizeof(error)) {
      failure = std::string(kSpawnStepDesc[(int)error.step]) + ": " + strerror(error.err);
    } else if (ret != 0) {
      failure = "child exited unexpectedly";
    }
  }
  close(err_pipe[0]);
  if (!failure.empty()) {
    Reap(pid);
    throw EngineError(ErrorCode::SPAWN_FAILED, failure);
  }
  return pid;
}
