#include "isolation.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include <invoker/errors.h>
#include "paths.h"
#include "utils.h"
#include "spawn.h"
#include "capture.h"

std::string kSubidUser = "";
long kSubidStart = 100000;
long kSubidCount = 65536;
int kInsideUid = 1000;
long kScratchSize = 1024 * 1024;
int kTeardownRetries = 50;
int kTeardownPollMs = 20;

namespace {

constexpr int kKillRounds = 3;
constexpr int kPollMs = 10;

const std::vector<std::string> kDefaultEnvs = {
  "PATH=/usr/local/bin:/usr/bin:/bin",
  "HOME=/workdir",
  "LANG=C.UTF-8",
};

class Pipe {
 public:
  int fds[2];
  Pipe() : fds{-1, -1} {}
  ~Pipe() { CloseRead(); CloseWrite(); }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  bool Open() {
    if (pipe2(fds, O_CLOEXEC) < 0) return false;
    return fcntl(fds[0], F_SETFL, O_NONBLOCK) == 0;
  }
  void CloseRead() {
    if (fds[0] >= 0) close(fds[0]);
    fds[0] = -1;
  }
  void CloseWrite() {
    if (fds[1] >= 0) close(fds[1]);
    fds[1] = -1;
  }
};

// unmount and remove the box directory of name; lazy unmount as the last resort
bool CleanBox(const std::string& name) {
  fs::path box = BoxPath(name), root = BoxRootfs(name);
  if (IsMountPoint(root) && !Umount(root) && !Umount(root, true)) return false;
  if (IsMountPoint(box) && !Umount(box) && !Umount(box, true)) return false;
  if (IsMountPoint(root) || IsMountPoint(box)) return false;
  return RemoveAll(box);
}

} // namespace

CgroupEnvironment::CgroupEnvironment(const std::string& name, IdLease&& lease) :
    name_(name), leaf_(LeafPath(name)), lease_(std::move(lease)),
    box_created_(false), tmpfs_mounted_(false), overlay_mounted_(false), torn_down_(false),
    current_(nullptr), cancelled_(false) {}

CgroupEnvironment::~CgroupEnvironment() {
  try {
    Teardown();
  } catch (const EngineError& err) {
    // processes of the id may still exist; never hand it out again
    spdlog::error("Environment {} leaked: {}", name_, err.what());
    lease_.Abandon();
  }
}

fs::path CgroupEnvironment::Workdir() const {
  return BoxWorkdir(name_);
}

fs::path CgroupEnvironment::PrivateDir() const {
  return BoxPrivate(name_);
}

void CgroupEnvironment::Setup(const ResourceLimits& limits, const fs::path& rootfs_template) {
  spdlog::debug("Setup environment {}: uid={}", name_, lease_.Id());
  if (!EnableControllers(kCgroupParent)) {
    spdlog::warn("Controllers of {} may be unavailable", kCgroupParent.c_str());
  }
  leaf_.Create();
  leaf_.ApplyLimits(limits);

  fs::path box = BoxPath(name_);
  if (fs::exists(box)) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, box.string() + " already exists");
  }
  if (!CreateDirs(box, fs::perms::owner_all)) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, "cannot create " + box.string());
  }
  box_created_ = true;
  if (!MountTmpfs(box, kScratchSize)) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, "cannot mount tmpfs on " + box.string());
  }
  tmpfs_mounted_ = true;
  fs::path root = BoxRootfs(name_);
  constexpr fs::perms kPerm755 = fs::perms::owner_all |
      fs::perms::group_read | fs::perms::group_exec |
      fs::perms::others_read | fs::perms::others_exec;
  if (!CreateDirs(BoxUpper(name_), kPerm755) || !CreateDirs(BoxOverlayWork(name_), fs::perms::owner_all) ||
      !CreateDirs(root, kPerm755) || !CreateDirs(BoxPrivate(name_), fs::perms::owner_all)) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, "cannot create layers in " + box.string());
  }
  if (!MountOverlay(rootfs_template, BoxUpper(name_), BoxOverlayWork(name_), root)) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, "cannot mount overlay on " + root.string());
  }
  overlay_mounted_ = true;
  fs::path workdir = Workdir();
  // the template may carry its own /workdir; start from an empty one
  if (!RemoveAll(workdir) || !CreateDirs(workdir, kPerm755) ||
      !Chown(workdir, HostUid(), HostGid())) {
    throw EngineError(ErrorCode::SCRATCH_SETUP_FAILED, "cannot prepare " + workdir.string());
  }
}

bool CgroupEnvironment::KillProcesses_() {
  if (!leaf_.Created()) return true;
  for (int round = 0; round < kKillRounds; round++) {
    leaf_.KillAll();
    if (leaf_.WaitEmpty(kTeardownRetries, kTeardownPollMs)) return true;
    spdlog::warn("Processes in {} survived kill round {}; escalating", leaf_.Path().c_str(), round + 1);
  }
  return false;
}

bool CgroupEnvironment::RemoveScratch_() {
  if (!box_created_) return true;
  fs::path box = BoxPath(name_), root = BoxRootfs(name_);
  if (overlay_mounted_) {
    if (!Umount(root) && !Umount(root, true)) return false;
    overlay_mounted_ = false;
  }
  if (tmpfs_mounted_) {
    if (!Umount(box) && !Umount(box, true)) return false;
    tmpfs_mounted_ = false;
  }
  if (!RemoveAll(box)) return false;
  box_created_ = false;
  return true;
}

void CgroupEnvironment::Teardown() {
  if (torn_down_) return;
  spdlog::debug("Teardown environment {}", name_);
  {
    std::lock_guard lck(mtx_);
    cancelled_ = true;
  }
  if (!KillProcesses_()) {
    throw EngineError(ErrorCode::TEARDOWN_TIMEOUT,
        "processes in " + leaf_.Path().string() + " cannot be killed");
  }
  bool scratch_removed = RemoveScratch_();
  if (!leaf_.Remove()) {
    throw EngineError(ErrorCode::TEARDOWN_TIMEOUT, "cannot remove " + leaf_.Path().string());
  }
  if (!scratch_removed) {
    // no process can use it anymore; the reconcile sweep retries
    spdlog::error("Scratch directory of {} left behind", name_);
  }
  lease_.Release();
  torn_down_ = true;
}

void CgroupEnvironment::Cancel() {
  std::lock_guard lck(mtx_);
  cancelled_ = true;
  if (current_) current_->Cancel();
}

StageResult CgroupEnvironment::Execute(const ProcessSpec& spec) {
  StageResult result;
  {
    std::lock_guard lck(mtx_);
    if (cancelled_) {
      result.cancelled = true;
      return result;
    }
  }
  leaf_.ApplyLimits(spec.limits);

  size_t out_limit = spec.limit_output ? spec.limits.OutputCeilingBytes() : kCaptureLimit * 1024;
  OutputCapture out(out_limit), err(kCaptureLimit * 1024);
  Pipe out_pipe, err_pipe;
  if (!out_pipe.Open() || !err_pipe.Open()) {
    result.error = std::string("cannot create pipes: ") + strerror(errno);
    return result;
  }

  ResourceAccountant acct(leaf_, spec.limits);
  SpawnOptions opt;
  opt.command = spec.command;
  opt.envs = spec.envs.empty() ? kDefaultEnvs : spec.envs;
  opt.root = BoxRootfs(name_);
  opt.workdir = BoxWorkdir(name_, true);
  opt.stdin_file = spec.stdin_file;
  opt.cgroup = leaf_.Path();
  opt.host_uid = HostUid();
  opt.host_gid = HostGid();
  opt.inside_uid = opt.inside_gid = kInsideUid;
  opt.stdout_fd = out_pipe.fds[1];
  opt.stderr_fd = err_pipe.fds[1];
  opt.cpu_time = spec.limits.cpu_time;
  opt.open_files = spec.limits.open_files;
  // compilers and prepare commands write files of any size
  opt.file_size = spec.limit_output ? spec.limits.OutputCeilingBytes() : 0;
  pid_t pid;
  try {
    pid = Spawn(opt);
  } catch (const EngineError& e) {
    spdlog::warn("Spawn failed in {}: {}", name_, e.what());
    result.error = e.what();
    return result;
  }
  acct.Start();
  out_pipe.CloseWrite();
  err_pipe.CloseWrite();
  {
    std::lock_guard lck(mtx_);
    current_ = &acct;
    if (cancelled_) acct.Cancel();
  }

  int status = 0;
  bool exited = false, out_open = true, err_open = true;
  while (!exited || out_open || err_open) {
    struct pollfd pfds[2];
    int nfds = 0;
    if (out_open) pfds[nfds++] = {out_pipe.fds[0], POLLIN, 0};
    if (err_open) pfds[nfds++] = {err_pipe.fds[0], POLLIN, 0};
    if (nfds == 0) {
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
      exited = true;
      break;
    }
    if (poll(pfds, nfds, kPollMs) < 0 && errno != EINTR) {
      spdlog::warn("poll failed in {}: {}", name_, strerror(errno));
    }
    for (int i = 0; i < nfds; i++) {
      if (!pfds[i].revents) continue;
      if (pfds[i].fd == out_pipe.fds[0] && !out.Drain(out_pipe.fds[0])) {
        out_open = false;
      } else if (pfds[i].fd == err_pipe.fds[0] && !err.Drain(err_pipe.fds[0])) {
        err_open = false;
      }
    }
    if (spec.limit_output && out.Truncated() && acct.Breached() == LimitKind::NONE) {
      acct.ReportBreach(LimitKind::OUTPUT);
    }
    if (!exited && waitpid(pid, &status, WNOHANG) == pid) {
      exited = true;
      // whatever is left of the tree may still hold the pipes
      leaf_.KillAll();
    }
  }
  result.breach = acct.Finish(status);
  Usage usage = acct.Poll();
  {
    std::lock_guard lck(mtx_);
    current_ = nullptr;
  }
  result.cancelled = acct.Cancelled();
  result.executed = true;
  if (WIFSIGNALED(status)) {
    result.signal = WTERMSIG(status);
  } else {
    result.exit_code = WEXITSTATUS(status);
  }
  result.cpu_time = usage.cpu_time;
  result.wall_time = usage.wall_time;
  result.peak_memory = usage.memory_peak;
  result.stdout_truncated = out.Truncated();
  result.stderr_truncated = err.Truncated();
  result.stdout_data = out.Take();
  result.stderr_data = err.Take();

  // nothing survives a stage
  if (!KillProcesses_()) {
    result.error = "processes in " + leaf_.Path().string() + " survived the stage";
  }
  spdlog::debug("Stage in {} done: exit={} signal={} breach={} cpu={} wall={} mem={}",
      name_, result.exit_code, result.signal, LimitKindName(result.breach),
      result.cpu_time, result.wall_time, result.peak_memory);
  return result;
}

std::unique_ptr<IsolationEnvironment> CgroupEnvironmentBuilder::Build(
    const std::string& name, const ResourceLimits& limits, const fs::path& rootfs_template) {
  limits.Validate();
  IdLease lease = pool_.Acquire();
  auto env = std::make_unique<CgroupEnvironment>(name, std::move(lease));
  // on failure the destructor unwinds everything acquired so far
  env->Setup(limits, rootfs_template);
  spdlog::info("Environment {} built: uid={}", name, env->HostUid());
  return env;
}

void CgroupEnvironmentBuilder::Reconcile() {
  spdlog::info("Reconciling stale environments in {} and {}", kCgroupParent.c_str(), kBoxRoot.c_str());
  for (auto& leaf_name : ListLeaves(kCgroupParent, kCgroupPrefix)) {
    CgroupLeaf leaf(kCgroupParent / leaf_name);
    leaf.Adopt();
    spdlog::warn("Removing stale cgroup {}", leaf.Path().c_str());
    leaf.KillAll();
    if (!leaf.WaitEmpty(kTeardownRetries, kTeardownPollMs) || !leaf.Remove()) {
      spdlog::error("Cannot remove stale cgroup {}", leaf.Path().c_str());
    }
  }
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(kBoxRoot, ec)) {
    std::string box_name = entry.path().filename();
    if (box_name.compare(0, kCgroupPrefix.size(), kCgroupPrefix) != 0) continue;
    spdlog::warn("Removing stale box {}", entry.path().c_str());
    if (!CleanBox(box_name.substr(kCgroupPrefix.size()))) {
      spdlog::error("Cannot remove stale box {}", entry.path().c_str());
    }
  }
}

std::unique_ptr<EnvironmentBuilder> NewCgroupEnvironmentBuilder() {
  long start = kSubidStart, count = kSubidCount;
  if (!kSubidUser.empty() && !LoadSubordinateRange(kSubidUser, start, count)) {
    spdlog::warn("No subordinate range for {}; using {}+{}", kSubidUser, start, count);
  }
  if (kInsideUid <= 0) {
    spdlog::warn("Invalid inside uid {}; using 1000", kInsideUid);
    kInsideUid = 1000;
  }
  spdlog::info("Subordinate id range {}+{}", start, count);
  return std::make_unique<CgroupEnvironmentBuilder>(start, count);
}
