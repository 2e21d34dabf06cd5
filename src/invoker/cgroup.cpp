#include "cgroup.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <thread>
#include <sstream>
#include <cstring>
#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <invoker/errors.h>
#include <invoker/environment.h>
#include "utils.h"

namespace {

const char* kRequiredControllers[] = {"memory", "pids"};

bool ReadCgroupFile(const fs::path& path, std::string& content) {
  if (!ReadFile(path, content, 1 << 16)) {
    spdlog::debug("Failed reading {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

// parse "key value" lines of cpu.stat, memory.events, pids.events
bool ReadKeyed(const fs::path& path, const std::string& key, long long& value) {
  std::string content;
  if (!ReadCgroupFile(path, content)) return false;
  std::istringstream iss(content);
  std::string name;
  long long val;
  while (iss >> name >> val) {
    if (name == key) {
      value = val;
      return true;
    }
  }
  return false;
}

bool HasControllers(const fs::path& file) {
  std::string content;
  if (!ReadCgroupFile(file, content)) return false;
  std::istringstream iss(content);
  std::vector<std::string> names;
  for (std::string name; iss >> name;) names.push_back(name);
  for (const char* ctrl : kRequiredControllers) {
    if (std::find(names.begin(), names.end(), ctrl) == names.end()) return false;
  }
  return true;
}

} // namespace

CgroupLeaf::~CgroupLeaf() {
  if (!created_) return;
  KillAll();
  if (WaitEmpty(kTeardownRetries, kTeardownPollMs)) Remove();
}

bool CgroupLeaf::Write_(const char* file, const std::string& value) const {
  fs::path path = path_ / file;
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) goto err;
  if (write(fd, value.data(), value.size()) != (ssize_t)value.size()) {
    int e = errno;
    close(fd);
    errno = e;
    goto err;
  }
  close(fd);
  return true;
err:
  spdlog::warn("Failed writing \"{}\" to {}: {}", value, path.c_str(), strerror(errno));
  return false;
}

void CgroupLeaf::Create() {
  fs::path parent = path_.parent_path();
  struct stat st;
  if (stat(parent.c_str(), &st) < 0 || !S_ISDIR(st.st_mode)) {
    throw EngineError(ErrorCode::CGROUP_CREATE_FAILED,
        "parent cgroup " + parent.string() + " does not exist");
  }
  spdlog::debug("Create cgroup {}", path_.c_str());
  if (mkdir(path_.c_str(), 0755) < 0) {
    throw EngineError(ErrorCode::CGROUP_CREATE_FAILED,
        "mkdir " + path_.string() + ": " + strerror(errno));
  }
  created_ = true;
}

void CgroupLeaf::ApplyLimits(const ResourceLimits& lim) {
  if (!HasControllers(path_ / "cgroup.controllers")) {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED,
        "memory/pids controllers are not enabled for " + path_.string());
  }
  std::string memory = lim.HasMemoryLimit() ? std::to_string(lim.memory * 1024) : "max";
  if (!Write_("memory.max", memory)) {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED, "cannot set memory.max of " + path_.string());
  }
  // absent if the kernel does not account swap; nothing can be swapped out then
  if (fs::exists(path_ / "memory.swap.max") && !Write_("memory.swap.max", "0")) {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED,
        "cannot set memory.swap.max of " + path_.string());
  }
  // kill the whole tree on OOM
  if (!Write_("memory.oom.group", "1")) {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED,
        "cannot set memory.oom.group of " + path_.string());
  }
  if (!Write_("pids.max", std::to_string(lim.processes))) {
    throw EngineError(ErrorCode::LIMIT_APPLY_FAILED, "cannot set pids.max of " + path_.string());
  }
}

bool CgroupLeaf::Stats(CgroupStats& stats) const {
  long long cpu = 0, oom = 0, pids = 0, current = 0;
  bool ret = ReadKeyed(path_ / "cpu.stat", "usage_usec", cpu);
  ret = ReadKeyed(path_ / "memory.events", "oom_kill", oom) && ret;
  ret = ReadKeyed(path_ / "pids.events", "max", pids) && ret;
  std::string content;
  if (ReadCgroupFile(path_ / "memory.current", content)) {
    current = atoll(content.c_str());
  } else {
    ret = false;
  }
  stats.cpu_usage = cpu;
  stats.memory_current = current / 1024;
  stats.oom_kill = oom;
  stats.pids_max = pids;
  return ret;
}

int CgroupLeaf::OpenPeak() const {
  fs::path path = path_ / "memory.peak";
  int fd = open(path.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) return -1;
  // per-fd reset; available since Linux 6.12
  if (write(fd, "reset\n", 6) < 0) {
    close(fd);
    return -1;
  }
  return fd;
}

int64_t CgroupLeaf::ReadPeak(int fd) {
  char buf[32] = {};
  ssize_t ret = pread(fd, buf, sizeof(buf) - 1, 0);
  if (ret <= 0) return -1;
  return atoll(buf) / 1024;
}

std::vector<pid_t> CgroupLeaf::Procs() const {
  std::vector<pid_t> ret;
  std::string content;
  if (!ReadCgroupFile(path_ / "cgroup.procs", content)) return ret;
  std::istringstream iss(content);
  for (pid_t pid; iss >> pid;) ret.push_back(pid);
  return ret;
}

bool CgroupLeaf::Empty() const {
  std::string content;
  if (!ReadCgroupFile(path_ / "cgroup.events", content)) return Procs().empty();
  return content.find("populated 0") != std::string::npos;
}

bool CgroupLeaf::KillAll() const {
  if (access((path_ / "cgroup.kill").c_str(), W_OK) == 0 && Write_("cgroup.kill", "1")) return true;
  // kernels before 5.14
  bool ret = true;
  for (pid_t pid : Procs()) {
    if (kill(pid, SIGKILL) < 0 && errno != ESRCH) {
      spdlog::warn("Failed killing {} in {}: {}", pid, path_.c_str(), strerror(errno));
      ret = false;
    }
  }
  return ret;
}

bool CgroupLeaf::WaitEmpty(int retries, int poll_ms) const {
  for (int i = 0; i <= retries; i++) {
    if (Empty()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
  }
  return Empty();
}

bool CgroupLeaf::Remove() {
  if (!created_) return true;
  spdlog::debug("Remove cgroup {}", path_.c_str());
  if (rmdir(path_.c_str()) < 0 && errno != ENOENT) {
    spdlog::warn("Failed removing cgroup {}: {}", path_.c_str(), strerror(errno));
    return false;
  }
  created_ = false;
  return true;
}

bool EnableControllers(const fs::path& parent) {
  if (HasControllers(parent / "cgroup.subtree_control")) return true;
  if (!HasControllers(parent / "cgroup.controllers")) {
    spdlog::warn("memory/pids controllers are not available in {}", parent.c_str());
    return false;
  }
  fs::path path = parent / "cgroup.subtree_control";
  int fd = open(path.c_str(), O_WRONLY | O_CLOEXEC);
  bool ret = fd >= 0;
  for (const char* ctrl : kRequiredControllers) {
    if (!ret) break;
    std::string val = std::string("+") + ctrl;
    ret = write(fd, val.data(), val.size()) == (ssize_t)val.size();
  }
  if (!ret) spdlog::warn("Failed enabling controllers in {}: {}", parent.c_str(), strerror(errno));
  if (fd >= 0) close(fd);
  return ret;
}

std::vector<std::string> ListLeaves(const fs::path& parent, const std::string& prefix) {
  std::vector<std::string> ret;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(parent, ec)) {
    std::string name = entry.path().filename();
    if (entry.is_directory(ec) && name.compare(0, prefix.size(), prefix) == 0) {
      ret.push_back(name);
    }
  }
  if (ec) spdlog::warn("Failed listing {}: {}", parent.c_str(), ec.message());
  return ret;
}
