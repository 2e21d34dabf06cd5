#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <cstring>
#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
int CloseFrom(int minfd) {
  struct rlimit rlim;
  if (getrlimit(RLIMIT_NOFILE, &rlim) < 0) return -1;
  int maxfd = rlim.rlim_cur == RLIM_INFINITY ? 65536 : (int)rlim.rlim_cur;
  for (int fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}
#endif // has_include(<linux/close_range.h>)

int64_t MonotonicMicroseconds() {
  auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(dur).count();
}

int64_t UnixMicroseconds() {
  auto dur = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(dur).count();
}

EngineError::EngineError(ErrorCode code, const std::string& msg) :
    std::runtime_error(std::string(ErrorCodeName(code)) + ": " + msg), code_(code) {}

bool EngineError::IsInfrastructure() const {
  switch (code_) {
#define X(name, infra) case ErrorCode::name: return infra;
    ENUM_ERROR_CODE_
#undef X
  }
  __builtin_unreachable();
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

Verdict AbrToVerdict(const std::string& str) {
  for (int i = (int)Verdict::AC; i <= (int)Verdict::SE; i++) {
    if (str == kVerdictAbrTable[i]) return (Verdict)i;
  }
  return Verdict::NUL;
}

static const char* kStageKindNameTable[] = {
#define X(name, str) str,
  ENUM_STAGE_KIND_
#undef X
};

const char* StageKindName(StageKind kind) {
  return kStageKindNameTable[(int)kind];
}

bool GetStageKind(const std::string& str, StageKind& kind) {
  for (size_t i = 0; i < sizeof(kStageKindNameTable) / sizeof(kStageKindNameTable[0]); i++) {
    if (str == kStageKindNameTable[i]) {
      kind = (StageKind)i;
      return true;
    }
  }
  return false;
}

static const char* kCompareModeNameTable[] = {
#define X(name, str) str,
  ENUM_COMPARE_MODE_
#undef X
};

const char* CompareModeName(CompareMode mode) {
  return kCompareModeNameTable[(int)mode];
}

bool GetCompareMode(const std::string& str, CompareMode& mode) {
  for (size_t i = 0; i < sizeof(kCompareModeNameTable) / sizeof(kCompareModeNameTable[0]); i++) {
    if (str == kCompareModeNameTable[i]) {
      mode = (CompareMode)i;
      return true;
    }
  }
  return false;
}

#define X(...) X_RETURN_ARG1(LimitKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LimitKindName, LimitKind, ENUM_LIMIT_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorCodeName, ErrorCode, ENUM_ERROR_CODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + "k,mode=755").c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool MountOverlay(const fs::path& lower, const fs::path& upper, const fs::path& work,
                  const fs::path& target) {
  spdlog::debug("Mount overlay on {}, lower {}", target.c_str(), lower.c_str());
  std::string opts = "lowerdir=" + lower.string() + ",upperdir=" + upper.string() +
                     ",workdir=" + work.string();
  bool ret = 0 == mount("overlay", target.c_str(), "overlay", MS_NOSUID | MS_NODEV, opts.c_str());
  if (!ret) spdlog::warn("Failed mounting overlay on {}: {}", target.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path, bool lazy) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), lazy ? MNT_DETACH : 0);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool IsMountPoint(const fs::path& path) {
  struct stat st, parent_st;
  if (lstat(path.c_str(), &st) < 0) return false;
  if (lstat(path.parent_path().c_str(), &parent_st) < 0) return false;
  return st.st_dev != parent_st.st_dev;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Chown(const fs::path& path, int uid, int gid) {
  bool ret = 0 == lchown(path.c_str(), uid, gid);
  if (!ret) spdlog::warn("Failed chown {} to {}:{}: {}", path.c_str(), uid, gid, strerror(errno));
  return ret;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC,
                (mode_t)perms);
  if (fd < 0) goto err;
  for (size_t pos = 0; pos < content.size();) {
    ssize_t ret = write(fd, content.data() + pos, content.size() - pos);
    if (ret < 0) {
      if (errno == EINTR) continue;
      close(fd);
      goto err;
    }
    pos += ret;
  }
  if (close(fd) < 0) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
  return false;
}

namespace {

bool WriteAll(int fd, const std::string& content) {
  for (size_t pos = 0; pos < content.size();) {
    ssize_t ret = write(fd, content.data() + pos, content.size() - pos);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    pos += ret;
  }
  return true;
}

} // namespace

bool WriteFileBeneath(const fs::path& dir, const fs::path& rel, const std::string& content,
                      fs::perms perms, int uid, int gid) {
  constexpr int kDirFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
  fs::path norm = rel.lexically_normal();
  std::string name = norm.filename();
  if (norm.is_absolute() || name.empty() || name == "." || name == "..") {
    spdlog::warn("Refusing to write {} under {}", rel.c_str(), dir.c_str());
    return false;
  }
  int fd = open(dir.c_str(), kDirFlags), nfd;
  if (fd < 0) goto err;
  for (auto& part : norm.parent_path()) {
    if (part == "..") {
      errno = EACCES;
      goto err_close;
    }
    bool created = mkdirat(fd, part.c_str(), 0700) == 0;
    if (!created && errno != EEXIST) goto err_close;
    // fails with ELOOP or ENOTDIR on anything but a real directory
    nfd = openat(fd, part.c_str(), kDirFlags);
    if (nfd < 0) goto err_close;
    close(fd);
    fd = nfd;
    if (created && (fchown(fd, uid, gid) < 0 || fchmod(fd, 0755) < 0)) goto err_close;
  }
  // a FIFO or a symlink left in place must not be opened
  if (unlinkat(fd, name.c_str(), 0) < 0 && errno != ENOENT) goto err_close;
  nfd = openat(fd, name.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
  if (nfd < 0) goto err_close;
  close(fd);
  fd = nfd;
  if (fchown(fd, uid, gid) < 0 || fchmod(fd, (mode_t)perms) < 0 || !WriteAll(fd, content)) {
    goto err_close;
  }
  if (close(fd) < 0) goto err;
  return true;
err_close: {
    int saved = errno;
    close(fd);
    errno = saved;
  }
err:
  spdlog::warn("Failed writing {} under {}: {}", rel.c_str(), dir.c_str(), strerror(errno));
  return false;
}

bool ReadFile(const fs::path& path, std::string& content, size_t limit) {
  content.clear();
  int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  if (fd < 0) return false;
  char buf[4096];
  while (!limit || content.size() < limit) {
    size_t to_read = sizeof(buf);
    if (limit) to_read = std::min(to_read, limit - content.size());
    ssize_t ret = read(fd, buf, to_read);
    if (ret < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      close(fd);
      errno = err;
      return false;
    }
    if (ret == 0) break;
    content.append(buf, ret);
  }
  close(fd);
  return true;
}

bool CopyTree(const fs::path& from, const fs::path& to, int uid, int gid) {
  spdlog::debug("Copy tree {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  auto it = fs::recursive_directory_iterator(from, ec);
  if (ec) goto err;
  for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) goto err;
    const fs::path src = it->path();
    const fs::path dst = to / src.lexically_relative(from);
    auto src_type = it->symlink_status(ec).type();
    if (ec) goto err;
    auto dst_type = fs::symlink_status(dst, ec).type();
    ec.clear();
    // anything in the way is replaced, except a real directory merged with a directory
    if (dst_type != fs::file_type::not_found &&
        !(dst_type == fs::file_type::directory && src_type == fs::file_type::directory)) {
      fs::remove_all(dst, ec);
      if (ec) goto err;
    }
    switch (src_type) {
      case fs::file_type::directory: {
        if (dst_type != fs::file_type::directory) fs::create_directory(dst, ec);
        if (ec) goto err;
        fs::permissions(dst, it->status(ec).permissions() & fs::perms::mask, ec);
        if (ec) goto err;
        break;
      }
      case fs::file_type::regular: {
        std::string content;
        if (!ReadFile(src, content)) {
          ec = std::error_code(errno, std::generic_category());
          goto err;
        }
        auto perms = it->symlink_status(ec).permissions() &
            (fs::perms::owner_all | fs::perms::group_all | fs::perms::others_all);
        if (!WriteFile(dst, content, perms)) return false;
        break;
      }
      case fs::file_type::symlink: {
        fs::copy_symlink(src, dst, ec);
        if (ec) goto err;
        break;
      }
      default:
        spdlog::debug("Skip special file {}", src.c_str());
        continue;
    }
    if (!Chown(dst, uid, gid)) return false;
  }
  return true;
err:
  spdlog::warn("Failed copying tree {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}
