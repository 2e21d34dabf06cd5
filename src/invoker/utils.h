#ifndef INVOKER_UTILS_H_
#define INVOKER_UTILS_H_

#include <string>
#include <filesystem>

#include <invoker/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

// async-signal-safe; used between fork and exec
int CloseFrom(int minfd);

int64_t MonotonicMicroseconds();
int64_t UnixMicroseconds();

bool MountTmpfs(const fs::path&, long size_kib);
bool MountOverlay(const fs::path& lower, const fs::path& upper, const fs::path& work,
                  const fs::path& target);
// lazy = MNT_DETACH
bool Umount(const fs::path&, bool lazy = false);
bool IsMountPoint(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
// does not follow symlinks
bool Chown(const fs::path&, int uid, int gid);

// These functions never follow a symlink at the final component
bool WriteFile(const fs::path&, const std::string& content, fs::perms = kPerm666);
// Write dir/rel where dir is writable by an untrusted user: no symlink is followed at
// any component, missing directories are created with mode 755 and the file replaces
// whatever entry is there. Everything created is owned by uid:gid.
bool WriteFileBeneath(const fs::path& dir, const fs::path& rel, const std::string& content,
                      fs::perms perms, int uid, int gid);
// reads at most limit bytes (0 = unlimited)
bool ReadFile(const fs::path&, std::string& content, size_t limit = 0);
// Copy a directory tree owned by an untrusted user: symlinks are copied as symlinks,
// special files are skipped and everything created is owned by uid:gid.
bool CopyTree(const fs::path& from, const fs::path& to, int uid, int gid);

#endif  // INVOKER_UTILS_H_
