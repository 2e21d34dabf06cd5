#include "paths.h"

fs::path kBoxRoot = "/tmp/invoker_box";
fs::path kCgroupParent = "/sys/fs/cgroup/solve.slice";
std::string kCgroupPrefix = "invoker-";
fs::path kRootfsTemplate = "/";

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

fs::path BoxPath(const std::string& name) {
  return kBoxRoot / (kCgroupPrefix + name);
}
fs::path BoxUpper(const std::string& name) {
  return BoxPath(name) / "upper";
}
fs::path BoxOverlayWork(const std::string& name) {
  return BoxPath(name) / "work";
}
fs::path BoxRootfs(const std::string& name) {
  return BoxPath(name) / "root";
}
fs::path BoxPrivate(const std::string& name) {
  return BoxPath(name) / "private";
}
fs::path BoxWorkdir(const std::string& name, bool inside_box) {
  return Workdir(inside_box ? fs::path("/") : BoxRootfs(name));
}

fs::path LeafPath(const std::string& name) {
  return kCgroupParent / (kCgroupPrefix + name);
}
