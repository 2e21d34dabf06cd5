#ifndef INVOKER_PATHS_H_
#define INVOKER_PATHS_H_

#include <invoker/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// box layout of one environment:
//   <box>/upper, <box>/work: overlay layers
//   <box>/root: merged root (chroot of the program), with a writable /workdir
//   <box>/private: engine files never visible to the program
fs::path BoxPath(const std::string& name);
fs::path BoxUpper(const std::string& name);
fs::path BoxOverlayWork(const std::string& name);
fs::path BoxRootfs(const std::string& name);
fs::path BoxPrivate(const std::string& name);
// if inside_box = true, name is not used
fs::path BoxWorkdir(const std::string& name, bool inside_box = false);

fs::path LeafPath(const std::string& name);

#endif  // INVOKER_PATHS_H_
