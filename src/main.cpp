#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <invoker/logger.h>
#include <invoker/invoker.h>
#include <invoker/environment.h>
#include "paths.h"
#include "database.h"
#include "spool_queue.h"

namespace {

bool to_lock = true;
bool to_reconcile = true;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string cgroup_parent = ini[""]["cgroup_parent"] | "";
  std::string rootfs_template = ini[""]["rootfs_template"] | "";
  std::string spool_dir = ini[""]["spool_dir"] | "";
  std::string database = ini[""]["database"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (cgroup_parent.size()) kCgroupParent = cgroup_parent;
  if (rootfs_template.size()) kRootfsTemplate = rootfs_template;
  if (spool_dir.size()) kSpoolDir = spool_dir;
  if (database.size()) kDatabasePath = database;
  kCgroupPrefix = ini[""]["cgroup_prefix"] | kCgroupPrefix;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxAttempts = ini[""]["max_attempts"] | kMaxAttempts;
  kSeparateCompileEnvironment = ini[""]["separate_compile_environment"] | kSeparateCompileEnvironment;

  kSubidUser = ini[""]["subid_user"] | kSubidUser;
  kSubidStart = ini[""]["subid_start"] | kSubidStart;
  kSubidCount = ini[""]["subid_count"] | kSubidCount;
  kInsideUid = ini[""]["inside_uid"] | kInsideUid;
  kScratchSize = (ini[""]["scratch_size_mb"] | (kScratchSize / 1024)) * 1024;
  kTeardownRetries = ini[""]["teardown_retries"] | kTeardownRetries;
  kTeardownPollMs = ini[""]["teardown_poll_ms"] | kTeardownPollMs;

  // config in ms/MB; limits in us/KiB
  kDefaultLimits.cpu_time = (ini[""]["default_cpu_time_ms"] | (kDefaultLimits.cpu_time / 1000)) * 1000;
  kDefaultLimits.wall_time = (ini[""]["default_wall_time_ms"] | (kDefaultLimits.wall_time / 1000)) * 1000;
  kDefaultLimits.memory = (ini[""]["default_memory_mb"] | (kDefaultLimits.memory / 1024)) * 1024;
  kDefaultLimits.processes = ini[""]["default_processes"] | kDefaultLimits.processes;
  kDefaultLimits.open_files = ini[""]["default_open_files"] | kDefaultLimits.open_files;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kCaptureLimit = ini[""]["capture_limit_kib"] | kCaptureLimit;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "invoker");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/invoker.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");
  parser.add_argument("--no-reconcile")
    .default_value(false)
    .implicit_value(true)
    .help("Not remove leftovers of a previous run on startup");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  to_reconcile = parser["--no-reconcile"] == false;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another invoker instance is running.");
    return 1;
  }

  // handled by the signal thread only
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  SpoolQueue queue(kSpoolDir);
  try {
    queue.Recover();
  } catch (const EngineError& err) {
    spdlog::error("Cannot use spool {}: {}", kSpoolDir.c_str(), err.what());
    return 1;
  }
  SqliteResultStore store;
  auto builder = NewCgroupEnvironmentBuilder();
  if (to_reconcile) builder->Reconcile();

  Invoker invoker(queue, store, *builder);
  std::thread signal_thread([&]() {
    int sig;
    if (sigwait(&sigs, &sig) == 0) {
      spdlog::warn("Received signal {}; shutting down", sig);
    }
    invoker.Stop();
  });
  signal_thread.detach();
  invoker.WorkLoop();
}
