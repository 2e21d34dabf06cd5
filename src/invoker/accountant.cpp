#include "accountant.h"

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

ResourceAccountant::ResourceAccountant(const CgroupLeaf& leaf, const ResourceLimits& limits) :
    leaf_(leaf), limits_(limits), base_{}, peak_fd_(-1), start_(0),
    max_memory_(0), finish_(0), breach_(LimitKind::NONE), cancelled_(false), stop_(false) {
  if (!leaf_.Stats(base_)) spdlog::warn("Incomplete counters of {}", leaf_.Path().c_str());
  peak_fd_ = leaf_.OpenPeak();
  if (peak_fd_ < 0) spdlog::debug("memory.peak reset unavailable; using sampled memory");
}

ResourceAccountant::~ResourceAccountant() {
  Stop();
  if (peak_fd_ >= 0) close(peak_fd_);
}

void ResourceAccountant::Start() {
  start_ = MonotonicMicroseconds();
  watcher_ = std::thread(&ResourceAccountant::Watch_, this);
}

void ResourceAccountant::Stop() {
  {
    std::lock_guard lck(mtx_);
    if (stop_) return;
    stop_ = true;
  }
  cv_.notify_all();
  if (watcher_.joinable()) watcher_.join();
  if (start_) finish_ = MonotonicMicroseconds();
}

void ResourceAccountant::Breach_(LimitKind kind) {
  LimitKind expected = LimitKind::NONE;
  // the first breach wins
  if (breach_.compare_exchange_strong(expected, kind)) {
    spdlog::info("Limit {} exceeded in {}", LimitKindName(kind), leaf_.Path().c_str());
  }
  leaf_.KillAll();
}

void ResourceAccountant::ReportBreach(LimitKind kind) {
  Breach_(kind);
}

void ResourceAccountant::Cancel() {
  cancelled_ = true;
  leaf_.KillAll();
}

void ResourceAccountant::Watch_() {
  const int64_t wall_limit = limits_.EffectiveWallTime();
  std::unique_lock lck(mtx_);
  while (!stop_) {
    cv_.wait_for(lck, std::chrono::milliseconds(kWatchIntervalMs));
    if (stop_) break;
    if (breach_ != LimitKind::NONE || cancelled_) continue;
    if (MonotonicMicroseconds() - start_ >= wall_limit) {
      Breach_(LimitKind::WALL_TIME);
      continue;
    }
    CgroupStats stats;
    if (!leaf_.Stats(stats)) continue;
    int64_t mem = stats.memory_current;
    int64_t prev = max_memory_;
    while (mem > prev && !max_memory_.compare_exchange_weak(prev, mem));
    // RLIMIT_CPU only covers single processes; this covers the whole tree
    if (limits_.cpu_time > 0 && stats.cpu_usage - base_.cpu_usage > limits_.cpu_time) {
      Breach_(LimitKind::CPU_TIME);
    }
  }
}

Usage ResourceAccountant::Poll() {
  Usage usage{};
  CgroupStats stats;
  if (leaf_.Stats(stats)) {
    usage.cpu_time = std::max<int64_t>(0, stats.cpu_usage - base_.cpu_usage);
    int64_t prev = max_memory_;
    while (stats.memory_current > prev &&
           !max_memory_.compare_exchange_weak(prev, stats.memory_current));
  }
  int64_t peak = peak_fd_ >= 0 ? CgroupLeaf::ReadPeak(peak_fd_) : -1;
  usage.memory_peak = peak >= 0 ? peak : (int64_t)max_memory_;
  int64_t end = finish_ ? (int64_t)finish_ : MonotonicMicroseconds();
  usage.wall_time = start_ ? end - start_ : 0;
  return usage;
}

LimitKind ResourceAccountant::Finish(int wstatus) {
  Stop();
  if (breach_ != LimitKind::NONE || cancelled_) return breach_;
  CgroupStats stats;
  if (!leaf_.Stats(stats)) {
    spdlog::warn("Cannot read final counters of {}", leaf_.Path().c_str());
    return LimitKind::NONE;
  }
  bool signaled = WIFSIGNALED(wstatus);
  bool failed = signaled || WEXITSTATUS(wstatus) != 0;
  int64_t cpu = stats.cpu_usage - base_.cpu_usage;
  if (stats.oom_kill > base_.oom_kill) {
    breach_ = LimitKind::MEMORY;
  } else if (signaled && WTERMSIG(wstatus) == SIGXCPU) {
    breach_ = LimitKind::CPU_TIME;
  } else if (limits_.cpu_time > 0 && cpu > limits_.cpu_time) {
    breach_ = LimitKind::CPU_TIME;
  } else if (failed && stats.pids_max > base_.pids_max) {
    breach_ = LimitKind::PROCESSES;
  }
  return breach_;
}
