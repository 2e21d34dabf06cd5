#ifndef INVOKER_ACCOUNTANT_H_
#define INVOKER_ACCOUNTANT_H_

#include <mutex>
#include <atomic>
#include <thread>
#include <condition_variable>

#include <invoker/request.h>
#include "cgroup.h"

struct Usage {
  int64_t cpu_time; // us
  int64_t memory_peak; // KiB
  int64_t wall_time; // us
};

// Accounting of one stage running in a leaf.
// Wall time and the cgroup-wide cpu time are enforced by a watcher thread that
// kills the whole leaf; memory & process count are enforced by the kernel and
// confirmed in Finish().
class ResourceAccountant {
  static constexpr int kWatchIntervalMs = 10;

  const CgroupLeaf& leaf_;
  ResourceLimits limits_;
  CgroupStats base_;
  int peak_fd_;
  int64_t start_;
  std::atomic<int64_t> max_memory_;
  std::atomic<int64_t> finish_;

  std::atomic<LimitKind> breach_;
  std::atomic_bool cancelled_;
  bool stop_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::thread watcher_;

  void Watch_();
  void Breach_(LimitKind);
 public:
  ResourceAccountant(const CgroupLeaf& leaf, const ResourceLimits& limits);
  ResourceAccountant(const ResourceAccountant&) = delete;
  ResourceAccountant& operator=(const ResourceAccountant&) = delete;
  ~ResourceAccountant();

  // call right after the process is started
  void Start();
  // join the watcher; usage stops counting
  void Stop();

  Usage Poll();
  LimitKind Breached() const { return breach_; }
  bool Cancelled() const { return cancelled_; }

  // record a breach detected outside (output size) and kill the leaf
  void ReportBreach(LimitKind);
  void Cancel();
  // Stop and decide the breach from the counters and the wait status of the main process.
  LimitKind Finish(int wstatus);
};

#endif  // INVOKER_ACCOUNTANT_H_
