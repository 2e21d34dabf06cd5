#ifndef INCLUDE_INVOKER_LIMITS_H_
#define INCLUDE_INVOKER_LIMITS_H_

#include <cstdint>

// Limits of one execution. Times are in us and sizes in KiB.
// 0 means "no limit" for cpu_time, open_files and output; wall_time = 0 is derived from cpu_time.
// memory and processes can never be 0: use kUnlimited for an unlimited memory.
struct ResourceLimits {
  static constexpr int64_t kUnlimited = -1;

  int64_t cpu_time; // us
  int64_t wall_time; // us
  int64_t memory; // KiB
  int64_t processes;
  int64_t open_files;
  int64_t output; // KiB

  ResourceLimits() :
      cpu_time(0), wall_time(0),
      memory(kUnlimited),
      processes(1),
      open_files(0),
      output(0) {}

  // throws EngineError(INVALID_LIMITS)
  void Validate() const;

  bool HasMemoryLimit() const { return memory != kUnlimited; }
  // wall time actually enforced by the watcher
  int64_t EffectiveWallTime() const;
  // bytes of program output kept before it is regarded as an output breach
  int64_t OutputCeilingBytes() const;
};

// filled in from configuration; used for fields missing in a request
extern ResourceLimits kDefaultLimits;
// KiB
extern long kMaxOutput;
extern long kCaptureLimit;

#endif  // INCLUDE_INVOKER_LIMITS_H_
