#include <invoker/limits.h>

#include <algorithm>

#include <invoker/errors.h>

ResourceLimits kDefaultLimits = [] {
  ResourceLimits lim;
  lim.cpu_time = 1'000'000;
  lim.wall_time = 3'000'000;
  lim.memory = 256 * 1024;
  lim.processes = 1;
  lim.open_files = 64;
  lim.output = 0;
  return lim;
}();
long kMaxOutput = 65536;
long kCaptureLimit = 64;

namespace {

constexpr int64_t kFallbackWallTime = 60'000'000;

void CheckNonNegative(int64_t val, const char* name) {
  if (val < 0) {
    throw EngineError(ErrorCode::INVALID_LIMITS, std::string(name) + " must not be negative");
  }
}

} // namespace

void ResourceLimits::Validate() const {
  CheckNonNegative(cpu_time, "cpu_time");
  CheckNonNegative(wall_time, "wall_time");
  if (memory == 0) {
    throw EngineError(ErrorCode::INVALID_LIMITS, "memory must not be 0; use unlimited instead");
  }
  if (memory != kUnlimited) CheckNonNegative(memory, "memory");
  if (processes == 0) {
    throw EngineError(ErrorCode::INVALID_LIMITS, "processes must not be 0");
  }
  CheckNonNegative(processes, "processes");
  CheckNonNegative(open_files, "open_files");
  CheckNonNegative(output, "output");
}

int64_t ResourceLimits::EffectiveWallTime() const {
  if (wall_time > 0) return wall_time;
  if (cpu_time > 0) return std::max(cpu_time * 2, cpu_time + 1'000'000);
  if (kDefaultLimits.wall_time > 0) return kDefaultLimits.wall_time;
  return kFallbackWallTime;
}

int64_t ResourceLimits::OutputCeilingBytes() const {
  int64_t kib = output > 0 ? std::min(output, (int64_t)kMaxOutput) : (int64_t)kMaxOutput;
  return kib * 1024;
}
