#ifndef INCLUDE_INVOKER_ERRORS_H_
#define INCLUDE_INVOKER_ERRORS_H_

#include <string>
#include <stdexcept>

// second column: whether it is a fault of the engine or the host (reported as SystemError)
#define ENUM_ERROR_CODE_ \
  X(INVALID_LIMITS, false) \
  X(INVALID_REQUEST, false) \
  X(CGROUP_CREATE_FAILED, true) \
  X(LIMIT_APPLY_FAILED, true) \
  X(NAMESPACE_ALLOCATION_EXHAUSTED, true) \
  X(SCRATCH_SETUP_FAILED, true) \
  X(SPAWN_FAILED, true) \
  X(TEARDOWN_TIMEOUT, true) \
  X(QUEUE_UNAVAILABLE, true)
enum class ErrorCode {
#define X(name, infra) name,
  ENUM_ERROR_CODE_
#undef X
};

class EngineError : public std::runtime_error {
  ErrorCode code_;
 public:
  EngineError(ErrorCode code, const std::string& msg);

  ErrorCode code() const { return code_; }
  bool IsInfrastructure() const;
};

#endif  // INCLUDE_INVOKER_ERRORS_H_
