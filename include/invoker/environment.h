#ifndef INCLUDE_INVOKER_ENVIRONMENT_H_
#define INCLUDE_INVOKER_ENVIRONMENT_H_

#include <memory>
#include <string>
#include <vector>

#include "paths.h"
#include "request.h"

// subordinate id range of the service account; host uid 0 is never in it
extern std::string kSubidUser; // if not empty, the range is read from /etc/subuid & /etc/subgid
extern long kSubidStart;
extern long kSubidCount;
// uid/gid seen by the sandboxed program; never 0
extern int kInsideUid;
// size of the tmpfs holding the writable layers of one environment
extern long kScratchSize; // KiB
// polling of cgroup.procs on teardown
extern int kTeardownRetries;
extern int kTeardownPollMs;

struct ProcessSpec {
  std::vector<std::string> command;
  std::vector<std::string> envs;
  fs::path stdin_file; // host path; /dev/null if empty
  ResourceLimits limits;
  // stdout going over the output ceiling is an output breach instead of a plain truncation
  bool limit_output;

  ProcessSpec() : limit_output(false) {}
};

// One execution's isolated environment: a cgroup leaf, a leased uid/gid pair and
// a scratch root. Destroyed (by Teardown or the destructor) on every exit path.
class IsolationEnvironment {
 public:
  virtual ~IsolationEnvironment() = default;

  virtual const std::string& Name() const = 0;
  // host path of /workdir, the only location writable by the program
  virtual fs::path Workdir() const = 0;
  // host path not visible inside the sandbox
  virtual fs::path PrivateDir() const = 0;
  virtual int HostUid() const = 0;
  virtual int HostGid() const = 0;

  // Run one process tree to completion under spec.limits.
  // Failures of the program are reported in the result; infrastructure failures
  // either throw EngineError or set StageResult::error.
  virtual StageResult Execute(const ProcessSpec& spec) = 0;
  // kill the running process tree (if any) and make further Execute calls fail fast;
  // can be called from any thread
  virtual void Cancel() = 0;
  // idempotent; throws EngineError(TEARDOWN_TIMEOUT) if processes survive every kill round
  virtual void Teardown() = 0;
};

class EnvironmentBuilder {
 public:
  virtual ~EnvironmentBuilder() = default;

  // throws EngineError; nothing is left behind on failure
  virtual std::unique_ptr<IsolationEnvironment> Build(
      const std::string& name, const ResourceLimits& limits, const fs::path& rootfs_template) = 0;
  // remove leftovers of a previous (crashed) run; call before any Build
  virtual void Reconcile() {}
};

std::unique_ptr<EnvironmentBuilder> NewCgroupEnvironmentBuilder();

#endif  // INCLUDE_INVOKER_ENVIRONMENT_H_
