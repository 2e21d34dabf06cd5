#ifndef INVOKER_ISOLATION_H_
#define INVOKER_ISOLATION_H_

#include <mutex>

#include <invoker/environment.h>
#include "cgroup.h"
#include "id_pool.h"
#include "accountant.h"

class CgroupEnvironment : public IsolationEnvironment {
  std::string name_;
  CgroupLeaf leaf_;
  IdLease lease_;
  bool box_created_, tmpfs_mounted_, overlay_mounted_;
  bool torn_down_;

  std::mutex mtx_;
  ResourceAccountant* current_;
  bool cancelled_;

  bool KillProcesses_();
  bool RemoveScratch_();
 public:
  CgroupEnvironment(const std::string& name, IdLease&& lease);
  ~CgroupEnvironment() override;

  // called once by the builder; throws EngineError
  void Setup(const ResourceLimits& limits, const fs::path& rootfs_template);

  const std::string& Name() const override { return name_; }
  fs::path Workdir() const override;
  fs::path PrivateDir() const override;
  int HostUid() const override { return lease_.Id(); }
  int HostGid() const override { return lease_.Id(); }

  StageResult Execute(const ProcessSpec& spec) override;
  void Cancel() override;
  void Teardown() override;
};

class CgroupEnvironmentBuilder : public EnvironmentBuilder {
  SubordinateIdPool pool_;
 public:
  CgroupEnvironmentBuilder(long subid_start, long subid_count) : pool_(subid_start, subid_count) {}

  std::unique_ptr<IsolationEnvironment> Build(
      const std::string& name, const ResourceLimits& limits, const fs::path& rootfs_template) override;
  void Reconcile() override;
};

#endif  // INVOKER_ISOLATION_H_
