#ifndef INVOKER_ID_POOL_H_
#define INVOKER_ID_POOL_H_

#include <mutex>
#include <string>
#include <vector>

class SubordinateIdPool;

// A leased host uid/gid pair. Returned to its pool on Release or destruction.
class IdLease {
  SubordinateIdPool* pool_;
  int id_;
 public:
  IdLease() : pool_(nullptr), id_(-1) {}
  IdLease(SubordinateIdPool* pool, int id) : pool_(pool), id_(id) {}
  IdLease(const IdLease&) = delete;
  IdLease& operator=(const IdLease&) = delete;
  IdLease(IdLease&&);
  IdLease& operator=(IdLease&&);
  ~IdLease() { Release(); }

  bool Valid() const { return pool_; }
  // uid and gid are the same number
  int Id() const { return id_; }
  void Release();
  // drop the id without returning it; used when processes of the id may still be alive
  void Abandon() { pool_ = nullptr; }
};

class SubordinateIdPool {
  std::mutex mtx_;
  std::vector<int> free_;
  long start_, count_;

  friend class IdLease;
  void Return_(int id);
 public:
  // [start, start + count); id 0 is never handed out
  SubordinateIdPool(long start, long count);
  SubordinateIdPool(const SubordinateIdPool&) = delete;
  SubordinateIdPool& operator=(const SubordinateIdPool&) = delete;

  // throws EngineError(NAMESPACE_ALLOCATION_EXHAUSTED)
  IdLease Acquire();
  size_t Available();
};

// Read the first range of user from /etc/subuid (or /etc/subgid) format files.
// Both files must give the same range. Returns false if not found.
bool LoadSubordinateRange(const std::string& user, long& start, long& count,
                          const std::string& subuid = "/etc/subuid",
                          const std::string& subgid = "/etc/subgid");

#endif  // INVOKER_ID_POOL_H_
