#ifndef INCLUDE_INVOKER_SLOTS_H_
#define INCLUDE_INVOKER_SLOTS_H_

#include <mutex>
#include <vector>
#include <optional>
#include <condition_variable>

class SlotPool;

// Permission to run one request. Returned to its pool on Release or destruction.
class WorkerSlot {
  SlotPool* pool_;
  int index_;
 public:
  WorkerSlot() : pool_(nullptr), index_(-1) {}
  WorkerSlot(SlotPool* pool, int index) : pool_(pool), index_(index) {}
  WorkerSlot(const WorkerSlot&) = delete;
  WorkerSlot& operator=(const WorkerSlot&) = delete;
  WorkerSlot(WorkerSlot&&);
  WorkerSlot& operator=(WorkerSlot&&);
  ~WorkerSlot() { Release(); }

  bool Valid() const { return pool_; }
  int Index() const { return index_; }
  void Release();
};

class SlotPool {
  std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<int> free_;
  size_t size_;

  friend class WorkerSlot;
  void Return_(int index);
 public:
  SlotPool(size_t size);
  SlotPool(const SlotPool&) = delete;
  SlotPool& operator=(const SlotPool&) = delete;

  // blocks until a slot is free
  WorkerSlot Acquire();
  std::optional<WorkerSlot> TryAcquire();
  size_t Available();
  size_t Size() const { return size_; }
};

#endif  // INCLUDE_INVOKER_SLOTS_H_
