#include <invoker/slots.h>

WorkerSlot::WorkerSlot(WorkerSlot&& x) : pool_(x.pool_), index_(x.index_) {
  x.pool_ = nullptr;
  x.index_ = -1;
}

WorkerSlot& WorkerSlot::operator=(WorkerSlot&& x) {
  if (this == &x) return *this;
  Release();
  pool_ = x.pool_;
  index_ = x.index_;
  x.pool_ = nullptr;
  x.index_ = -1;
  return *this;
}

void WorkerSlot::Release() {
  if (!pool_) return;
  pool_->Return_(index_);
  pool_ = nullptr;
  index_ = -1;
}

SlotPool::SlotPool(size_t size) : size_(size) {
  for (size_t i = size; i > 0; i--) free_.push_back(i - 1);
}

void SlotPool::Return_(int index) {
  {
    std::lock_guard lck(mtx_);
    free_.push_back(index);
  }
  cv_.notify_one();
}

WorkerSlot SlotPool::Acquire() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]() { return !free_.empty(); });
  int index = free_.back();
  free_.pop_back();
  return WorkerSlot(this, index);
}

std::optional<WorkerSlot> SlotPool::TryAcquire() {
  std::lock_guard lck(mtx_);
  if (free_.empty()) return std::nullopt;
  int index = free_.back();
  free_.pop_back();
  return std::optional<WorkerSlot>(std::in_place, this, index);
}

size_t SlotPool::Available() {
  std::lock_guard lck(mtx_);
  return free_.size();
}
