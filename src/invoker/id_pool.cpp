#include "id_pool.h"

#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <invoker/errors.h>

IdLease::IdLease(IdLease&& x) : pool_(x.pool_), id_(x.id_) {
  x.pool_ = nullptr;
  x.id_ = -1;
}

IdLease& IdLease::operator=(IdLease&& x) {
  if (this == &x) return *this;
  Release();
  pool_ = x.pool_;
  id_ = x.id_;
  x.pool_ = nullptr;
  x.id_ = -1;
  return *this;
}

void IdLease::Release() {
  if (!pool_) return;
  pool_->Return_(id_);
  pool_ = nullptr;
  id_ = -1;
}

SubordinateIdPool::SubordinateIdPool(long start, long count) : start_(start), count_(count) {
  // reversed so that the lowest ids are handed out first
  for (long i = start + count - 1; i >= start; i--) {
    if (i > 0) free_.push_back(i);
  }
}

void SubordinateIdPool::Return_(int id) {
  std::lock_guard lck(mtx_);
  free_.push_back(id);
}

IdLease SubordinateIdPool::Acquire() {
  std::lock_guard lck(mtx_);
  if (free_.empty()) {
    throw EngineError(ErrorCode::NAMESPACE_ALLOCATION_EXHAUSTED,
        "all " + std::to_string(count_) + " ids from " + std::to_string(start_) + " are leased");
  }
  int id = free_.back();
  free_.pop_back();
  return IdLease(this, id);
}

size_t SubordinateIdPool::Available() {
  std::lock_guard lck(mtx_);
  return free_.size();
}

namespace {

bool FindRange(const std::string& file, const std::string& user, long& start, long& count) {
  std::ifstream fin(file);
  if (!fin) {
    spdlog::warn("Cannot open {}", file);
    return false;
  }
  // user:start:count
  for (std::string line; std::getline(fin, line);) {
    size_t p1 = line.find(':');
    if (p1 == std::string::npos || line.substr(0, p1) != user) continue;
    size_t p2 = line.find(':', p1 + 1);
    if (p2 == std::string::npos) continue;
    try {
      start = std::stol(line.substr(p1 + 1, p2 - p1 - 1));
      count = std::stol(line.substr(p2 + 1));
    } catch (const std::logic_error&) {
      spdlog::warn("Malformed line in {}: {}", file, line);
      continue;
    }
    return true;
  }
  return false;
}

} // namespace

bool LoadSubordinateRange(const std::string& user, long& start, long& count,
                          const std::string& subuid, const std::string& subgid) {
  long ustart, ucount, gstart, gcount;
  if (!FindRange(subuid, user, ustart, ucount)) return false;
  if (!FindRange(subgid, user, gstart, gcount)) return false;
  if (ustart != gstart) {
    spdlog::warn("Subordinate uid and gid ranges of {} differ", user);
    return false;
  }
  start = ustart;
  count = std::min(ucount, gcount);
  return true;
}
