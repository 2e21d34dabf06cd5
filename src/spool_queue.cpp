#include "spool_queue.h"

#include <cstring>
#include <fstream>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <invoker/serialize.h>
#include <invoker/utils.h>

using nlohmann::json;

namespace {

void Unavailable(const std::string& msg) {
  throw EngineError(ErrorCode::QUEUE_UNAVAILABLE, msg);
}

// write to a temporary file and rename, so a reader never sees a partial file
void WriteAtomic(const fs::path& path, const std::string& content) {
  fs::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      Unavailable("cannot write " + tmp.string());
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) Unavailable("cannot rename " + tmp.string() + ": " + ec.message());
}

std::string Dump(const json& data) {
  // program output is not necessarily valid UTF-8
  return data.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

void SpoolQueue::CheckDirs_() const {
  for (auto& dir : {SpoolIncoming(root_), SpoolProcessing(root_), SpoolDone(root_)}) {
    if (!fs::is_directory(dir)) Unavailable(dir.string() + " is not a directory");
  }
}

void SpoolQueue::Recover() {
  std::lock_guard lck(mtx_);
  CheckDirs_();
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(SpoolProcessing(root_), ec)) {
    fs::path target = SpoolIncoming(root_) / entry.path().filename();
    spdlog::warn("Requeueing interrupted request {}", entry.path().filename().c_str());
    fs::rename(entry.path(), target, ec);
    if (ec) Unavailable("cannot requeue " + entry.path().string() + ": " + ec.message());
  }
  if (ec) Unavailable("cannot list " + SpoolProcessing(root_).string() + ": " + ec.message());
  claimed_.clear();
}

void SpoolQueue::WriteReport_(const std::string& name, const ExecutionReport& report) {
  WriteAtomic(SpoolDone(root_) / (name + ".json"), Dump(ReportJSON(report)));
}

void SpoolQueue::Reject_(const fs::path& file, const std::string& message) {
  spdlog::warn("Rejecting {}: {}", file.filename().c_str(), message);
  ExecutionReport report;
  report.request_id = file.stem();
  report.verdict = Verdict::SE;
  report.message = message;
  WriteReport_(file.stem(), report);
  std::error_code ec;
  fs::remove(file, ec);
  if (ec) spdlog::warn("Cannot remove {}: {}", file.c_str(), ec.message());
}

std::optional<ExecutionRequest> SpoolQueue::Dequeue() {
  std::lock_guard lck(mtx_);
  CheckDirs_();

  std::vector<std::pair<fs::file_time_type, fs::path>> pending;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator(SpoolIncoming(root_), ec)) {
    if (entry.path().extension() != ".json" || !entry.is_regular_file(ec)) continue;
    auto mtime = entry.last_write_time(ec);
    if (ec) continue;
    pending.emplace_back(mtime, entry.path());
  }
  if (ec) Unavailable("cannot list " + SpoolIncoming(root_).string() + ": " + ec.message());
  std::sort(pending.begin(), pending.end());

  for (auto& [mtime, path] : pending) {
    fs::path claimed = SpoolProcessing(root_) / path.filename();
    fs::rename(path, claimed, ec);
    if (ec) {
      spdlog::debug("Cannot claim {}: {}", path.c_str(), ec.message());
      continue;
    }
    std::string message;
    try {
      std::ifstream fin(claimed);
      json data = json::parse(fin);
      ExecutionRequest req = RequestFromJSON(data);
      if (claimed_.count(req.id)) {
        // the same id is running; leave it for later
        fs::rename(claimed, path, ec);
        if (ec) Unavailable("cannot return " + claimed.string() + ": " + ec.message());
        continue;
      }
      claimed_[req.id] = claimed;
      spdlog::info("Dequeued request {} from {}", req.id, path.filename().c_str());
      return req;
    } catch (json::exception& err) {
      message = std::string("malformed request: ") + err.what();
    } catch (const EngineError& err) {
      if (err.code() == ErrorCode::QUEUE_UNAVAILABLE) throw;
      message = err.what();
    }
    Reject_(claimed, message);
  }
  return std::nullopt;
}

void SpoolQueue::Ack(const std::string& request_id, const ExecutionReport& report) {
  std::lock_guard lck(mtx_);
  auto it = claimed_.find(request_id);
  if (it == claimed_.end()) {
    spdlog::warn("Ack of unknown request {}", request_id);
    return;
  }
  WriteReport_(it->second.stem(), report);
  std::error_code ec;
  fs::remove(it->second, ec);
  if (ec) spdlog::warn("Cannot remove {}: {}", it->second.c_str(), ec.message());
  claimed_.erase(it);
}

void SpoolQueue::Nack(const std::string& request_id, const std::string& reason) {
  std::lock_guard lck(mtx_);
  auto it = claimed_.find(request_id);
  if (it == claimed_.end()) {
    spdlog::warn("Nack of unknown request {}", request_id);
    return;
  }
  json data;
  try {
    std::ifstream fin(it->second);
    data = json::parse(fin);
    data["attempt"] = data.value("attempt", 0) + 1;
  } catch (json::exception& err) {
    Unavailable("cannot reread " + it->second.string() + ": " + err.what());
  }
  spdlog::info("Requeueing request {} (attempt {}): {}", request_id, data["attempt"].get<int>(), reason);
  WriteAtomic(SpoolIncoming(root_) / it->second.filename(), Dump(data));
  std::error_code ec;
  fs::remove(it->second, ec);
  if (ec) spdlog::warn("Cannot remove {}: {}", it->second.c_str(), ec.message());
  claimed_.erase(it);
}
