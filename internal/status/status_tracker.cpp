#include "status_tracker.hpp"

#include <algorithm>

namespace pagequeue::status {

std::optional<int> AutoProgress(const std::string& status) {
  if (status == kUploading) return 10;
  if (status == kSplitting) return 30;
  if (status == kTransforming) return 50;
  if (status == kFinished) return 100;
  if (status == kError) return 0;
  return std::nullopt;
}

bool IsActiveStatus(const std::string& status) {
  return status == kUploading || status == kQueued || status == kSplitting || status == kTransforming ||
         status == kMerging;
}

StatusTracker::StatusTracker(util::NowFn now) : now_(std::move(now)) {
}

StatusRecord StatusTracker::Create(const std::string& job_id, const std::string& status, const std::string& message) {
  StatusRecord record;
  record.job_id     = job_id;
  record.status     = status;
  record.progress   = AutoProgress(status).value_or(0);
  record.message    = message;
  record.created_at = now_();
  record.updated_at = record.created_at;

  std::lock_guard lock(mutex_);
  records_[job_id] = record;
  return record;
}

bool StatusTracker::Update(const std::string& job_id, const StatusUpdate& update) {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(job_id);
  if (it == records_.end()) {
    return false;
  }
  auto& record = it->second;

  if (update.error) {
    record.status   = kError;
    record.progress = 0;
    record.error    = update.error;
    if (update.message) record.message = *update.message;
    record.updated_at = now_();
    return true;
  }

  int progress = record.progress;
  if (update.status) {
    record.status = *update.status;
    if (auto fixed = AutoProgress(record.status)) {
      progress = *fixed;
    }
  }
  if (update.progress) {
    progress = std::clamp(*update.progress, 0, 100);
  }

  record.progress = record.status == kError ? 0 : std::max(record.progress, progress);

  if (update.message) record.message = *update.message;
  if (update.result_path) record.result_path = update.result_path;
  record.updated_at = now_();
  return true;
}

std::optional<StatusRecord> StatusTracker::Get(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(job_id);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

bool StatusTracker::Delete(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  return records_.erase(job_id) > 0;
}

bool StatusTracker::Exists(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  return records_.count(job_id) > 0;
}

size_t StatusTracker::CountActive() const {
  std::lock_guard lock(mutex_);
  return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                           [](const auto& entry) { return IsActiveStatus(entry.second.status); }));
}

size_t StatusTracker::PruneOlderThan(std::chrono::seconds max_age) {
  const auto cutoff = now_() - max_age;

  std::lock_guard lock(mutex_);
  size_t          removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    // a job still waiting or running keeps its record however long it takes
    if (!IsActiveStatus(it->second.status) && it->second.updated_at < cutoff) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<StatusRecord> StatusTracker::List() const {
  std::lock_guard lock(mutex_);

  std::vector<StatusRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(),
            [](const StatusRecord& a, const StatusRecord& b) { return a.created_at < b.created_at; });
  return out;
}

} // namespace pagequeue::status
