#include "job_queue.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include "internal/db/api/ledger_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resources/resource_probe.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace pagequeue::queue {

using model::JobRecord;
using model::LifecycleState;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kInterruptedMessage = "interrupted by service restart";

bool QueuedBefore(const JobRecord* a, const JobRecord* b) {
  if (a->queued_at != b->queued_at) return a->queued_at < b->queued_at;
  return a->admission_seq < b->admission_seq;
}

double DurationSeconds(const JobRecord& record) {
  if (!record.started_at || !record.finished_at) return 0.0;
  return std::chrono::duration<double>(*record.finished_at - *record.started_at).count();
}

} // namespace

std::string_view ToString(SweepReason reason) {
  switch (reason) {
    case SweepReason::kWindowExpired:
      return "window_expired";
    case SweepReason::kDownloaded:
      return "downloaded";
    case SweepReason::kErrorRetention:
      return "error_retention";
  }
  return "unknown";
}

JobQueue::JobQueue(std::shared_ptr<db::LedgerStore> store, std::shared_ptr<resources::ResourceProbe> probe,
                   std::shared_ptr<admission::AdmissionPolicy> policy, std::shared_ptr<storage::ArtifactStore> artifacts,
                   JobQueueOptions options, util::NowFn now)
    : store_(std::move(store)), probe_(std::move(probe)), policy_(std::move(policy)), artifacts_(std::move(artifacts)),
      options_(options), now_(std::move(now)) {
}

// ---------------------------------------------------------------------------
// Startup
// ---------------------------------------------------------------------------

void JobQueue::Load() {
  std::vector<JobRecord> records;
  auto                   result = store_->Load(&records);
  if (!result) {
    PAGEQUEUE_LOG_WARN("ledger unreadable, starting empty", {StringField("error", result.message)});
    records.clear();
  }

  std::vector<std::string> interrupted;
  {
    std::lock_guard lock(mutex_);
    jobs_.clear();
    durations_.clear();
    next_seq_ = 1;

    const auto now = now_();
    for (auto& record : records) {
      if (record.state == LifecycleState::kProcessing) {
        record.state       = LifecycleState::kError;
        record.finished_at = now;
        record.last_error  = kInterruptedMessage;
        interrupted.push_back(record.job_id);
      }
      next_seq_ = std::max(next_seq_, record.admission_seq + 1);
      jobs_[record.job_id] = std::move(record);
    }

    std::vector<const JobRecord*> completed;
    for (const auto& [id, record] : jobs_) {
      if (record.state == LifecycleState::kFinished || record.state == LifecycleState::kDownloaded) {
        completed.push_back(&record);
      }
    }
    std::sort(completed.begin(), completed.end(),
              [](const JobRecord* a, const JobRecord* b) {
                return a->finished_at.value_or(util::TimePoint{}) < b->finished_at.value_or(util::TimePoint{});
              });
    for (const auto* record : completed) {
      RecordDuration(*record);
    }

    if (!interrupted.empty()) {
      Persist();
    }
  }

  for (const auto& id : interrupted) {
    PAGEQUEUE_LOG_WARN("job interrupted by restart", {StringField("job_id", id)});
  }
  Cleanup(interrupted, true);

  PAGEQUEUE_LOG_INFO("ledger restored", {IntField("jobs", static_cast<int64_t>(records.size())),
                                         IntField("interrupted", static_cast<int64_t>(interrupted.size()))});
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

admission::AdmissionDecision JobQueue::CanAdmit(const std::string& owner_id, uint64_t declared_size) {
  auto decision = policy_->CheckAdmission(probe_->FreeDiskBytes(), probe_->AvailableMemoryBytes(), declared_size);
  if (decision.ok) {
    return decision;
  }

  decision.retry_after_seconds = static_cast<uint64_t>(std::ceil(AverageProcessingSeconds()));
  PAGEQUEUE_LOG_INFO("admission rejected", {StringField("owner_id", owner_id),
                                            StringField("reason", admission::ToString(decision.reason)),
                                            IntField("declared_size", static_cast<int64_t>(declared_size)),
                                            IntField("retry_after", static_cast<int64_t>(decision.retry_after_seconds))});
  return decision;
}

JobRecord JobQueue::Add(const std::string& job_id, const std::string& owner_id, const std::string& source_path,
                        uint64_t declared_size, uint32_t chunk_size) {
  try {
    storage::ValidateJobId(job_id);
  } catch (const std::invalid_argument& e) {
    throw util::InvalidState("rejected job id '" + job_id + "': " + e.what());
  }

  std::lock_guard lock(mutex_);
  if (jobs_.count(job_id) > 0) {
    throw util::InvalidState("job already exists: " + job_id);
  }

  JobRecord record;
  record.job_id        = job_id;
  record.owner_id      = owner_id;
  record.source_path   = source_path;
  record.declared_size = declared_size;
  record.chunk_size    = chunk_size;
  record.state         = LifecycleState::kQueued;
  record.queued_at     = now_();
  record.admission_seq = next_seq_++;

  jobs_[job_id] = record;
  Persist();

  PAGEQUEUE_LOG_INFO("job queued", {StringField("job_id", job_id), StringField("owner_id", owner_id),
                                    IntField("position", static_cast<int64_t>(QueuePosition(job_id)))});
  return record;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

std::optional<JobRecord> JobQueue::Get(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second;
}

std::vector<JobRecord> JobQueue::List() const {
  std::lock_guard lock(mutex_);

  std::vector<const JobRecord*> ordered;
  ordered.reserve(jobs_.size());
  for (const auto& [id, record] : jobs_) {
    ordered.push_back(&record);
  }
  std::sort(ordered.begin(), ordered.end(), QueuedBefore);

  std::vector<JobRecord> out;
  out.reserve(ordered.size());
  for (const auto* record : ordered) {
    out.push_back(*record);
  }
  return out;
}

std::vector<const JobRecord*> JobQueue::QueuedInOrder() const {
  std::vector<const JobRecord*> queued;
  for (const auto& [id, record] : jobs_) {
    if (record.state == LifecycleState::kQueued) {
      queued.push_back(&record);
    }
  }
  std::sort(queued.begin(), queued.end(), QueuedBefore);
  return queued;
}

size_t JobQueue::QueuePosition(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  const auto      queued = QueuedInOrder();
  for (size_t i = 0; i < queued.size(); ++i) {
    if (queued[i]->job_id == job_id) {
      return i + 1;
    }
  }
  return 0;
}

uint64_t JobQueue::EstimateWaitSeconds(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  const auto      position = QueuePosition(job_id);
  return static_cast<uint64_t>(std::ceil(static_cast<double>(position) * AverageProcessingSeconds()));
}

double JobQueue::AverageProcessingSeconds() const {
  std::lock_guard lock(mutex_);
  if (durations_.empty()) {
    return static_cast<double>(options_.default_processing_seconds);
  }
  return std::accumulate(durations_.begin(), durations_.end(), 0.0) / static_cast<double>(durations_.size());
}

size_t JobQueue::CountInState(LifecycleState state) const {
  std::lock_guard lock(mutex_);
  return static_cast<size_t>(
      std::count_if(jobs_.begin(), jobs_.end(), [state](const auto& entry) { return entry.second.state == state; }));
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

std::optional<JobRecord> JobQueue::PopNext() {
  std::lock_guard lock(mutex_);

  if (CountInState(LifecycleState::kProcessing) > 0) {
    return std::nullopt;
  }

  const auto queued = QueuedInOrder();
  if (queued.empty()) {
    return std::nullopt;
  }

  admission::PressureState pressure;
  pressure.available_ram  = probe_->AvailableMemoryBytes();
  pressure.available_disk = probe_->FreeDiskBytes();
  for (const auto& [id, record] : jobs_) {
    if (model::IsActive(record.state)) {
      const auto estimate = policy_->Estimate(record.declared_size);
      pressure.committed_ram += estimate.ram;
      pressure.committed_disk += estimate.disk;
    }
  }

  // Strict FIFO: a head that does not fit blocks everything behind it.
  const std::string head_id = queued.front()->job_id;
  auto&             head    = jobs_.at(head_id);
  if (!policy_->Fits(pressure, head.declared_size)) {
    PAGEQUEUE_LOG_DEBUG("head of queue waiting for resources",
                        {StringField("job_id", head.job_id), IntField("available_ram", static_cast<int64_t>(pressure.available_ram)),
                         IntField("available_disk", static_cast<int64_t>(pressure.available_disk))});
    return std::nullopt;
  }

  Transition(head, LifecycleState::kProcessing);
  head.started_at = now_();
  Persist();

  PAGEQUEUE_LOG_INFO("job started", {StringField("job_id", head.job_id)});
  return head;
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

JobRecord& JobQueue::Require(const std::string& job_id) {
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("job not found: " + job_id);
  }
  return it->second;
}

void JobQueue::Transition(JobRecord& record, LifecycleState to) {
  if (!model::CanTransition(record.state, to)) {
    throw util::InvalidState("job " + record.job_id + ": cannot move from " + std::string(model::ToString(record.state)) +
                             " to " + std::string(model::ToString(to)));
  }
  record.state = to;
}

void JobQueue::MarkFinished(const std::string& job_id) {
  std::lock_guard lock(mutex_);
  auto&           record = Require(job_id);
  Transition(record, LifecycleState::kFinished);

  const auto now                 = now_();
  record.finished_at             = now;
  record.download_window_expires = now + options_.download_window;
  RecordDuration(record);
  Persist();

  PAGEQUEUE_LOG_INFO("job finished", {StringField("job_id", job_id),
                                      IntField("duration_ms", static_cast<int64_t>(DurationSeconds(record) * 1000.0)),
                                      StringField("download_until", util::ToIso8601(*record.download_window_expires))});
}

void JobQueue::MarkError(const std::string& job_id, const std::string& message) {
  std::lock_guard lock(mutex_);
  auto&           record = Require(job_id);
  Transition(record, LifecycleState::kError);

  record.finished_at = now_();
  record.last_error  = message;
  Persist();

  PAGEQUEUE_LOG_WARN("job failed", {StringField("job_id", job_id), StringField("error", message)});
}

void JobQueue::MarkDownloaded(const std::string& job_id) {
  const auto      now = now_();
  std::lock_guard lock(mutex_);
  auto&           record = Require(job_id);

  if (record.state == LifecycleState::kFinished && record.download_window_expires &&
      *record.download_window_expires <= now) {
    throw util::WindowExpired("download window expired for job " + job_id);
  }
  Transition(record, LifecycleState::kDownloaded);

  record.downloaded_at = now;
  record.download_window_expires.reset();
  Persist();

  PAGEQUEUE_LOG_INFO("job downloaded", {StringField("job_id", job_id)});
}

void JobQueue::RecordDuration(const JobRecord& record) {
  if (options_.history_window == 0) return;
  durations_.push_back(DurationSeconds(record));
  while (durations_.size() > options_.history_window) {
    durations_.pop_front();
  }
}

// ---------------------------------------------------------------------------
// Reclamation
// ---------------------------------------------------------------------------

std::vector<SweptJob> JobQueue::SweepExpired() {
  std::vector<SweptJob> swept;
  {
    std::lock_guard lock(mutex_);
    const auto      now = now_();

    for (const auto& [id, record] : jobs_) {
      switch (record.state) {
        case LifecycleState::kFinished:
          if (record.download_window_expires && *record.download_window_expires <= now) {
            swept.push_back({id, SweepReason::kWindowExpired});
          }
          break;
        case LifecycleState::kDownloaded:
          swept.push_back({id, SweepReason::kDownloaded});
          break;
        case LifecycleState::kError:
          if (record.finished_at && *record.finished_at + options_.error_retention <= now) {
            swept.push_back({id, SweepReason::kErrorRetention});
          }
          break;
        default:
          break;
      }
    }

    if (swept.empty()) {
      return swept;
    }

    for (const auto& job : swept) {
      jobs_.erase(job.job_id);
    }
    Persist();
  }

  std::vector<std::string> ids;
  ids.reserve(swept.size());
  for (const auto& job : swept) {
    ids.push_back(job.job_id);
    PAGEQUEUE_LOG_INFO("job reclaimed", {StringField("job_id", job.job_id), StringField("reason", ToString(job.reason))});
  }
  Cleanup(ids, false);
  return swept;
}

bool JobQueue::Delete(const std::string& job_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end()) {
      return false;
    }
    if (model::IsActive(it->second.state)) {
      throw util::InvalidState("job " + job_id + " is processing");
    }
    jobs_.erase(it);
    Persist();
  }

  PAGEQUEUE_LOG_INFO("job deleted", {StringField("job_id", job_id)});
  Cleanup({job_id}, false);
  return true;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void JobQueue::Persist() {
  std::vector<JobRecord> records;
  records.reserve(jobs_.size());
  for (const auto& [id, record] : jobs_) {
    records.push_back(record);
  }

  auto result = store_->Save(records);
  if (!result) {
    PAGEQUEUE_LOG_ERROR("ledger save failed", {StringField("error", result.message),
                                               IntField("jobs", static_cast<int64_t>(records.size()))});
  }
}

void JobQueue::Cleanup(const std::vector<std::string>& job_ids, bool working_only) const {
  if (!artifacts_) return;
  for (const auto& id : job_ids) {
    try {
      if (working_only) {
        artifacts_->CleanupWorkingFiles(id);
      } else {
        artifacts_->CleanupArtifacts(id);
      }
    } catch (const std::exception& e) {
      // the record is already gone; one bad entry must not strand the rest
      PAGEQUEUE_LOG_ERROR("artifact cleanup failed", {StringField("job_id", id), StringField("error", e.what())});
    }
  }
}

} // namespace pagequeue::queue
