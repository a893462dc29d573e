#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/admission/admission_policy.hpp"
#include "internal/model/job_record.hpp"
#include "internal/util/time.hpp"

namespace pagequeue::db {
class LedgerStore;
}
namespace pagequeue::resources {
class ResourceProbe;
}
namespace pagequeue::storage {
class ArtifactStore;
}

namespace pagequeue::queue {

struct JobQueueOptions {
  std::chrono::seconds download_window{60};
  std::chrono::seconds error_retention{3600};

  // Completed-job durations kept for wait estimates.
  size_t   history_window             = 10;
  uint64_t default_processing_seconds = 120;
};

enum class SweepReason { kWindowExpired, kDownloaded, kErrorRetention };

std::string_view ToString(SweepReason reason);

struct SweptJob {
  std::string job_id;
  SweepReason reason;
};

/*
  Durable admission ledger and single-job dispatcher.

  INVARIANTS:
  - at most one record is in processing
  - queued records leave the queue in (queued_at, admission_seq) order
  - lifecycle transitions only move forward (see model::CanTransition)

  Every mutation rewrites the full snapshot through the LedgerStore.
  Save failures are logged; the in-memory ledger stays authoritative.

  The lock is reentrant: composite operations (EstimateWaitSeconds,
  SweepExpired, PopNext) call public helpers that lock again. File
  cleanup always happens after the lock is released.
*/
class JobQueue {
 public:
  JobQueue(std::shared_ptr<db::LedgerStore> store, std::shared_ptr<resources::ResourceProbe> probe,
           std::shared_ptr<admission::AdmissionPolicy> policy, std::shared_ptr<storage::ArtifactStore> artifacts,
           JobQueueOptions options, util::NowFn now = util::Now);

  // Restores the snapshot. Jobs left in processing become errors.
  void Load();

  admission::AdmissionDecision CanAdmit(const std::string& owner_id, uint64_t declared_size);

  // Throws util::InvalidState for duplicate ids and for ids that are not a
  // single path component.
  model::JobRecord Add(const std::string& job_id, const std::string& owner_id, const std::string& source_path,
                       uint64_t declared_size, uint32_t chunk_size);

  std::optional<model::JobRecord> Get(const std::string& job_id) const;

  // Ordered by (queued_at, admission_seq).
  std::vector<model::JobRecord> List() const;

  std::optional<model::JobRecord> PopNext();

  void MarkFinished(const std::string& job_id);
  void MarkError(const std::string& job_id, const std::string& message);
  void MarkDownloaded(const std::string& job_id);

  // 1-indexed rank among queued jobs; 0 when not queued.
  size_t   QueuePosition(const std::string& job_id) const;
  uint64_t EstimateWaitSeconds(const std::string& job_id) const;
  double   AverageProcessingSeconds() const;

  std::vector<SweptJob> SweepExpired();

  // Removes the record and its artifacts. Returns false if unknown.
  bool Delete(const std::string& job_id);

  size_t CountInState(model::LifecycleState state) const;

 private:
  model::JobRecord& Require(const std::string& job_id);
  void              Transition(model::JobRecord& record, model::LifecycleState to);
  void              RecordDuration(const model::JobRecord& record);
  void              Persist();
  void              Cleanup(const std::vector<std::string>& job_ids, bool working_only) const;

  std::vector<const model::JobRecord*> QueuedInOrder() const;

  std::shared_ptr<db::LedgerStore>            store_;
  std::shared_ptr<resources::ResourceProbe>   probe_;
  std::shared_ptr<admission::AdmissionPolicy> policy_;
  std::shared_ptr<storage::ArtifactStore>     artifacts_;
  JobQueueOptions                             options_;
  util::NowFn                                 now_;

  mutable std::recursive_mutex                      mutex_;
  std::unordered_map<std::string, model::JobRecord> jobs_;
  std::deque<double>                                durations_;
  uint64_t                                          next_seq_ = 1;
};

} // namespace pagequeue::queue
