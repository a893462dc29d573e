#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace pagequeue::status {

// Stage names reported to clients.
inline constexpr const char* kUploading    = "uploading";
inline constexpr const char* kQueued       = "queued";
inline constexpr const char* kSplitting    = "splitting";
inline constexpr const char* kTransforming = "transforming";
inline constexpr const char* kMerging      = "merging";
inline constexpr const char* kFinished     = "finished";
inline constexpr const char* kError        = "error";
inline constexpr const char* kExpired      = "expired";

struct StatusRecord {
  std::string job_id;
  std::string status;
  int         progress = 0;
  std::string message;

  std::optional<std::string> result_path;
  std::optional<std::string> error;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};
};

struct StatusUpdate {
  std::optional<std::string> status;
  std::optional<int>         progress;
  std::optional<std::string> message;
  std::optional<std::string> result_path;
  std::optional<std::string> error;
};

/*
  In-memory progress reporting, one record per job.

  Progress rules:
  - uploading/splitting/transforming/finished carry fixed percentages
    (10/30/50/100) applied when the status changes to that name
  - merging and every other name keep the current value unless an
    explicit progress is given
  - explicit progress is clamped to [0,100] and overrides the fixed one
  - progress never decreases, except that setting an error forces
    status=error and progress=0

  Not persisted; rebuilt per process.
*/
class StatusTracker {
 public:
  explicit StatusTracker(util::NowFn now = util::Now);

  StatusRecord Create(const std::string& job_id, const std::string& status = kUploading,
                      const std::string& message = {});

  // Returns false when the job has no status record.
  bool Update(const std::string& job_id, const StatusUpdate& update);

  std::optional<StatusRecord> Get(const std::string& job_id) const;

  bool Delete(const std::string& job_id);
  bool Exists(const std::string& job_id) const;

  // Records whose status is uploading, queued, splitting, transforming or merging.
  size_t CountActive() const;

  // Drops terminal records (finished, error, expired, ...) not updated
  // within max_age. Active records are never pruned. Returns the count
  // removed.
  size_t PruneOlderThan(std::chrono::seconds max_age);

  std::vector<StatusRecord> List() const;

 private:
  util::NowFn now_;

  mutable std::mutex                            mutex_;
  std::unordered_map<std::string, StatusRecord> records_;
};

// Fixed percentage for a stage name, if it has one.
std::optional<int> AutoProgress(const std::string& status);

bool IsActiveStatus(const std::string& status);

} // namespace pagequeue::status
