#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/admission/admission_policy.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/service/service_context.hpp"
#include "internal/status/status_tracker.hpp"
#include "internal/validation/document_validator.hpp"

namespace pagequeue::service {

enum class SubmitCode {
  kAccepted,
  kInvalid,  // validation failed; terminal
  kRejected, // admission failed; retry later
};

struct SubmitResult {
  SubmitCode  code = SubmitCode::kAccepted;
  std::string job_id;
  std::string message;

  size_t   queue_position         = 0;
  uint64_t estimated_wait_seconds = 0;

  admission::AdmissionReason reason              = admission::AdmissionReason::kNone;
  uint64_t                   retry_after_seconds = 0;

  validation::DocumentMetadata metadata;
};

struct JobStatusView {
  std::string                          job_id;
  std::optional<status::StatusRecord>  status;
  std::optional<model::LifecycleState> lifecycle;
  size_t                               queue_position         = 0;
  uint64_t                             estimated_wait_seconds = 0;
  bool                                 expired                = false;
};

enum class DownloadCode { kReady, kNotFound, kNotReady, kExpired };

struct DownloadResult {
  DownloadCode          code = DownloadCode::kNotFound;
  std::filesystem::path path;
  std::string           message;
};

struct HealthReport {
  size_t   queued          = 0;
  size_t   processing      = 0;
  size_t   finished        = 0;
  size_t   active_statuses = 0;
  uint64_t free_disk_bytes        = 0;
  uint64_t available_memory_bytes = 0;
  double   average_processing_seconds = 0.0;
};

/*
  Facade consumed by a transport.

  Owns no state of its own; every call goes through the queue, the status
  tracker and the artifact store held in the context.
*/
class JobService {
 public:
  explicit JobService(ServiceContext ctx);

  validation::ValidationResult CheckSize(uint64_t size);

  // Takes ownership of staged_upload: on acceptance it is moved into the
  // artifact store, otherwise it is left in place.
  SubmitResult Submit(const std::string& owner_id, const std::filesystem::path& staged_upload, uint32_t chunk_size);

  // Throws util::NotFound when the job is unknown to both the queue and
  // the status tracker.
  JobStatusView GetStatus(const std::string& job_id);

  // Marks the job downloaded on success.
  DownloadResult Download(const std::string& job_id);

  // Reclaims a downloaded job right away. Throws util::InvalidState for
  // jobs that were not downloaded.
  bool Release(const std::string& job_id);

  // Client-requested removal. Malformed ids are treated as unknown.
  // Throws util::InvalidState while processing.
  bool Cleanup(const std::string& job_id);

  HealthReport Health();

  // Recreates status records for jobs restored from the ledger.
  void RestoreStatuses();

 private:
  // Response for a job the queue no longer holds.
  DownloadResult Missing(const std::string& job_id) const;

  ServiceContext ctx_;
};

} // namespace pagequeue::service
