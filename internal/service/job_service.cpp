#include "job_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/resources/resource_probe.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace pagequeue::service {

using model::LifecycleState;
using observability::IntField;
using observability::StringField;

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

validation::ValidationResult JobService::CheckSize(uint64_t size) {
  return ctx_.validator->CheckSizeAllowance(size);
}

SubmitResult JobService::Submit(const std::string& owner_id, const std::filesystem::path& staged_upload,
                                uint32_t chunk_size) {
  SubmitResult result;

  auto structure = ctx_.validator->ValidateStructure(staged_upload);
  if (!structure.ok) {
    result.code    = SubmitCode::kInvalid;
    result.message = structure.message;
    PAGEQUEUE_LOG_INFO("upload rejected", {StringField("owner_id", owner_id), StringField("reason", structure.message)});
    return result;
  }
  result.metadata = structure.metadata;

  auto allowance = ctx_.validator->CheckSizeAllowance(structure.metadata.file_size);
  if (!allowance.ok) {
    result.code    = SubmitCode::kInvalid;
    result.message = allowance.message;
    PAGEQUEUE_LOG_INFO("upload rejected", {StringField("owner_id", owner_id), StringField("reason", allowance.message)});
    return result;
  }

  auto decision = ctx_.queue->CanAdmit(owner_id, structure.metadata.file_size);
  if (!decision.ok) {
    result.code                = SubmitCode::kRejected;
    result.reason              = decision.reason;
    result.retry_after_seconds = decision.retry_after_seconds;
    result.message             = decision.message;
    return result;
  }

  const auto job_id = util::GenerateJobId();
  const auto upload = ctx_.artifacts->AdoptUpload(job_id, staged_upload);

  ctx_.status->Create(job_id, status::kUploading, "Upload received");
  ctx_.queue->Add(job_id, owner_id, upload.string(), structure.metadata.file_size,
                  chunk_size > 0 ? chunk_size : ctx_.default_chunk_size);

  result.code                   = SubmitCode::kAccepted;
  result.job_id                 = job_id;
  result.queue_position         = ctx_.queue->QueuePosition(job_id);
  result.estimated_wait_seconds = ctx_.queue->EstimateWaitSeconds(job_id);
  result.message                = "Queued at position " + std::to_string(result.queue_position);

  status::StatusUpdate update;
  update.status  = status::kQueued;
  update.message = result.message;
  ctx_.status->Update(job_id, update);

  PAGEQUEUE_LOG_INFO("upload accepted", {StringField("job_id", job_id), StringField("owner_id", owner_id),
                                         IntField("pages", static_cast<int64_t>(structure.metadata.page_count))});
  return result;
}

JobStatusView JobService::GetStatus(const std::string& job_id) {
  JobStatusView view;
  view.job_id = job_id;
  view.status = ctx_.status->Get(job_id);

  if (auto record = ctx_.queue->Get(job_id)) {
    view.lifecycle = record->state;
  }
  if (!view.status && !view.lifecycle) {
    throw util::NotFound("job not found: " + job_id);
  }

  view.expired = view.status && view.status->status == status::kExpired;
  if (view.lifecycle == LifecycleState::kQueued) {
    view.queue_position         = ctx_.queue->QueuePosition(job_id);
    view.estimated_wait_seconds = ctx_.queue->EstimateWaitSeconds(job_id);
  }
  return view;
}

DownloadResult JobService::Download(const std::string& job_id) {
  DownloadResult result;

  auto record = ctx_.queue->Get(job_id);
  if (!record) {
    return Missing(job_id);
  }

  switch (record->state) {
    case LifecycleState::kFinished:
      try {
        ctx_.queue->MarkDownloaded(job_id);
      } catch (const util::WindowExpired&) {
        result.code    = DownloadCode::kExpired;
        result.message = "Download window expired, please resubmit";
        return result;
      } catch (const util::NotFound&) {
        // swept between Get and MarkDownloaded
        return Missing(job_id);
      }
      break;
    case LifecycleState::kDownloaded:
      break;
    case LifecycleState::kError:
      result.code    = DownloadCode::kNotReady;
      result.message = "Job failed: " + record->last_error.value_or("unknown error");
      return result;
    case LifecycleState::kQueued:
    case LifecycleState::kProcessing:
      result.code    = DownloadCode::kNotReady;
      result.message = "Job is " + std::string(model::ToString(record->state));
      return result;
  }

  result.path = ctx_.artifacts->OutputPath(job_id);
  std::error_code ec;
  if (!std::filesystem::exists(result.path, ec)) {
    result.code    = DownloadCode::kNotFound;
    result.message = "Result file is missing";
    return result;
  }

  result.code    = DownloadCode::kReady;
  result.message = "Ready";
  return result;
}

DownloadResult JobService::Missing(const std::string& job_id) const {
  DownloadResult result;

  auto existing = ctx_.status->Get(job_id);
  if (existing && existing->status == status::kExpired) {
    result.code    = DownloadCode::kExpired;
    result.message = existing->message;
  } else {
    result.code    = DownloadCode::kNotFound;
    result.message = "Job not found";
  }
  return result;
}

bool JobService::Release(const std::string& job_id) {
  auto record = ctx_.queue->Get(job_id);
  if (!record) {
    return false;
  }
  if (record->state != LifecycleState::kDownloaded) {
    throw util::InvalidState("job " + job_id + " has not been downloaded");
  }

  ctx_.queue->Delete(job_id);
  ctx_.status->Delete(job_id);
  return true;
}

bool JobService::Cleanup(const std::string& job_id) {
  // ids are client-supplied here; never let one name a path outside the store
  if (!util::IsJobId(job_id)) {
    return false;
  }

  bool removed = ctx_.queue->Delete(job_id);
  if (!removed) {
    // never admitted to the queue, or already swept
    ctx_.artifacts->CleanupArtifacts(job_id);
  }
  removed = ctx_.status->Delete(job_id) || removed;

  if (removed) {
    PAGEQUEUE_LOG_INFO("job cleaned up", {StringField("job_id", job_id)});
  }
  return removed;
}

HealthReport JobService::Health() {
  HealthReport report;
  report.queued                     = ctx_.queue->CountInState(LifecycleState::kQueued);
  report.processing                 = ctx_.queue->CountInState(LifecycleState::kProcessing);
  report.finished                   = ctx_.queue->CountInState(LifecycleState::kFinished);
  report.active_statuses            = ctx_.status->CountActive();
  report.free_disk_bytes            = ctx_.probe->FreeDiskBytes();
  report.available_memory_bytes     = ctx_.probe->AvailableMemoryBytes();
  report.average_processing_seconds = ctx_.queue->AverageProcessingSeconds();
  return report;
}

void JobService::RestoreStatuses() {
  for (const auto& record : ctx_.queue->List()) {
    if (ctx_.status->Exists(record.job_id)) continue;

    switch (record.state) {
      case LifecycleState::kQueued:
      case LifecycleState::kProcessing:
        ctx_.status->Create(record.job_id, status::kQueued, "Restored after restart");
        break;
      case LifecycleState::kFinished: {
        ctx_.status->Create(record.job_id, status::kFinished, "Ready for download");
        status::StatusUpdate update;
        update.result_path = ctx_.artifacts->OutputPath(record.job_id).string();
        ctx_.status->Update(record.job_id, update);
        break;
      }
      case LifecycleState::kError: {
        ctx_.status->Create(record.job_id, status::kError);
        status::StatusUpdate update;
        update.error = record.last_error.value_or("unknown error");
        ctx_.status->Update(record.job_id, update);
        break;
      }
      case LifecycleState::kDownloaded:
        break;
    }
  }
}

} // namespace pagequeue::service
