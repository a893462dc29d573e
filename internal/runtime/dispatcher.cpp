#include "dispatcher.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/chunked_pipeline.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/status/status_tracker.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"

namespace pagequeue::runtime {

using observability::StringField;

Dispatcher::Dispatcher(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<status::StatusTracker> status,
                       std::shared_ptr<pipeline::ChunkedPipeline> pipeline, std::shared_ptr<storage::ArtifactStore> artifacts,
                       std::chrono::milliseconds poll_interval)
    : queue_(std::move(queue)), status_(std::move(status)), pipeline_(std::move(pipeline)), artifacts_(std::move(artifacts)),
      poll_interval_(poll_interval) {
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&Dispatcher::Loop, this);
}

void Dispatcher::Stop() {
  running_ = false;
  Notify();
  if (thread_.joinable()) thread_.join();
}

void Dispatcher::Notify() {
  {
    std::lock_guard lock(wait_mutex_);
    wake_pending_ = true;
  }
  wake_.notify_all();
}

void Dispatcher::Sleep() {
  std::unique_lock lock(wait_mutex_);
  wake_.wait_for(lock, poll_interval_, [&] { return wake_pending_ || !running_; });
  wake_pending_ = false;
}

void Dispatcher::Loop() {
  while (running_) {
    bool dispatched = false;
    try {
      dispatched = RunOnce();
    } catch (const std::exception& e) {
      PAGEQUEUE_LOG_ERROR("dispatch iteration failed", {StringField("error", e.what())});
    }

    if (!dispatched) {
      Sleep();
    }
  }
}

bool Dispatcher::RunOnce() {
  auto job = queue_->PopNext();
  if (!job) {
    return false;
  }

  // statuses are not persisted; a job restored from the ledger has none
  if (!status_->Exists(job->job_id)) {
    status_->Create(job->job_id, status::kQueued);
  }

  Execute(job->job_id, job->source_path, job->chunk_size);
  return true;
}

void Dispatcher::Execute(const std::string& job_id, const std::string& source_path, size_t chunk_size) {
  auto on_progress = [&](const std::string& stage, std::optional<int> progress, const std::string& message) {
    status::StatusUpdate update;
    update.status   = stage;
    update.progress = progress;
    update.message  = message;
    status_->Update(job_id, update);
  };

  auto result = pipeline_->Run(job_id, source_path, chunk_size, on_progress);

  try {
    artifacts_->CleanupWorkingFiles(job_id);
  } catch (const std::exception& e) {
    PAGEQUEUE_LOG_ERROR("working file cleanup failed", {StringField("job_id", job_id), StringField("error", e.what())});
  }

  try {
    if (result.ok) {
      Finish(job_id, result.result_path);
      return;
    }
  } catch (const std::exception& e) {
    result.ok    = false;
    result.error = std::string("could not record completion: ") + e.what();
  }

  Fail(job_id, result.error);
}

void Dispatcher::Finish(const std::string& job_id, const std::string& result_path) {
  queue_->MarkFinished(job_id);

  status::StatusUpdate update;
  update.status      = status::kFinished;
  update.progress    = 100;
  update.message     = "Ready for download";
  update.result_path = result_path;
  status_->Update(job_id, update);
}

// Must leave the job out of processing, or PopNext stalls for good.
void Dispatcher::Fail(const std::string& job_id, const std::string& error) {
  try {
    auto record = queue_->Get(job_id);
    if (record && record->state == model::LifecycleState::kProcessing) {
      queue_->MarkError(job_id, error);
    }
  } catch (const std::exception& e) {
    PAGEQUEUE_LOG_ERROR("could not record job failure", {StringField("job_id", job_id), StringField("error", e.what())});
  }

  status::StatusUpdate update;
  update.message = "Processing failed";
  update.error   = error;
  status_->Update(job_id, update);
}

} // namespace pagequeue::runtime
