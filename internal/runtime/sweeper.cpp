#include "sweeper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/status/status_tracker.hpp"

namespace pagequeue::runtime {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kExpiredMessage = "Download window expired, please resubmit";

} // namespace

Sweeper::Sweeper(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<status::StatusTracker> status,
                 std::chrono::seconds interval, std::chrono::seconds status_retention)
    : queue_(std::move(queue)), status_(std::move(status)), interval_(interval), status_retention_(status_retention) {
}

Sweeper::~Sweeper() {
  Stop();
}

void Sweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&Sweeper::Loop, this);
}

void Sweeper::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) thread_.join();
}

size_t Sweeper::SweepOnce() {
  const auto swept = queue_->SweepExpired();

  for (const auto& job : swept) {
    switch (job.reason) {
      case queue::SweepReason::kWindowExpired: {
        if (!status_->Exists(job.job_id)) {
          status_->Create(job.job_id, status::kExpired, kExpiredMessage);
          break;
        }
        status::StatusUpdate update;
        update.status  = status::kExpired;
        update.message = kExpiredMessage;
        status_->Update(job.job_id, update);
        break;
      }
      case queue::SweepReason::kDownloaded:
      case queue::SweepReason::kErrorRetention:
        status_->Delete(job.job_id);
        break;
    }
  }

  const auto pruned = status_->PruneOlderThan(status_retention_);
  if (!swept.empty() || pruned > 0) {
    PAGEQUEUE_LOG_INFO("sweep complete", {IntField("jobs", static_cast<int64_t>(swept.size())),
                                          IntField("statuses_pruned", static_cast<int64_t>(pruned))});
  }
  return swept.size();
}

void Sweeper::Loop() {
  while (running_) {
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      PAGEQUEUE_LOG_ERROR("sweep failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wake_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

} // namespace pagequeue::runtime
