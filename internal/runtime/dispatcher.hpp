#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pagequeue::queue {
class JobQueue;
}
namespace pagequeue::status {
class StatusTracker;
}
namespace pagequeue::pipeline {
class ChunkedPipeline;
}
namespace pagequeue::storage {
class ArtifactStore;
}

namespace pagequeue::runtime {

/*
  The single scheduler loop.

  Pops the oldest admissible job, runs its pipeline to completion and
  records the outcome on the queue and the status tracker. Sleeps
  poll_interval whenever nothing could be started; Notify() and Stop()
  cut the sleep short. One job's failure never stops the loop.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<status::StatusTracker> status,
             std::shared_ptr<pipeline::ChunkedPipeline> pipeline, std::shared_ptr<storage::ArtifactStore> artifacts,
             std::chrono::milliseconds poll_interval);
  ~Dispatcher();

  // Runs at most one job. Returns true when a job was dispatched.
  bool RunOnce();

  void Start();
  void Stop();
  void Notify();

 private:
  void Loop();
  void Execute(const std::string& job_id, const std::string& source_path, size_t chunk_size);
  void Finish(const std::string& job_id, const std::string& result_path);
  void Fail(const std::string& job_id, const std::string& error);
  void Sleep();

  std::shared_ptr<queue::JobQueue>            queue_;
  std::shared_ptr<status::StatusTracker>      status_;
  std::shared_ptr<pipeline::ChunkedPipeline>  pipeline_;
  std::shared_ptr<storage::ArtifactStore>     artifacts_;
  std::chrono::milliseconds                   poll_interval_;

  std::mutex              wait_mutex_;
  std::condition_variable wake_;
  bool                    wake_pending_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace pagequeue::runtime
