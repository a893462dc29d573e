#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace pagequeue::queue {
class JobQueue;
}
namespace pagequeue::status {
class StatusTracker;
}

namespace pagequeue::runtime {

/*
  Periodic reclamation.

  Each pass sweeps the queue, then reconciles the status tracker:
  expired downloads keep an "expired" status so clients learn to
  resubmit; downloaded and long-failed jobs lose theirs. Stale status
  records are pruned last.
*/
class Sweeper {
 public:
  Sweeper(std::shared_ptr<queue::JobQueue> queue, std::shared_ptr<status::StatusTracker> status,
          std::chrono::seconds interval, std::chrono::seconds status_retention);
  ~Sweeper();

  // Returns the number of jobs reclaimed.
  size_t SweepOnce();

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<queue::JobQueue>       queue_;
  std::shared_ptr<status::StatusTracker> status_;
  std::chrono::seconds                   interval_;
  std::chrono::seconds                   status_retention_;

  std::mutex              wait_mutex_;
  std::condition_variable wake_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace pagequeue::runtime
