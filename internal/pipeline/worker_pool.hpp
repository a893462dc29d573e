#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pagequeue::pipeline {

/*
  Fixed-width thread pool with a blocking task queue.

  Completion order is undefined. Shutdown() runs every task already
  submitted, then joins; Submit() after Shutdown() throws.
*/
class WorkerPool {
 public:
  explicit WorkerPool(size_t width);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::future<void> Submit(std::function<void()> task);

  void Shutdown();

  size_t width() const {
    return threads_.size();
  }

 private:
  void Run();

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::queue<std::packaged_task<void()>> tasks_;
  bool                                   shutdown_ = false;

  std::vector<std::thread> threads_;
};

} // namespace pagequeue::pipeline
