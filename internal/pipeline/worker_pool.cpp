#include "worker_pool.hpp"

#include "internal/util/errors.hpp"

namespace pagequeue::pipeline {

WorkerPool::WorkerPool(size_t width) {
  if (width == 0) width = 1;
  threads_.reserve(width);
  for (size_t i = 0; i < width; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

std::future<void> WorkerPool::Submit(std::function<void()> task) {
  std::packaged_task<void()> packaged(std::move(task));
  auto                       future = packaged.get_future();
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("worker pool is shut down");
    }
    tasks_.push(std::move(packaged));
  }
  cv_.notify_one();
  return future;
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void WorkerPool::Run() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !tasks_.empty(); });

      if (shutdown_ && tasks_.empty()) return;

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    // exceptions land in the task's future
    task();
  }
}

} // namespace pagequeue::pipeline
