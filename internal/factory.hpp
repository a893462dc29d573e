#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace pagequeue::resources {
class ResourceProbe;
}
namespace pagequeue::storage {
class ArtifactStore;
}
namespace pagequeue::db {
class LedgerStore;
}
namespace pagequeue::queue {
class JobQueue;
}
namespace pagequeue::status {
class StatusTracker;
}
namespace pagequeue::pipeline {
class WorkerPool;
class ChunkedPipeline;
}
namespace pagequeue::service {
class JobService;
}
namespace pagequeue::runtime {
class Dispatcher;
class Sweeper;
}

namespace pagequeue::factory {

/*
  Application

  Owns every long-lived service object. Nothing here is a process-wide
  singleton; the transport (or cmd/pagequeue) holds the Application for
  as long as it serves.
*/
struct Application {
  std::shared_ptr<resources::ResourceProbe>   probe;
  std::shared_ptr<storage::ArtifactStore>     artifacts;
  std::shared_ptr<db::LedgerStore>            ledger;
  std::shared_ptr<queue::JobQueue>            queue;
  std::shared_ptr<status::StatusTracker>      status;
  std::shared_ptr<pipeline::WorkerPool>       pool;
  std::shared_ptr<pipeline::ChunkedPipeline>  pipeline;
  std::shared_ptr<service::JobService>        service;
  std::shared_ptr<runtime::Dispatcher>        dispatcher;
  std::shared_ptr<runtime::Sweeper>           sweeper;

  // Starts the scheduler and sweeper threads.
  void Start();

  // Stops both threads, then drains the worker pool.
  void Stop();
};

// Seams for tests; unset members fall back to the real implementations.
struct Overrides {
  std::shared_ptr<resources::ResourceProbe> probe;
  std::shared_ptr<db::LedgerStore>          ledger;
  util::NowFn                               now;
};

/*
  Build

  Composition root. Creates the storage layout, restores the ledger and
  the status records derived from it. Background threads are not started.
*/
Application Build(const pagequeue::runtime::config::RuntimeConfig& config, Overrides overrides = {});

} // namespace pagequeue::factory
