#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/admission/admission_policy.hpp"
#include "internal/db/json/json_ledger_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/chunked_pipeline.hpp"
#include "internal/pipeline/paged_text_codec.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/render/stamp_renderer.hpp"
#include "internal/resources/resource_probe.hpp"
#include "internal/runtime/dispatcher.hpp"
#include "internal/runtime/sweeper.hpp"
#include "internal/service/job_service.hpp"
#include "internal/status/status_tracker.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/validation/document_validator.hpp"

namespace pagequeue::factory {

using namespace pagequeue;
using pagequeue::runtime::config::RuntimeConfig;

namespace {

admission::AdmissionLimits ToLimits(const pagequeue::runtime::config::AdmissionConfig& config) {
  admission::AdmissionLimits limits;
  limits.disk_safety_buffer = config.disk_safety_buffer_bytes();
  limits.min_free_ram       = config.min_free_ram_bytes();
  limits.ram_multiplier     = config.ram_multiplier();
  limits.disk_multiplier    = config.disk_multiplier();
  limits.ram_buffer         = config.ram_buffer_bytes();
  limits.disk_buffer        = config.disk_buffer_bytes();
  return limits;
}

queue::JobQueueOptions ToQueueOptions(const RuntimeConfig& config) {
  queue::JobQueueOptions options;
  options.download_window            = std::chrono::seconds(config.scheduler().download_window_seconds());
  options.error_retention            = std::chrono::seconds(config.scheduler().error_retention_seconds());
  options.history_window             = config.admission().history_window();
  options.default_processing_seconds = config.admission().default_processing_seconds();
  return options;
}

std::shared_ptr<resources::ResourceProbe> BuildProbe(const RuntimeConfig& config) {
  resources::SystemResourceProbe::Options options;
  options.disk_path             = config.storage().temp_dir();
  options.cgroup_root           = config.admission().cgroup_root();
  options.proc_root             = config.admission().proc_root();
  options.memory_limit_override = config.admission().memory_limit_override_bytes();
  return std::make_shared<resources::SystemResourceProbe>(std::move(options));
}

} // namespace

void Application::Start() {
  dispatcher->Start();
  sweeper->Start();
}

void Application::Stop() {
  if (dispatcher) dispatcher->Stop();
  if (sweeper) sweeper->Stop();
  if (pool) pool->Shutdown();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, Overrides overrides) {
  Application app;
  auto        now = overrides.now ? overrides.now : util::NowFn(util::Now);

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.artifacts = std::make_shared<storage::ArtifactStore>(config.storage().temp_dir());
  app.artifacts->EnsureLayout();

  app.ledger = overrides.ledger ? overrides.ledger
                                : std::make_shared<db::json::JsonLedgerStore>(config.storage().ledger_path());
  app.probe  = overrides.probe ? overrides.probe : BuildProbe(config);

  // ------------------------------------------------------------------
  // Queue and status
  // ------------------------------------------------------------------
  auto policy = std::make_shared<admission::AdmissionPolicy>(ToLimits(config.admission()));

  app.queue  = std::make_shared<queue::JobQueue>(app.ledger, app.probe, policy, app.artifacts, ToQueueOptions(config), now);
  app.status = std::make_shared<status::StatusTracker>(now);
  app.queue->Load();

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  auto codec = std::make_shared<pipeline::PagedTextCodec>();

  render::StampStyle style;
  style.text     = config.pipeline().stamp_text();
  style.opacity  = config.pipeline().stamp_opacity();
  style.rotation = config.pipeline().stamp_rotation();
  auto renderer  = std::make_shared<render::StampRenderer>(codec, style);

  app.pool     = std::make_shared<pipeline::WorkerPool>(config.pipeline().max_parallel_workers());
  app.pipeline = std::make_shared<pipeline::ChunkedPipeline>(codec, renderer, app.artifacts, app.pool);

  // ------------------------------------------------------------------
  // Service facade
  // ------------------------------------------------------------------
  validation::ValidatorLimits limits;
  limits.ram_safety_margin = config.admission().ram_safety_margin();
  limits.max_file_size     = config.admission().max_file_size_bytes();

  service::ServiceContext ctx;
  ctx.queue              = app.queue;
  ctx.status             = app.status;
  ctx.validator          = std::make_shared<validation::DocumentValidator>(codec, app.probe, limits);
  ctx.artifacts          = app.artifacts;
  ctx.probe              = app.probe;
  ctx.default_chunk_size = config.pipeline().default_chunk_size();

  app.service = std::make_shared<service::JobService>(ctx);
  app.service->RestoreStatuses();

  // ------------------------------------------------------------------
  // Background loops
  // ------------------------------------------------------------------
  app.dispatcher = std::make_shared<runtime::Dispatcher>(app.queue, app.status, app.pipeline, app.artifacts,
                                                         std::chrono::milliseconds(config.scheduler().poll_interval_ms()));
  app.sweeper    = std::make_shared<runtime::Sweeper>(app.queue, app.status,
                                                      std::chrono::seconds(config.scheduler().sweep_interval_seconds()),
                                                      std::chrono::seconds(config.scheduler().status_retention_seconds()));

  PAGEQUEUE_LOG_INFO("application built", {observability::StringField("temp_dir", config.storage().temp_dir()),
                                           observability::IntField("workers", config.pipeline().max_parallel_workers())});
  return app;
}

} // namespace pagequeue::factory
