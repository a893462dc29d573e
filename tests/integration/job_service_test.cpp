#include <cassert>
#include <functional>
#include <iostream>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_ledger_store.hpp"
#include "internal/factory.hpp"
#include "internal/pipeline/paged_text_codec.hpp"
#include "internal/queue/job_queue.hpp"
#include "internal/runtime/dispatcher.hpp"
#include "internal/runtime/sweeper.hpp"
#include "internal/service/job_service.hpp"
#include "internal/status/status_tracker.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

namespace fs = std::filesystem;

using pagequeue::db::memory::MemoryLedgerStore;
using pagequeue::model::LifecycleState;
using pagequeue::service::DownloadCode;
using pagequeue::service::SubmitCode;
using pagequeue::testing::FakeResourceProbe;
using pagequeue::testing::kGiB;
using pagequeue::testing::kMiB;
using pagequeue::testing::ManualClock;
using pagequeue::testing::TempDir;
using pagequeue::testing::WriteFile;
using pagequeue::testing::WritePagedDocument;

namespace status = pagequeue::status;

/*
  Whole application built through the factory, driven synchronously:
  the dispatcher and sweeper threads are never started, tests call
  RunOnce / SweepOnce instead.
*/
struct Harness {
  explicit Harness(const std::string& name) : dir(name) {
    probe  = std::make_shared<FakeResourceProbe>(100 * kGiB, 8 * kGiB);
    ledger = std::make_shared<MemoryLedgerStore>();
    Rebuild();
  }

  ~Harness() {
    app.Stop();
  }

  pagequeue::runtime::config::RuntimeConfig Config() const {
    pagequeue::runtime::config::RuntimeConfig config;
    config.mutable_storage()->set_temp_dir((dir.path() / "work").string());
    config.mutable_pipeline()->set_default_chunk_size(3);
    config.mutable_pipeline()->set_max_parallel_workers(2);
    pagequeue::config::ApplyDefaults(config);
    pagequeue::config::ValidateConfig(config);
    return config;
  }

  // Simulates a process restart over the same ledger and files.
  void Rebuild() {
    app.Stop();
    app = pagequeue::factory::Application{};

    pagequeue::factory::Overrides overrides;
    overrides.probe  = probe;
    overrides.ledger = ledger;
    overrides.now    = [this] {
      if (before_clock_read) {
        auto hook = std::move(before_clock_read);
        before_clock_read = nullptr;
        hook();
      }
      return clock.Now();
    };
    app              = pagequeue::factory::Build(Config(), overrides);
  }

  fs::path Stage(const std::string& name, size_t pages, const std::string& attributes = {}) {
    auto path = dir.path() / "staging" / name;
    WritePagedDocument(path, pages, attributes);
    return path;
  }

  std::string SubmitAccepted(size_t pages) {
    auto result = app.service->Submit("alice", Stage("doc_" + std::to_string(counter++) + ".pdoc", pages), 0);
    assert(result.code == SubmitCode::kAccepted);
    return result.job_id;
  }

  TempDir                            dir;
  ManualClock                        clock;
  std::shared_ptr<FakeResourceProbe> probe;
  std::shared_ptr<MemoryLedgerStore> ledger;
  pagequeue::factory::Application    app;
  int                                counter = 0;

  // Runs once, on the next clock read by any component. Only set from
  // tests that never start the background threads.
  std::function<void()> before_clock_read;
};

bool IsNotFound(Harness& h, const std::string& job_id) {
  try {
    h.app.service->GetStatus(job_id);
  } catch (const pagequeue::util::NotFound&) {
    return true;
  }
  return false;
}

void TestSubmitProcessDownloadRelease() {
  Harness h("service_happy");

  auto staged    = h.Stage("report.pdoc", 7);
  auto submitted = h.app.service->Submit("alice", staged, 0);
  assert(submitted.code == SubmitCode::kAccepted);
  assert(submitted.queue_position == 1);
  assert(submitted.estimated_wait_seconds == 120);
  assert(submitted.metadata.page_count == 7);
  assert(!fs::exists(staged));

  const auto id   = submitted.job_id;
  auto       view = h.app.service->GetStatus(id);
  assert(view.status && view.status->status == status::kQueued);
  assert(view.lifecycle == LifecycleState::kQueued);
  assert(view.queue_position == 1);

  assert(h.app.dispatcher->RunOnce());
  assert(!h.app.dispatcher->RunOnce());

  view = h.app.service->GetStatus(id);
  assert(view.lifecycle == LifecycleState::kFinished);
  assert(view.status->status == status::kFinished);
  assert(view.status->progress == 100);
  assert(view.status->result_path == h.app.artifacts->OutputPath(id).string());
  assert(!fs::exists(h.app.artifacts->WorkDir(id)));

  auto output = pagequeue::pipeline::PagedTextCodec::Parse(pagequeue::testing::ReadFile(h.app.artifacts->OutputPath(id)));
  assert(output.pages.size() == 7);
  assert(output.pages[0].find("page 0") == 0);
  assert(output.pages[0].find("[stamp text=WATERMARK color=red") != std::string::npos);
  assert(output.pages[3].find("color=blue") != std::string::npos);
  assert(output.pages[6].find("color=green") != std::string::npos);

  auto download = h.app.service->Download(id);
  assert(download.code == DownloadCode::kReady);
  assert(download.path == h.app.artifacts->OutputPath(id));
  assert(h.app.queue->Get(id)->state == LifecycleState::kDownloaded);

  // repeat downloads stay available until reclaimed
  assert(h.app.service->Download(id).code == DownloadCode::kReady);

  assert(h.app.service->Release(id));
  assert(IsNotFound(h, id));
  assert(!fs::exists(h.app.artifacts->UploadPath(id)));
  assert(!fs::exists(h.app.artifacts->OutputPath(id)));
  assert(h.app.service->Download(id).code == DownloadCode::kNotFound);
}

void TestInvalidUploadsNeverReachTheQueue() {
  Harness h("service_invalid");

  auto encrypted = h.Stage("locked.pdoc", 3, "encrypted=true");
  auto result    = h.app.service->Submit("alice", encrypted, 0);
  assert(result.code == SubmitCode::kInvalid);
  assert(result.message.find("Encrypted") != std::string::npos);
  assert(fs::exists(encrypted));

  auto empty = h.dir.path() / "staging" / "empty.pdoc";
  WriteFile(empty, "");
  assert(h.app.service->Submit("alice", empty, 0).code == SubmitCode::kInvalid);

  auto text = h.Stage("notes.txt", 2);
  assert(h.app.service->Submit("alice", text, 0).code == SubmitCode::kInvalid);

  assert(h.app.queue->List().empty());
  assert(h.app.status->List().empty());
}

void TestAdmissionRejectionsCarryRetryHint() {
  Harness h("service_rejected");

  h.probe->SetFreeDisk(100 * kMiB);
  auto staged = h.Stage("report.pdoc", 2);
  auto disk   = h.app.service->Submit("alice", staged, 0);
  assert(disk.code == SubmitCode::kRejected);
  assert(disk.reason == pagequeue::admission::AdmissionReason::kDiskSpace);
  assert(disk.retry_after_seconds == 120);
  assert(fs::exists(staged));

  h.probe->SetFreeDisk(100 * kGiB);
  h.probe->SetAvailableMemory(50 * kMiB);
  auto memory = h.app.service->Submit("alice", staged, 0);
  assert(memory.code == SubmitCode::kRejected);
  assert(memory.reason == pagequeue::admission::AdmissionReason::kMemory);

  h.probe->SetAvailableMemory(8 * kGiB);
  assert(h.app.service->Submit("alice", staged, 0).code == SubmitCode::kAccepted);
  assert(h.app.queue->List().size() == 1);
}

void TestQueuePositionsFollowSubmissionOrder() {
  Harness h("service_order");

  auto first  = h.SubmitAccepted(2);
  auto second = h.SubmitAccepted(2);
  auto third  = h.SubmitAccepted(2);

  assert(h.app.service->GetStatus(first).queue_position == 1);
  assert(h.app.service->GetStatus(second).queue_position == 2);
  assert(h.app.service->GetStatus(third).queue_position == 3);
  assert(h.app.service->GetStatus(third).estimated_wait_seconds == 360);

  assert(h.app.dispatcher->RunOnce());
  assert(h.app.queue->Get(first)->state == LifecycleState::kFinished);
  assert(h.app.service->GetStatus(second).queue_position == 1);
  assert(h.app.service->GetStatus(third).queue_position == 2);

  auto health = h.app.service->Health();
  assert(health.queued == 2);
  assert(health.processing == 0);
  assert(health.finished == 1);
  assert(health.active_statuses == 2);
  assert(health.free_disk_bytes == 100 * kGiB);
}

void TestUnclaimedResultExpires() {
  Harness h("service_expiry");

  auto id = h.SubmitAccepted(4);
  assert(h.app.dispatcher->RunOnce());

  h.clock.Advance(std::chrono::seconds(59));
  assert(h.app.sweeper->SweepOnce() == 0);

  h.clock.Advance(std::chrono::seconds(2));
  assert(h.app.sweeper->SweepOnce() == 1);

  auto view = h.app.service->GetStatus(id);
  assert(!view.lifecycle);
  assert(view.expired);
  assert(view.status->message.find("resubmit") != std::string::npos);
  assert(!fs::exists(h.app.artifacts->OutputPath(id)));
  assert(!fs::exists(h.app.artifacts->UploadPath(id)));

  assert(h.app.service->Download(id).code == DownloadCode::kExpired);
}

void TestDownloadAfterWindowBeforeSweep() {
  Harness h("service_late_download");

  auto id = h.SubmitAccepted(2);
  assert(h.app.dispatcher->RunOnce());

  h.clock.Advance(std::chrono::seconds(60));
  assert(h.app.service->Download(id).code == DownloadCode::kExpired);
  assert(h.app.queue->Get(id)->state == LifecycleState::kFinished);
}

void TestDownloadRacingTheSweeperReportsExpiry() {
  Harness h("service_download_race");

  auto id = h.SubmitAccepted(2);
  assert(h.app.dispatcher->RunOnce());
  h.clock.Advance(std::chrono::seconds(61));

  // the sweeper reclaims the job after Download has read it as finished
  size_t swept        = 0;
  h.before_clock_read = [&] { swept = h.app.sweeper->SweepOnce(); };
  auto download       = h.app.service->Download(id);

  assert(swept == 1);
  assert(download.code == DownloadCode::kExpired);
  assert(download.message.find("resubmit") != std::string::npos);
  assert(!h.app.queue->Get(id));
}

void TestPipelineFailureIsReportedAndCleanedUp() {
  Harness h("service_failure");

  auto id = h.SubmitAccepted(3);
  WriteFile(h.app.artifacts->UploadPath(id), "garbage");

  auto next = h.SubmitAccepted(2);

  assert(h.app.dispatcher->RunOnce());
  auto view = h.app.service->GetStatus(id);
  assert(view.lifecycle == LifecycleState::kError);
  assert(view.status->status == status::kError);
  assert(view.status->progress == 0);
  assert(view.status->error && !view.status->error->empty());
  assert(!fs::exists(h.app.artifacts->WorkDir(id)));

  auto download = h.app.service->Download(id);
  assert(download.code == DownloadCode::kNotReady);
  assert(download.message.find("Job failed") == 0);

  // one failure does not stall the queue
  assert(h.app.dispatcher->RunOnce());
  assert(h.app.queue->Get(next)->state == LifecycleState::kFinished);

  bool threw = false;
  try {
    h.app.service->Release(id);
  } catch (const pagequeue::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(h.app.service->Cleanup(id));
  assert(IsNotFound(h, id));
  assert(!fs::exists(h.app.artifacts->UploadPath(id)));
  assert(!h.app.service->Cleanup(id));
  assert(!h.app.service->Cleanup("../outputs"));
}

void TestErrorJobsAreReclaimedAfterRetention() {
  Harness h("service_error_retention");

  auto id = h.SubmitAccepted(2);
  WriteFile(h.app.artifacts->UploadPath(id), "garbage");
  assert(h.app.dispatcher->RunOnce());

  h.clock.Advance(std::chrono::seconds(1800));
  assert(h.app.sweeper->SweepOnce() == 0);

  h.clock.Advance(std::chrono::seconds(1800));
  assert(h.app.sweeper->SweepOnce() == 1);
  assert(!h.app.queue->Get(id));
  assert(!h.app.status->Exists(id));
}

void TestRestartRestoresLedgerAndStatuses() {
  Harness h("service_restart");

  auto finished    = h.SubmitAccepted(2);
  auto interrupted = h.SubmitAccepted(2);
  auto waiting     = h.SubmitAccepted(2);

  assert(h.app.dispatcher->RunOnce());
  auto popped = h.app.queue->PopNext();
  assert(popped && popped->job_id == interrupted);

  h.Rebuild();

  assert(h.app.queue->Get(finished)->state == LifecycleState::kFinished);
  assert(h.app.service->GetStatus(finished).status->status == status::kFinished);
  assert(h.app.service->Download(finished).code == DownloadCode::kReady);

  auto broken = h.app.service->GetStatus(interrupted);
  assert(broken.lifecycle == LifecycleState::kError);
  assert(broken.status->status == status::kError);
  assert(broken.status->error->find("restart") != std::string::npos);

  auto queued = h.app.service->GetStatus(waiting);
  assert(queued.lifecycle == LifecycleState::kQueued);
  assert(queued.queue_position == 1);

  assert(h.app.dispatcher->RunOnce());
  assert(h.app.queue->Get(waiting)->state == LifecycleState::kFinished);

  // admission sequence continues past the restored records
  auto fresh = h.SubmitAccepted(2);
  assert(h.app.queue->Get(fresh)->admission_seq > h.app.queue->Get(waiting)->admission_seq);
}

void TestBackgroundLoopsProcessSubmissions() {
  Harness h("service_threads");
  h.app.Start();

  auto id = h.SubmitAccepted(5);
  h.app.dispatcher->Notify();

  for (int i = 0; i < 500; ++i) {
    if (h.app.queue->Get(id)->state == LifecycleState::kFinished) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(h.app.queue->Get(id)->state == LifecycleState::kFinished);

  h.app.Stop();
}

} // namespace

int main() {
  TestSubmitProcessDownloadRelease();
  TestInvalidUploadsNeverReachTheQueue();
  TestAdmissionRejectionsCarryRetryHint();
  TestQueuePositionsFollowSubmissionOrder();
  TestUnclaimedResultExpires();
  TestDownloadAfterWindowBeforeSweep();
  TestDownloadRacingTheSweeperReportsExpiry();
  TestPipelineFailureIsReportedAndCleanedUp();
  TestErrorJobsAreReclaimedAfterRetention();
  TestRestartRestoresLedgerAndStatuses();
  TestBackgroundLoopsProcessSubmissions();

  std::cout << "pagequeue_integration_job_service: pass\n";
  return 0;
}
