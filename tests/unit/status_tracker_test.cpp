#include "internal/status/status_tracker.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "tests/support/fakes.hpp"

namespace {

using pagequeue::status::StatusTracker;
using pagequeue::status::StatusUpdate;
using pagequeue::testing::ManualClock;

StatusUpdate WithStatus(const std::string& status) {
  StatusUpdate update;
  update.status = status;
  return update;
}

void TestStagesCarryFixedProgress() {
  StatusTracker tracker;
  auto          created = tracker.Create("job-1");
  assert(created.status == "uploading");
  assert(created.progress == 10);

  tracker.Update("job-1", WithStatus("splitting"));
  assert(tracker.Get("job-1")->progress == 30);

  tracker.Update("job-1", WithStatus("transforming"));
  assert(tracker.Get("job-1")->progress == 50);

  tracker.Update("job-1", WithStatus("finished"));
  assert(tracker.Get("job-1")->progress == 100);
}

void TestMergingProgressIsCallerDriven() {
  StatusTracker tracker;
  tracker.Create("job-1");
  tracker.Update("job-1", WithStatus("transforming"));

  auto merging = WithStatus("merging");
  tracker.Update("job-1", merging);
  assert(tracker.Get("job-1")->progress == 50);

  merging.progress = 87;
  tracker.Update("job-1", merging);
  assert(tracker.Get("job-1")->status == "merging");
  assert(tracker.Get("job-1")->progress == 87);
}

void TestExplicitProgressIsClampedAndMonotonic() {
  StatusTracker tracker;
  tracker.Create("job-1");

  StatusUpdate update;
  update.progress = 250;
  tracker.Update("job-1", update);
  assert(tracker.Get("job-1")->progress == 100);

  update.progress = 40;
  tracker.Update("job-1", update);
  assert(tracker.Get("job-1")->progress == 100);

  tracker.Create("job-2");
  update.progress = -5;
  tracker.Update("job-2", update);
  assert(tracker.Get("job-2")->progress == 10);
}

void TestErrorForcesStatusAndResetsProgress() {
  StatusTracker tracker;
  tracker.Create("job-1");
  tracker.Update("job-1", WithStatus("transforming"));

  StatusUpdate failure;
  failure.error    = "renderer crashed";
  failure.status   = "merging";
  failure.progress = 90;
  tracker.Update("job-1", failure);

  auto record = tracker.Get("job-1");
  assert(record->status == "error");
  assert(record->progress == 0);
  assert(record->error == std::string("renderer crashed"));
}

void TestUnknownJobUpdateIsRejected() {
  StatusTracker tracker;
  assert(!tracker.Update("missing", WithStatus("splitting")));
  assert(!tracker.Get("missing"));
  assert(!tracker.Delete("missing"));
}

void TestCountActiveIgnoresTerminalNames() {
  StatusTracker tracker;
  tracker.Create("a");
  tracker.Create("b", "queued");
  tracker.Create("c", "merging");
  tracker.Create("d", "finished");
  tracker.Create("e", "expired");

  StatusUpdate failure;
  failure.error = "boom";
  tracker.Create("f", "splitting");
  tracker.Update("f", failure);

  assert(tracker.CountActive() == 3);
  assert(tracker.List().size() == 6);
}

void TestPruneOlderThanUsesLastUpdate() {
  ManualClock   clock;
  StatusTracker tracker(clock.Fn());

  tracker.Create("old", "finished");
  tracker.Create("refreshed", "finished");
  clock.Advance(std::chrono::minutes(50));
  tracker.Update("refreshed", WithStatus("expired"));
  clock.Advance(std::chrono::minutes(20));

  assert(tracker.PruneOlderThan(std::chrono::hours(1)) == 1);
  assert(!tracker.Exists("old"));
  assert(tracker.Exists("refreshed"));

  auto refreshed = tracker.Get("refreshed");
  assert(refreshed->updated_at > refreshed->created_at);
}

void TestPruneKeepsActiveRecords() {
  ManualClock   clock;
  StatusTracker tracker(clock.Fn());

  tracker.Create("waiting", "queued");
  tracker.Create("rendering", "transforming");
  tracker.Create("failed", "error");
  clock.Advance(std::chrono::hours(3));

  assert(tracker.PruneOlderThan(std::chrono::hours(1)) == 1);
  assert(tracker.Exists("waiting"));
  assert(tracker.Exists("rendering"));
  assert(!tracker.Exists("failed"));

  // a long-queued job can still report progress once it starts
  assert(tracker.Update("waiting", WithStatus("splitting")));
  assert(tracker.Get("waiting")->progress == 30);
}

} // namespace

int main() {
  TestStagesCarryFixedProgress();
  TestMergingProgressIsCallerDriven();
  TestExplicitProgressIsClampedAndMonotonic();
  TestErrorForcesStatusAndResetsProgress();
  TestUnknownJobUpdateIsRejected();
  TestCountActiveIgnoresTerminalNames();
  TestPruneOlderThanUsesLastUpdate();
  TestPruneKeepsActiveRecords();

  std::cout << "pagequeue_unit_status_tracker: pass\n";
  return 0;
}
