#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace pagequeue::model {

/*
  Authoritative lifecycle record of one job, owned by the queue.

  INVARIANTS:
  - started_at is set iff state != queued
  - finished_at is set iff state is finished, downloaded or error
  - download_window_expires is set iff state == finished
  - last_error is set only in error state
  - each timestamp is stamped once, in order
*/

struct JobRecord {
  std::string job_id;
  std::string owner_id;

  std::string source_path;
  uint64_t    declared_size = 0;
  uint32_t    chunk_size    = 0;

  LifecycleState state = LifecycleState::kQueued;

  util::TimePoint                queued_at{};
  std::optional<util::TimePoint> started_at;
  std::optional<util::TimePoint> finished_at;
  std::optional<util::TimePoint> downloaded_at;
  std::optional<util::TimePoint> download_window_expires;

  std::optional<std::string> last_error;

  // FIFO tie-breaker when queued_at values are equal.
  uint64_t admission_seq = 0;
};

} // namespace pagequeue::model
