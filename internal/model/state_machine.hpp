#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace pagequeue::model {

/*
  Job lifecycle as owned by the queue ledger.

      queued -> processing -> finished -> downloaded
                           \-> error

  Transitions only move forward. finished/downloaded keep the job around
  for a grace period; error is terminal.
*/
enum class LifecycleState : std::uint8_t {
  kQueued     = 0,
  kProcessing = 1,
  kFinished   = 2,
  kDownloaded = 3,
  kError      = 4,
};

constexpr bool IsTerminal(LifecycleState state) {
  return state == LifecycleState::kDownloaded || state == LifecycleState::kError;
}

// A job counts towards active resource usage while its pipeline runs.
constexpr bool IsActive(LifecycleState state) {
  return state == LifecycleState::kProcessing;
}

constexpr bool CanTransition(LifecycleState from, LifecycleState to) {
  switch (from) {
    case LifecycleState::kQueued:
      return to == LifecycleState::kProcessing;
    case LifecycleState::kProcessing:
      return to == LifecycleState::kFinished || to == LifecycleState::kError;
    case LifecycleState::kFinished:
      return to == LifecycleState::kDownloaded;
    case LifecycleState::kDownloaded:
    case LifecycleState::kError:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(LifecycleState state) {
  switch (state) {
    case LifecycleState::kQueued:
      return "queued";
    case LifecycleState::kProcessing:
      return "processing";
    case LifecycleState::kFinished:
      return "finished";
    case LifecycleState::kDownloaded:
      return "downloaded";
    case LifecycleState::kError:
      return "error";
  }
  return "unknown";
}

std::optional<LifecycleState> ParseLifecycleState(std::string_view name);

} // namespace pagequeue::model
