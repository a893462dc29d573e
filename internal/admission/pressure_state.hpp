#pragma once

#include <cstdint>

namespace pagequeue::admission {

/*
  Snapshot of capacity taken at dispatch time.

  committed_* is the summed estimate of every job already running.
*/
struct PressureState {
  uint64_t available_ram  = 0;
  uint64_t available_disk = 0;

  uint64_t committed_ram  = 0;
  uint64_t committed_disk = 0;
};

} // namespace pagequeue::admission
