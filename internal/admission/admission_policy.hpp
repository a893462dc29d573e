#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "pressure_state.hpp"

namespace pagequeue::admission {

enum class AdmissionReason { kNone, kDiskSpace, kMemory };

// Machine-readable reason code: "", "disk_space", "memory".
std::string_view ToString(AdmissionReason reason);

struct AdmissionDecision {
  bool            ok     = true;
  AdmissionReason reason = AdmissionReason::kNone;

  // Seconds a rejected caller should wait before retrying.
  uint64_t    retry_after_seconds = 0;
  std::string message;
};

struct ResourceEstimate {
  uint64_t ram  = 0;
  uint64_t disk = 0;
};

struct AdmissionLimits {
  uint64_t disk_safety_buffer = 0;
  uint64_t min_free_ram       = 0;

  double ram_multiplier  = 2.5;
  double disk_multiplier = 3.0;

  uint64_t ram_buffer  = 0;
  uint64_t disk_buffer = 0;
};

/*
  Resource math for admission and dispatch.

  Upload admission (CheckAdmission):
      free_disk     > 2 * size + disk_safety_buffer
      available_ram > min_free_ram

  Dispatch (Fits), with need = Estimate(size):
      available_ram  - committed_ram  - need.ram  >= ram_buffer
      available_disk - committed_disk - need.disk >= disk_buffer

  Stateless; safe to share between threads.
*/
class AdmissionPolicy {
 public:
  explicit AdmissionPolicy(AdmissionLimits limits);

  ResourceEstimate Estimate(uint64_t declared_size) const;

  // retry_after_seconds is left for the caller to fill.
  AdmissionDecision CheckAdmission(uint64_t free_disk, uint64_t available_ram, uint64_t declared_size) const;

  bool Fits(const PressureState& state, uint64_t candidate_size) const;

  const AdmissionLimits& limits() const {
    return limits_;
  }

 private:
  AdmissionLimits limits_;
};

} // namespace pagequeue::admission
