#include "admission_policy.hpp"

#include <cmath>
#include <string>

namespace pagequeue::admission {

namespace {

uint64_t Scale(uint64_t size, double multiplier) {
  return static_cast<uint64_t>(std::ceil(static_cast<double>(size) * multiplier));
}

// a - b - c >= floor, without unsigned wrap.
bool HasHeadroom(uint64_t available, uint64_t committed, uint64_t need, uint64_t floor) {
  if (committed > available) return false;
  available -= committed;
  if (need > available) return false;
  return available - need >= floor;
}

constexpr uint64_t kMiB = 1024 * 1024;

} // namespace

std::string_view ToString(AdmissionReason reason) {
  switch (reason) {
    case AdmissionReason::kNone:
      return "";
    case AdmissionReason::kDiskSpace:
      return "disk_space";
    case AdmissionReason::kMemory:
      return "memory";
  }
  return "";
}

AdmissionPolicy::AdmissionPolicy(AdmissionLimits limits) : limits_(limits) {
}

ResourceEstimate AdmissionPolicy::Estimate(uint64_t declared_size) const {
  return {Scale(declared_size, limits_.ram_multiplier), Scale(declared_size, limits_.disk_multiplier)};
}

AdmissionDecision AdmissionPolicy::CheckAdmission(uint64_t free_disk, uint64_t available_ram,
                                                  uint64_t declared_size) const {
  AdmissionDecision decision;

  const uint64_t disk_required = 2 * declared_size + limits_.disk_safety_buffer;
  if (free_disk <= disk_required) {
    decision.ok      = false;
    decision.reason  = AdmissionReason::kDiskSpace;
    decision.message = "Server storage is full. Need " + std::to_string(disk_required / kMiB) + "MB, have " +
                       std::to_string(free_disk / kMiB) + "MB";
    return decision;
  }

  if (available_ram <= limits_.min_free_ram) {
    decision.ok      = false;
    decision.reason  = AdmissionReason::kMemory;
    decision.message = "Server is busy. Available memory " + std::to_string(available_ram / kMiB) + "MB";
    return decision;
  }

  return decision;
}

bool AdmissionPolicy::Fits(const PressureState& state, uint64_t candidate_size) const {
  const auto need = Estimate(candidate_size);
  return HasHeadroom(state.available_ram, state.committed_ram, need.ram, limits_.ram_buffer) &&
         HasHeadroom(state.available_disk, state.committed_disk, need.disk, limits_.disk_buffer);
}

} // namespace pagequeue::admission
