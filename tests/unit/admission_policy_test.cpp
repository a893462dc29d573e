#include "internal/admission/admission_policy.hpp"

#include <cassert>
#include <iostream>

#include "tests/support/fakes.hpp"

namespace {

using pagequeue::admission::AdmissionLimits;
using pagequeue::admission::AdmissionPolicy;
using pagequeue::admission::AdmissionReason;
using pagequeue::admission::PressureState;
using pagequeue::testing::kGiB;
using pagequeue::testing::kMiB;

AdmissionLimits DefaultLimits() {
  AdmissionLimits limits;
  limits.disk_safety_buffer = 150 * kMiB;
  limits.min_free_ram       = 100 * kMiB;
  limits.ram_multiplier     = 2.5;
  limits.disk_multiplier    = 3.0;
  limits.ram_buffer         = 300 * kMiB;
  limits.disk_buffer        = 150 * kMiB;
  return limits;
}

void TestDiskShortfallIsRejected() {
  AdmissionPolicy policy(DefaultLimits());

  // 2 * 100 + 150 = 350MB required, 150MB free
  auto decision = policy.CheckAdmission(150 * kMiB, 8 * kGiB, 100 * kMiB);
  assert(!decision.ok);
  assert(decision.reason == AdmissionReason::kDiskSpace);
  assert(pagequeue::admission::ToString(decision.reason) == "disk_space");
  assert(!decision.message.empty());
}

void TestDiskRequirementIsStrict() {
  AdmissionPolicy policy(DefaultLimits());

  assert(!policy.CheckAdmission(350 * kMiB, 8 * kGiB, 100 * kMiB).ok);
  assert(policy.CheckAdmission(350 * kMiB + 1, 8 * kGiB, 100 * kMiB).ok);
}

void TestMemoryFloorIsCheckedAfterDisk() {
  AdmissionPolicy policy(DefaultLimits());

  auto decision = policy.CheckAdmission(10 * kGiB, 100 * kMiB, 10 * kMiB);
  assert(!decision.ok);
  assert(decision.reason == AdmissionReason::kMemory);
  assert(pagequeue::admission::ToString(decision.reason) == "memory");

  // both short: disk wins
  decision = policy.CheckAdmission(0, 0, 10 * kMiB);
  assert(decision.reason == AdmissionReason::kDiskSpace);
}

void TestEstimateScalesByMultipliers() {
  AdmissionPolicy policy(DefaultLimits());

  auto estimate = policy.Estimate(100 * kMiB);
  assert(estimate.ram == 250 * kMiB);
  assert(estimate.disk == 300 * kMiB);
}

void TestFitsHonoursBuffersAndCommittedUsage() {
  AdmissionPolicy policy(DefaultLimits());

  PressureState state;
  state.available_ram  = 550 * kMiB;
  state.available_disk = 450 * kMiB;

  // need 250 RAM / 300 disk; leaves exactly the 300 / 150 buffers
  assert(policy.Fits(state, 100 * kMiB));
  assert(!policy.Fits(state, 100 * kMiB + kMiB));

  state.committed_ram = 1;
  assert(!policy.Fits(state, 100 * kMiB));

  state.committed_ram = 10 * kGiB;
  assert(!policy.Fits(state, 0));
}

} // namespace

int main() {
  TestDiskShortfallIsRejected();
  TestDiskRequirementIsStrict();
  TestMemoryFloorIsCheckedAfterDisk();
  TestEstimateScalesByMultipliers();
  TestFitsHonoursBuffersAndCommittedUsage();

  std::cout << "pagequeue_unit_admission_policy: pass\n";
  return 0;
}
