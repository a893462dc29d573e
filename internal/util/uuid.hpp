#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace pagequeue::util {

/*
  UUID helpers

  Job identifiers are RFC4122 version 4 UUIDs in their canonical
  36-character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Accepts only the canonical 8-4-4-4-12 form. Throws std::invalid_argument.
UUID FromString(const std::string& str);

bool IsJobId(const std::string& str);

inline std::string GenerateJobId() {
  return ToString(GenerateUUID());
}

} // namespace pagequeue::util
