#include "uuid.hpp"

#include <stdexcept>

namespace pagequeue::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

// Offsets of the '-' separators in the 36-character form.
bool IsSeparatorOffset(size_t offset) {
  return offset == 8 || offset == 13 || offset == 18 || offset == 23;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  std::string out;
  out.reserve(36);

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHexDigits[id[i] >> 4]);
    out.push_back(kHexDigits[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  if (str.size() != 36) {
    throw std::invalid_argument("invalid job id length: " + str);
  }

  UUID   id{};
  size_t nibble = 0;
  for (size_t offset = 0; offset < str.size(); ++offset) {
    if (IsSeparatorOffset(offset)) {
      if (str[offset] != '-') throw std::invalid_argument("invalid job id: " + str);
      continue;
    }

    const int value = HexValue(str[offset]);
    if (value < 0) {
      throw std::invalid_argument("invalid job id: " + str);
    }
    auto& byte = id[nibble / 2];
    byte       = static_cast<uint8_t>((nibble % 2 == 0) ? (value << 4) : (byte | value));
    ++nibble;
  }

  return id;
}

bool IsJobId(const std::string& str) {
  try {
    FromString(str);
  } catch (const std::invalid_argument&) {
    return false;
  }
  return true;
}

} // namespace pagequeue::util
