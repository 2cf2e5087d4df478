#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace interview {

// 128 bits from the operating system's entropy source as 32 lowercase hex
// characters. Keys are bearer tokens, so no seeded engine sits in between.
inline std::string random_key() {
  static thread_local std::random_device device;
  static constexpr char kHex[] = "0123456789abcdef";
  std::string key;
  key.reserve(32);
  for (int word = 0; word < 4; ++word) {
    std::uint32_t x = static_cast<std::uint32_t>(device());
    for (int i = 0; i < 8; ++i) {
      key.push_back(kHex[x & 0xF]);
      x >>= 4;
    }
  }
  return key;
}

} // namespace interview
