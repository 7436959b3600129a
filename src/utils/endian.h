/**
 * @file endian.h
 * @brief Little-endian load/store helpers for on-disk structures
 *
 * All multi-byte integers in the repository file and the action log are
 * little-endian regardless of the host byte order.
 */

#pragma once

#include <cstdint>

namespace memex::utils {

inline void StoreLE16(uint8_t* out, uint16_t value) {
  out[0] = static_cast<uint8_t>(value);
  out[1] = static_cast<uint8_t>(value >> 8);
}

inline void StoreLE32(uint8_t* out, uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

inline void StoreLE64(uint8_t* out, uint64_t value) {
  for (int i = 0; i < 8; ++i) {  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

inline uint16_t LoadLE16(const uint8_t* in) {
  return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

inline uint32_t LoadLE32(const uint8_t* in) {
  uint32_t value = 0;
  for (int i = 3; i >= 0; --i) {
    value = (value << 8) | in[i];
  }
  return value;
}

inline uint64_t LoadLE64(const uint8_t* in) {
  uint64_t value = 0;
  for (int i = 7; i >= 0; --i) {  // NOLINT(cppcoreguidelines-avoid-magic-numbers)
    value = (value << 8) | in[i];
  }
  return value;
}

}  // namespace memex::utils
