/**
 * @file sha256.h
 * @brief Standalone SHA-256 implementation for content addressing
 *
 * Based on FIPS 180-4 - Secure Hash Standard
 * Used for chunk addresses and the action log hash chain.
 *
 * NOLINTBEGIN - Low-level cryptographic implementation following FIPS 180-4
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace memex::utils {

/// Size of a SHA-256 digest in bytes
constexpr size_t kSha256Size = 32;

/// Raw SHA-256 digest
using Digest = std::array<uint8_t, kSha256Size>;

/**
 * @brief SHA-256 hasher
 */
class Sha256 {
 public:
  Sha256();

  /**
   * @brief Update hash with data
   */
  void Update(const uint8_t* data, size_t len);

  /**
   * @brief Update hash with a byte string
   */
  void Update(std::string_view bytes) { Update(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()); }

  /**
   * @brief Finalize and get digest
   *
   * The hasher must not be updated again after finalization.
   */
  Digest Finalize();

  /**
   * @brief Convenience method to hash a byte string
   */
  static Digest Hash(std::string_view bytes);

 private:
  void Transform(const uint8_t block[64]);

  uint32_t state_[8];
  uint64_t bit_count_ = 0;
  uint8_t buffer_[64];
  size_t buffer_len_ = 0;
};

/**
 * @brief Digest as a 32-byte binary string
 */
inline std::string DigestToBytes(const Digest& digest) {
  return std::string(reinterpret_cast<const char*>(digest.data()), digest.size());
}

/**
 * @brief All-zero digest (used as the hash of "nothing")
 */
inline Digest ZeroDigest() {
  return Digest{};
}

}  // namespace memex::utils

// NOLINTEND
