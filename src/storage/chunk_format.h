/**
 * @file chunk_format.h
 * @brief Binary format of chunk records
 *
 * A chunk record is a fixed 52-byte header followed by the payload:
 *
 *   Offset  Size  Field
 *   0       4     Magic "CHNK" (0x4B4E4843, little-endian)
 *   4       4     Payload size in bytes
 *   8       32    SHA-256 of the stored value
 *   40      4     Reference count
 *   44      4     Flags (record kind in the low byte, keyed bit)
 *   48      4     Header checksum (computed with this field zeroed)
 *
 * All integers are little-endian. A keyed record's payload starts with a
 * 4-byte key length and the key bytes, followed by the value; the hash
 * covers the value only.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "utils/sha256.h"

namespace memex::storage {

/**
 * @brief What a chunk record holds
 */
enum class RecordKind : std::uint8_t {
  kContent = 0,  ///< A content chunk produced by the chunker
  kNode = 1,     ///< A node envelope
  kLink = 2,     ///< A link envelope
};

/**
 * @brief Get a stable name for a record kind
 */
const char* RecordKindToString(RecordKind kind);

namespace chunk_format {

// Magic number for chunk records ("CHNK" read as a little-endian uint32)
constexpr uint32_t kMagic = 0x4B4E4843;

// Fixed record header size
constexpr size_t kHeaderSize = 52;

// Field offsets within the header
constexpr size_t kMagicOffset = 0;
constexpr size_t kSizeOffset = 4;
constexpr size_t kHashOffset = 8;
constexpr size_t kRefCountOffset = 40;
constexpr size_t kFlagsOffset = 44;
constexpr size_t kChecksumOffset = 48;

// Flags layout
constexpr uint32_t kKindMask = 0x000000FF;
constexpr uint32_t kFlagKeyed = 0x00000100;

// Keyed payload prefix (key length)
constexpr size_t kKeyLengthSize = 4;

// Upper bound for caller-supplied keys
constexpr uint32_t kMaxKeyLength = 4096;

}  // namespace chunk_format

/**
 * @brief Decoded chunk record header
 */
struct RecordHeader {
  uint32_t magic = chunk_format::kMagic;
  uint32_t size = 0;       ///< Payload size (including the key prefix of keyed records)
  utils::Digest hash{};    ///< SHA-256 of the value
  uint32_t ref_count = 0;  ///< Number of logical owners; zero means deleted
  uint32_t flags = 0;      ///< Record kind and keyed bit
  uint32_t checksum = 0;   ///< Header checksum as stored

  [[nodiscard]] RecordKind Kind() const { return static_cast<RecordKind>(flags & chunk_format::kKindMask); }
  [[nodiscard]] bool IsKeyed() const { return (flags & chunk_format::kFlagKeyed) != 0; }
};

using HeaderBytes = std::array<uint8_t, chunk_format::kHeaderSize>;

/**
 * @brief Compute the header checksum
 *
 * Rolling accumulator over all 52 header bytes with the checksum field
 * taken as zero: c = rotl(c, 8) ^ byte. It detects accidental corruption
 * only; it offers no protection against deliberate modification.
 */
uint32_t ComputeHeaderChecksum(const uint8_t* header_bytes);

/**
 * @brief Serialize a header, filling in the checksum
 */
HeaderBytes EncodeHeader(const RecordHeader& header);

/**
 * @brief Deserialize a header without validating it
 */
RecordHeader DecodeHeader(const uint8_t* header_bytes);

/**
 * @brief Check the stored checksum against the header contents
 */
bool VerifyHeaderChecksum(const uint8_t* header_bytes);

/**
 * @brief Build flags for a record
 */
uint32_t MakeFlags(RecordKind kind, bool keyed);

/**
 * @brief Build the payload of a keyed record
 */
std::string EncodeKeyedPayload(std::string_view key, std::string_view value);

/**
 * @brief Split a keyed payload into key and value
 * @return {key, value} views into @p payload, or std::nullopt if the prefix is inconsistent
 */
std::optional<std::pair<std::string_view, std::string_view>> DecodeKeyedPayload(std::string_view payload);

}  // namespace memex::storage
