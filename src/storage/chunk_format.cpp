/**
 * @file chunk_format.cpp
 * @brief Chunk record encoding
 */

#include "storage/chunk_format.h"

#include <cstring>

#include "utils/endian.h"

namespace memex::storage {

const char* RecordKindToString(RecordKind kind) {
  switch (kind) {
    case RecordKind::kContent:
      return "content";
    case RecordKind::kNode:
      return "node";
    case RecordKind::kLink:
      return "link";
  }
  return "unknown";
}

uint32_t ComputeHeaderChecksum(const uint8_t* header_bytes) {
  uint32_t checksum = 0;
  for (size_t i = 0; i < chunk_format::kHeaderSize; ++i) {
    uint8_t byte = header_bytes[i];
    if (i >= chunk_format::kChecksumOffset) {
      byte = 0;
    }
    checksum = ((checksum << 8) | (checksum >> 24)) ^ byte;
  }
  return checksum;
}

HeaderBytes EncodeHeader(const RecordHeader& header) {
  HeaderBytes bytes{};
  utils::StoreLE32(bytes.data() + chunk_format::kMagicOffset, header.magic);
  utils::StoreLE32(bytes.data() + chunk_format::kSizeOffset, header.size);
  std::memcpy(bytes.data() + chunk_format::kHashOffset, header.hash.data(), header.hash.size());
  utils::StoreLE32(bytes.data() + chunk_format::kRefCountOffset, header.ref_count);
  utils::StoreLE32(bytes.data() + chunk_format::kFlagsOffset, header.flags);
  utils::StoreLE32(bytes.data() + chunk_format::kChecksumOffset, 0);
  utils::StoreLE32(bytes.data() + chunk_format::kChecksumOffset, ComputeHeaderChecksum(bytes.data()));
  return bytes;
}

RecordHeader DecodeHeader(const uint8_t* header_bytes) {
  RecordHeader header;
  header.magic = utils::LoadLE32(header_bytes + chunk_format::kMagicOffset);
  header.size = utils::LoadLE32(header_bytes + chunk_format::kSizeOffset);
  std::memcpy(header.hash.data(), header_bytes + chunk_format::kHashOffset, header.hash.size());
  header.ref_count = utils::LoadLE32(header_bytes + chunk_format::kRefCountOffset);
  header.flags = utils::LoadLE32(header_bytes + chunk_format::kFlagsOffset);
  header.checksum = utils::LoadLE32(header_bytes + chunk_format::kChecksumOffset);
  return header;
}

bool VerifyHeaderChecksum(const uint8_t* header_bytes) {
  return ComputeHeaderChecksum(header_bytes) == utils::LoadLE32(header_bytes + chunk_format::kChecksumOffset);
}

uint32_t MakeFlags(RecordKind kind, bool keyed) {
  uint32_t flags = static_cast<uint32_t>(kind) & chunk_format::kKindMask;
  if (keyed) {
    flags |= chunk_format::kFlagKeyed;
  }
  return flags;
}

std::string EncodeKeyedPayload(std::string_view key, std::string_view value) {
  std::string payload(chunk_format::kKeyLengthSize, '\0');
  utils::StoreLE32(reinterpret_cast<uint8_t*>(payload.data()), static_cast<uint32_t>(key.size()));
  payload.append(key);
  payload.append(value);
  return payload;
}

std::optional<std::pair<std::string_view, std::string_view>> DecodeKeyedPayload(std::string_view payload) {
  if (payload.size() < chunk_format::kKeyLengthSize) {
    return std::nullopt;
  }
  uint32_t key_len = utils::LoadLE32(reinterpret_cast<const uint8_t*>(payload.data()));
  if (key_len == 0 || key_len > chunk_format::kMaxKeyLength ||
      key_len > payload.size() - chunk_format::kKeyLengthSize) {
    return std::nullopt;
  }
  std::string_view key = payload.substr(chunk_format::kKeyLengthSize, key_len);
  std::string_view value = payload.substr(chunk_format::kKeyLengthSize + key_len);
  return std::make_pair(key, value);
}

}  // namespace memex::storage
