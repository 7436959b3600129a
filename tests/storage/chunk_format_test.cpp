/**
 * @file chunk_format_test.cpp
 * @brief Unit tests for chunk record headers
 */

#include "storage/chunk_format.h"

#include <gtest/gtest.h>

#include "utils/endian.h"

namespace memex::storage {
namespace {

RecordHeader MakeHeader() {
  RecordHeader header;
  header.size = 1234;
  header.hash = utils::Sha256::Hash("node1");
  header.ref_count = 3;
  header.flags = MakeFlags(RecordKind::kNode, true);
  return header;
}

TEST(ChunkFormatTest, HeaderLayout) {
  HeaderBytes bytes = EncodeHeader(MakeHeader());
  ASSERT_EQ(bytes.size(), 52);

  // "CHNK" on disk
  EXPECT_EQ(bytes[0], 'C');
  EXPECT_EQ(bytes[1], 'H');
  EXPECT_EQ(bytes[2], 'N');
  EXPECT_EQ(bytes[3], 'K');
  EXPECT_EQ(utils::LoadLE32(bytes.data() + chunk_format::kSizeOffset), 1234);
  EXPECT_EQ(utils::LoadLE32(bytes.data() + chunk_format::kRefCountOffset), 3);
  EXPECT_EQ(utils::LoadLE32(bytes.data() + chunk_format::kFlagsOffset), 0x101);
  EXPECT_EQ(bytes[chunk_format::kHashOffset], utils::Sha256::Hash("node1")[0]);
}

TEST(ChunkFormatTest, DecodeRestoresFields) {
  RecordHeader original = MakeHeader();
  HeaderBytes bytes = EncodeHeader(original);
  RecordHeader decoded = DecodeHeader(bytes.data());

  EXPECT_EQ(decoded.magic, chunk_format::kMagic);
  EXPECT_EQ(decoded.size, original.size);
  EXPECT_EQ(decoded.hash, original.hash);
  EXPECT_EQ(decoded.ref_count, original.ref_count);
  EXPECT_EQ(decoded.Kind(), RecordKind::kNode);
  EXPECT_TRUE(decoded.IsKeyed());
  EXPECT_EQ(decoded.checksum, ComputeHeaderChecksum(bytes.data()));
}

TEST(ChunkFormatTest, ChecksumIgnoresItsOwnField) {
  HeaderBytes bytes = EncodeHeader(MakeHeader());
  uint32_t checksum = ComputeHeaderChecksum(bytes.data());
  utils::StoreLE32(bytes.data() + chunk_format::kChecksumOffset, 0xDEADBEEF);
  EXPECT_EQ(ComputeHeaderChecksum(bytes.data()), checksum);
  EXPECT_FALSE(VerifyHeaderChecksum(bytes.data()));
}

TEST(ChunkFormatTest, ChecksumDetectsEveryByteFlip) {
  HeaderBytes original = EncodeHeader(MakeHeader());
  ASSERT_TRUE(VerifyHeaderChecksum(original.data()));

  for (size_t i = 0; i < chunk_format::kChecksumOffset; ++i) {
    HeaderBytes corrupted = original;
    corrupted[i] ^= 0x01;
    EXPECT_FALSE(VerifyHeaderChecksum(corrupted.data())) << "flip at offset " << i;
  }
}

TEST(ChunkFormatTest, ChecksumDependsOnLeadingBytes) {
  // Bytes far from the end of the header must still influence the checksum
  HeaderBytes zero_a{};
  HeaderBytes zero_b{};
  zero_b[0] = 1;
  EXPECT_NE(ComputeHeaderChecksum(zero_a.data()), ComputeHeaderChecksum(zero_b.data()));
}

TEST(ChunkFormatTest, MakeFlags) {
  EXPECT_EQ(MakeFlags(RecordKind::kContent, false), 0x000);
  EXPECT_EQ(MakeFlags(RecordKind::kLink, false), 0x002);
  EXPECT_EQ(MakeFlags(RecordKind::kLink, true), 0x102);
}

TEST(ChunkFormatTest, KeyedPayload) {
  std::string payload = EncodeKeyedPayload("node-1", "value bytes");
  ASSERT_EQ(payload.size(), 4 + 6 + 11);

  auto parts = DecodeKeyedPayload(payload);
  ASSERT_TRUE(parts.has_value());
  EXPECT_EQ(parts->first, "node-1");
  EXPECT_EQ(parts->second, "value bytes");
}

TEST(ChunkFormatTest, KeyedPayloadEmptyValue) {
  auto parts = DecodeKeyedPayload(EncodeKeyedPayload("k", ""));
  ASSERT_TRUE(parts.has_value());
  EXPECT_EQ(parts->first, "k");
  EXPECT_TRUE(parts->second.empty());
}

TEST(ChunkFormatTest, KeyedPayloadRejectsBadPrefix) {
  EXPECT_FALSE(DecodeKeyedPayload("abc").has_value());

  std::string payload = EncodeKeyedPayload("node-1", "v");
  utils::StoreLE32(reinterpret_cast<uint8_t*>(payload.data()), 100);  // longer than the payload
  EXPECT_FALSE(DecodeKeyedPayload(payload).has_value());

  utils::StoreLE32(reinterpret_cast<uint8_t*>(payload.data()), 0);
  EXPECT_FALSE(DecodeKeyedPayload(payload).has_value());
}

TEST(ChunkFormatTest, RecordKindNames) {
  EXPECT_STREQ(RecordKindToString(RecordKind::kContent), "content");
  EXPECT_STREQ(RecordKindToString(RecordKind::kNode), "node");
  EXPECT_STREQ(RecordKindToString(RecordKind::kLink), "link");
}

}  // namespace
}  // namespace memex::storage
