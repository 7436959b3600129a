/**
 * @file tar_archive_test.cpp
 * @brief Unit tests for the ustar reader/writer and gzip helpers
 */

#include "migration/tar_archive.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace memex::migration {
namespace {

constexpr int64_t kMtime = 1714558830;

TEST(TarArchiveTest, WriteAndRead) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("manifest.json", R"({"version":1})", kMtime));
  ASSERT_TRUE(writer.AddFile("nodes/node-1.json", std::string(1000, 'n'), kMtime));
  ASSERT_TRUE(writer.AddFile("edges/0.json", "", kMtime));
  std::string archive = writer.Finish();

  // Three headers, three data blocks, two end blocks
  EXPECT_EQ(archive.size(), 8 * tar_format::kBlockSize);

  auto entries = ReadTarArchive(archive);
  ASSERT_TRUE(entries) << entries.error().to_string();
  ASSERT_EQ(entries->size(), 3);
  EXPECT_EQ((*entries)[0].name, "manifest.json");
  EXPECT_EQ((*entries)[0].data, R"({"version":1})");
  EXPECT_EQ((*entries)[1].name, "nodes/node-1.json");
  EXPECT_EQ((*entries)[1].data, std::string(1000, 'n'));
  EXPECT_EQ((*entries)[2].name, "edges/0.json");
  EXPECT_TRUE((*entries)[2].data.empty());
}

TEST(TarArchiveTest, UstarHeaderFields) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("manifest.json", "{}", kMtime));
  std::string archive = writer.Finish();

  EXPECT_EQ(archive.substr(tar_format::kMagicOffset, 5), "ustar");
  EXPECT_EQ(archive.substr(tar_format::kVersionOffset, 2), "00");
  EXPECT_EQ(archive[tar_format::kTypeflagOffset], tar_format::kRegularFile);
  EXPECT_EQ(archive.substr(tar_format::kSizeOffset, 11), "00000000002");
  EXPECT_EQ(archive.substr(tar_format::kModeOffset, 7), "0000644");
}

TEST(TarArchiveTest, LongNameUsesPrefix) {
  std::string name = "nodes/" + std::string(120, 'a') + ".json";
  ASSERT_FALSE(name.size() <= tar_format::kNameSize);
  EXPECT_FALSE(TarWriter::FitsHeader(name));

  std::string nested = std::string(60, 'd') + "/" + std::string(60, 'e') + "/node.json";
  EXPECT_TRUE(TarWriter::FitsHeader(nested));

  TarWriter writer;
  ASSERT_TRUE(writer.AddFile(nested, "data", kMtime));
  auto entries = ReadTarArchive(writer.Finish());
  ASSERT_TRUE(entries);
  ASSERT_EQ(entries->size(), 1);
  EXPECT_EQ((*entries)[0].name, nested);
}

TEST(TarArchiveTest, RejectsUnrepresentableName) {
  TarWriter writer;
  auto result = writer.AddFile("nodes/" + std::string(120, 'a') + ".json", "data", kMtime);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kInvalidArgument);

  auto empty = writer.AddFile("", "data", kMtime);
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), utils::ErrorCode::kInvalidArgument);
}

TEST(TarArchiveTest, EmptyArchive) {
  TarWriter writer;
  auto entries = ReadTarArchive(writer.Finish());
  ASSERT_TRUE(entries);
  EXPECT_TRUE(entries->empty());

  auto nothing = ReadTarArchive("");
  ASSERT_TRUE(nothing);
  EXPECT_TRUE(nothing->empty());
}

TEST(TarArchiveTest, MissingEndBlocksAccepted) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("manifest.json", "{}", kMtime));
  std::string archive = writer.Finish();
  archive.resize(archive.size() - 2 * tar_format::kBlockSize);

  auto entries = ReadTarArchive(archive);
  ASSERT_TRUE(entries);
  EXPECT_EQ(entries->size(), 1);
}

TEST(TarArchiveTest, SkipsNonRegularEntries) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("nodes", "", kMtime));
  ASSERT_TRUE(writer.AddFile("manifest.json", "{}", kMtime));
  std::string archive = writer.Finish();

  // Turn the first entry into a directory and fix its checksum
  archive[tar_format::kTypeflagOffset] = '5';
  uint32_t sum = 0;
  for (size_t i = 0; i < tar_format::kBlockSize; ++i) {
    bool in_checksum = i >= tar_format::kChecksumOffset && i < tar_format::kChecksumOffset + tar_format::kChecksumSize;
    sum += in_checksum ? static_cast<uint32_t>(' ') : static_cast<unsigned char>(archive[i]);
  }
  char checksum[8];
  std::snprintf(checksum, sizeof(checksum), "%06o", sum);
  archive.replace(tar_format::kChecksumOffset, 6, checksum, 6);

  auto entries = ReadTarArchive(archive);
  ASSERT_TRUE(entries) << entries.error().to_string();
  ASSERT_EQ(entries->size(), 1);
  EXPECT_EQ((*entries)[0].name, "manifest.json");
}

TEST(TarArchiveTest, ChecksumMismatch) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("manifest.json", "{}", kMtime));
  std::string archive = writer.Finish();
  archive[tar_format::kNameOffset] = 'M';

  auto entries = ReadTarArchive(archive);
  ASSERT_FALSE(entries);
  EXPECT_EQ(entries.error().code(), utils::ErrorCode::kMigrationInvalidArchive);
}

TEST(TarArchiveTest, TruncatedData) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("nodes/node-1.json", std::string(2000, 'x'), kMtime));
  std::string archive = writer.Finish();
  archive.resize(tar_format::kBlockSize + 1000);

  auto entries = ReadTarArchive(archive);
  ASSERT_FALSE(entries);
  EXPECT_EQ(entries.error().code(), utils::ErrorCode::kMigrationInvalidArchive);
}

TEST(TarArchiveTest, TruncatedHeader) {
  TarWriter writer;
  ASSERT_TRUE(writer.AddFile("manifest.json", "{}", kMtime));
  std::string archive = writer.Finish();
  archive.resize(2 * tar_format::kBlockSize + 100);

  auto entries = ReadTarArchive(archive);
  ASSERT_FALSE(entries);
  EXPECT_EQ(entries.error().code(), utils::ErrorCode::kMigrationInvalidArchive);
}

// ============================================================================
// gzip
// ============================================================================

TEST(GzipTest, CompressAndDecompress) {
  std::string data;
  for (int i = 0; i < 1000; ++i) {
    data += "node " + std::to_string(i) + "\n";
  }

  auto compressed = GzipCompress(data);
  ASSERT_TRUE(compressed);
  EXPECT_TRUE(IsGzip(*compressed));
  EXPECT_LT(compressed->size(), data.size());

  auto decompressed = GzipDecompress(*compressed);
  ASSERT_TRUE(decompressed) << decompressed.error().to_string();
  EXPECT_EQ(*decompressed, data);
}

TEST(GzipTest, EmptyInput) {
  auto compressed = GzipCompress("");
  ASSERT_TRUE(compressed);
  auto decompressed = GzipDecompress(*compressed);
  ASSERT_TRUE(decompressed);
  EXPECT_TRUE(decompressed->empty());
}

TEST(GzipTest, DetectsMagic) {
  EXPECT_FALSE(IsGzip(""));
  EXPECT_FALSE(IsGzip("\x1f"));
  EXPECT_FALSE(IsGzip("manifest"));
  EXPECT_TRUE(IsGzip("\x1f\x8b"));
}

TEST(GzipTest, TruncatedStream) {
  auto compressed = GzipCompress(std::string(10000, 'z') + "tail");
  ASSERT_TRUE(compressed);
  compressed->resize(compressed->size() / 2);

  auto decompressed = GzipDecompress(*compressed);
  ASSERT_FALSE(decompressed);
  EXPECT_EQ(decompressed.error().code(), utils::ErrorCode::kMigrationCompressionError);
}

TEST(GzipTest, CorruptStream) {
  std::string garbage = std::string("\x1f\x8b\x08") + '\0' + "garbage that is not deflate";
  auto decompressed = GzipDecompress(garbage);
  ASSERT_FALSE(decompressed);
  EXPECT_EQ(decompressed.error().code(), utils::ErrorCode::kMigrationCompressionError);
}

}  // namespace
}  // namespace memex::migration
