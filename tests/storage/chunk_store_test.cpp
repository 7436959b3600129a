/**
 * @file chunk_store_test.cpp
 * @brief Unit tests for the reference-counted chunk store
 */

#include "storage/chunk_store.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>

#include "utils/encoding.h"

namespace memex::storage {
namespace {

std::string RandomBytes(size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string bytes(size, '\0');
  for (auto& byte : bytes) {
    byte = static_cast<char>(dist(rng));
  }
  return bytes;
}

class ChunkStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("memex_chunk_store_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    path_ = (dir_ / "chunks.dat").string();

    config_.chunker.min_size = 256;
    config_.chunker.avg_size = 1024;
    config_.chunker.max_size = 4096;
    config_.sync_writes = false;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::unique_ptr<ChunkStore> OpenStore() {
    auto store = std::make_unique<ChunkStore>(config_);
    auto result = store->Open(path_);
    EXPECT_TRUE(result) << result.error().to_string();
    return store;
  }

  void FlipByte(uint64_t offset) {
    std::fstream file(path_, std::ios::in | std::ios::out | std::ios::binary);
    file.seekg(static_cast<std::streamoff>(offset));
    char byte = 0;
    file.read(&byte, 1);
    byte = static_cast<char>(byte ^ 0x20);
    file.seekp(static_cast<std::streamoff>(offset));
    file.write(&byte, 1);
  }

  std::filesystem::path dir_;
  std::string path_;
  config::StorageConfig config_;
};

// ============================================================================
// Put / Get
// ============================================================================

TEST_F(ChunkStoreTest, PutAndGet) {
  auto store = OpenStore();
  std::string content = RandomBytes(20000, 1);

  auto addresses = store->Put(content);
  ASSERT_TRUE(addresses) << addresses.error().to_string();
  EXPECT_GT(addresses->size(), 1);
  for (const auto& address : *addresses) {
    EXPECT_EQ(address.size(), utils::kSha256Size);
  }

  auto loaded = store->Get(*addresses);
  ASSERT_TRUE(loaded) << loaded.error().to_string();
  EXPECT_EQ(*loaded, content);
}

TEST_F(ChunkStoreTest, EmptyContentHasNoChunks) {
  auto store = OpenStore();
  auto addresses = store->Put("");
  ASSERT_TRUE(addresses);
  EXPECT_TRUE(addresses->empty());
  EXPECT_EQ(store->GetChunkCount(), 0);
}

TEST_F(ChunkStoreTest, DuplicateContentIsStoredOnce) {
  auto store = OpenStore();
  std::string content = RandomBytes(10000, 2);

  auto first = store->Put(content);
  ASSERT_TRUE(first);
  size_t count = store->GetChunkCount();
  uint64_t size = store->GetFileSize();

  auto second = store->Put(content);
  ASSERT_TRUE(second);
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(store->GetChunkCount(), count);
  EXPECT_EQ(store->GetFileSize(), size);

  auto entry = store->Stat((*first)[0]);
  ASSERT_TRUE(entry);
  EXPECT_EQ(entry->ref_count, 2);
}

TEST_F(ChunkStoreTest, AddressForms) {
  auto store = OpenStore();
  auto address = store->PutWhole("node1", RecordKind::kContent);
  ASSERT_TRUE(address);

  std::string hex = utils::HexEncode(*address);
  EXPECT_TRUE(store->Contains(*address));
  EXPECT_TRUE(store->Contains(hex));
  EXPECT_TRUE(store->Contains("imported-" + hex));
  EXPECT_FALSE(store->Contains("imported-node1"));

  auto by_suffix = store->Get("imported-" + hex);
  ASSERT_TRUE(by_suffix);
  EXPECT_EQ(*by_suffix, "node1");
}

TEST_F(ChunkStoreTest, KindsAreCountedSeparately) {
  auto store = OpenStore();
  auto content = store->PutWhole("same bytes", RecordKind::kContent);
  auto node = store->PutWhole("same bytes", RecordKind::kNode);
  ASSERT_TRUE(content);
  ASSERT_TRUE(node);
  EXPECT_EQ(*content, *node);
  EXPECT_EQ(store->GetChunkCount(), 2);
  EXPECT_EQ(store->ListChunks(RecordKind::kNode).size(), 1);

  ASSERT_TRUE(store->Delete({*node}, RecordKind::kNode));
  EXPECT_EQ(store->ListChunks(RecordKind::kNode).size(), 0);
  EXPECT_TRUE(store->Contains(*content));
}

TEST_F(ChunkStoreTest, ListChunksReportsEachRecordOnce) {
  auto store = OpenStore();
  auto address = store->PutWhole("node1", RecordKind::kContent);
  ASSERT_TRUE(address);
  ASSERT_TRUE(store->PutWithID("node-2", "node2", RecordKind::kNode));

  // Every address form reaches the same record
  std::string hex = utils::HexEncode(*address);
  EXPECT_EQ(*store->Get(*address), "node1");
  EXPECT_EQ(*store->Get(hex), "node1");
  EXPECT_EQ(*store->Get("imported-" + hex), "node1");

  auto entries = store->ListChunks();
  ASSERT_EQ(entries.size(), 2);
  size_t hashed = 0;
  size_t keyed = 0;
  for (const auto& entry : entries) {
    if (entry.keyed) {
      ++keyed;
      EXPECT_EQ(entry.address, "node-2");
      EXPECT_EQ(entry.kind, RecordKind::kNode);
      EXPECT_EQ(entry.size, 5);
    } else {
      ++hashed;
      EXPECT_EQ(entry.address, *address);
      EXPECT_EQ(entry.kind, RecordKind::kContent);
      EXPECT_EQ(entry.ref_count, 1);
    }
  }
  EXPECT_EQ(hashed, 1);
  EXPECT_EQ(keyed, 1);
  EXPECT_EQ(store->GetChunkCount(), 2);
}

TEST_F(ChunkStoreTest, GetMissingAddress) {
  auto store = OpenStore();
  auto missing = store->Get(std::string(64, 'a'));
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), utils::ErrorCode::kStorageChunkNotFound);
}

// ============================================================================
// Keyed records
// ============================================================================

TEST_F(ChunkStoreTest, PutWithID) {
  auto store = OpenStore();
  ASSERT_TRUE(store->PutWithID("node-1", "first value", RecordKind::kNode));

  auto loaded = store->Get("node-1");
  ASSERT_TRUE(loaded);
  EXPECT_EQ(*loaded, "first value");

  auto entry = store->Stat("node-1");
  ASSERT_TRUE(entry);
  EXPECT_TRUE(entry->keyed);
  EXPECT_EQ(entry->kind, RecordKind::kNode);
  EXPECT_EQ(entry->size, 11);
}

TEST_F(ChunkStoreTest, PutWithIDReplacesPreviousValue) {
  auto store = OpenStore();
  ASSERT_TRUE(store->PutWithID("node-1", "first value"));
  ASSERT_TRUE(store->PutWithID("node-1", "second value"));

  EXPECT_EQ(store->GetChunkCount(), 1);
  EXPECT_EQ(*store->Get("node-1"), "second value");

  // The superseded record stays released after a rescan
  store.reset();
  store = OpenStore();
  EXPECT_EQ(store->GetChunkCount(), 1);
  EXPECT_EQ(*store->Get("node-1"), "second value");
}

TEST_F(ChunkStoreTest, PutWithIDRejectsEmptyKey) {
  auto store = OpenStore();
  auto result = store->PutWithID("", "value");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kInvalidArgument);
}

// ============================================================================
// Reference counting
// ============================================================================

TEST_F(ChunkStoreTest, DeleteDropsRecordAtZero) {
  auto store = OpenStore();
  auto address = store->PutWhole("payload", RecordKind::kContent);
  ASSERT_TRUE(address);
  ASSERT_TRUE(store->PutWhole("payload", RecordKind::kContent));

  ASSERT_TRUE(store->Delete({*address}));
  EXPECT_TRUE(store->Contains(*address));
  EXPECT_EQ(store->Stat(*address)->ref_count, 1);

  ASSERT_TRUE(store->Delete({*address}));
  EXPECT_FALSE(store->Contains(*address));

  auto again = store->Delete({*address});
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code(), utils::ErrorCode::kStorageChunkNotFound);
}

TEST_F(ChunkStoreTest, ReferenceCountsSurviveReopen) {
  std::string content = RandomBytes(8000, 3);
  std::vector<std::string> addresses;
  {
    auto store = OpenStore();
    auto first = store->Put(content);
    ASSERT_TRUE(first);
    addresses = *first;
    ASSERT_TRUE(store->Put(content));
    ASSERT_TRUE(store->Delete(addresses));
  }

  auto store = OpenStore();
  for (const auto& address : addresses) {
    auto entry = store->Stat(address);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->ref_count, 1);
  }
  EXPECT_EQ(*store->Get(addresses), content);
}

TEST_F(ChunkStoreTest, SharedChunksOutliveOneOwner) {
  auto store = OpenStore();
  std::string shared = RandomBytes(6000, 4);
  auto first = store->Put(shared);
  auto second = store->Put(shared + RandomBytes(6000, 5));
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  ASSERT_EQ((*second)[0], (*first)[0]);

  // Releasing the first owner leaves the chunks the second still uses
  ASSERT_TRUE(store->Delete(*first));
  for (const auto& address : *first) {
    auto entry = store->Stat(address);
    bool shared_with_second = std::find(second->begin(), second->end(), address) != second->end();
    if (shared_with_second) {
      ASSERT_TRUE(entry);
      EXPECT_EQ(entry->ref_count, 1);
    } else {
      EXPECT_FALSE(entry);
    }
  }
  EXPECT_EQ(*store->Get(*second), shared + RandomBytes(6000, 5));
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(ChunkStoreTest, HeaderChecksumMismatchFailsOpen) {
  {
    auto store = OpenStore();
    ASSERT_TRUE(store->PutWhole("payload", RecordKind::kContent));
  }
  FlipByte(chunk_format::kSizeOffset);

  ChunkStore store(config_);
  auto result = store.Open(path_);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageChecksumMismatch);
}

TEST_F(ChunkStoreTest, PayloadCorruptionDetectedOnRead) {
  std::string address;
  {
    auto store = OpenStore();
    auto put = store->PutWhole("payload", RecordKind::kContent);
    ASSERT_TRUE(put);
    address = *put;
  }
  FlipByte(chunk_format::kHeaderSize);

  auto store = OpenStore();
  auto loaded = store->Get(address);
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kStorageHashMismatch);
}

TEST_F(ChunkStoreTest, TruncatedTailIsIgnored) {
  std::string first;
  std::string second;
  {
    auto store = OpenStore();
    first = *store->PutWhole("first record", RecordKind::kContent);
    second = *store->PutWhole("second record", RecordKind::kContent);
  }
  std::filesystem::resize_file(path_, std::filesystem::file_size(path_) - 3);

  auto store = OpenStore();
  EXPECT_TRUE(store->Contains(first));
  EXPECT_FALSE(store->Contains(second));
  EXPECT_EQ(store->GetFileSize(), chunk_format::kHeaderSize + std::string("first record").size());

  // The torn bytes are gone, so a new append is found by the next scan
  auto third = store->PutWhole("third record", RecordKind::kContent);
  ASSERT_TRUE(third);
  store.reset();
  store = OpenStore();
  EXPECT_TRUE(store->Contains(first));
  EXPECT_TRUE(store->Contains(*third));
}

TEST_F(ChunkStoreTest, StrayBytesAreNeverRemoved) {
  std::string first;
  std::string second;
  {
    auto store = OpenStore();
    first = *store->PutWhole("first record", RecordKind::kContent);
    second = *store->PutWhole("second record", RecordKind::kContent);
  }
  uint64_t size = std::filesystem::file_size(path_);
  uint64_t second_offset = chunk_format::kHeaderSize + std::string("first record").size();

  // A damaged magic turns the whole last record into stray bytes
  FlipByte(second_offset);
  std::string third;
  {
    auto store = OpenStore();
    EXPECT_TRUE(store->Contains(first));
    EXPECT_FALSE(store->Contains(second));
    EXPECT_EQ(std::filesystem::file_size(path_), size);
    EXPECT_EQ(store->GetFileSize(), size);

    auto appended = store->PutWhole("third record", RecordKind::kContent);
    ASSERT_TRUE(appended);
    third = *appended;
  }

  // Repairing the magic brings the record back; the append after it is found too
  FlipByte(second_offset);
  auto store = OpenStore();
  EXPECT_TRUE(store->Contains(first));
  EXPECT_EQ(*store->Get(second), "second record");
  EXPECT_EQ(*store->Get(third), "third record");
}

TEST_F(ChunkStoreTest, DataOffsetBeyondFileIsCorrupt) {
  {
    std::ofstream file(path_, std::ios::binary);
    file << "short";
  }
  ChunkStore store(config_);
  auto result = store.Open(path_, 128);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageCorrupted);
}

}  // namespace
}  // namespace memex::storage
