/**
 * @file chunker_test.cpp
 * @brief Unit tests for content-defined chunking
 */

#include "storage/chunker.h"

#include <gtest/gtest.h>

#include <random>
#include <string>

namespace memex::storage {
namespace {

config::ChunkerConfig MakeConfig(uint32_t min_size = 256, uint32_t avg_size = 1024, uint32_t max_size = 4096) {
  config::ChunkerConfig config;
  config.min_size = min_size;
  config.avg_size = avg_size;
  config.max_size = max_size;
  return config;
}

std::string RandomBytes(size_t size, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string bytes(size, '\0');
  for (auto& byte : bytes) {
    byte = static_cast<char>(dist(rng));
  }
  return bytes;
}

std::string Join(const std::vector<std::string_view>& chunks) {
  std::string joined;
  for (auto chunk : chunks) {
    joined.append(chunk);
  }
  return joined;
}

// ============================================================================
// Boundaries
// ============================================================================

TEST(ChunkerTest, EmptyInputYieldsNoChunks) {
  Chunker chunker(MakeConfig());
  EXPECT_TRUE(chunker.Split("").empty());
}

TEST(ChunkerTest, SmallInputIsOneChunk) {
  Chunker chunker(MakeConfig());
  std::string data = "node1";
  auto chunks = chunker.Split(data);
  ASSERT_EQ(chunks.size(), 1);
  EXPECT_EQ(chunks[0], "node1");
}

TEST(ChunkerTest, ChunksConcatenateToInput) {
  Chunker chunker(MakeConfig());
  std::string data = RandomBytes(100000, 1);
  auto chunks = chunker.Split(data);
  EXPECT_GT(chunks.size(), 1);
  EXPECT_EQ(Join(chunks), data);
}

TEST(ChunkerTest, ChunkSizesRespectBounds) {
  Chunker chunker(MakeConfig());
  std::string data = RandomBytes(200000, 2);
  auto chunks = chunker.Split(data);
  ASSERT_FALSE(chunks.empty());
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_LE(chunks[i].size(), chunker.GetMaxSize());
    if (i + 1 < chunks.size()) {
      EXPECT_GE(chunks[i].size(), chunker.GetMinSize()) << "chunk " << i;
    }
  }
}

TEST(ChunkerTest, ForcedCutOnUniformInput) {
  // A run of one byte value never matches the mask, so every cut is forced
  Chunker chunker(MakeConfig());
  std::string data(4096 * 3, '\0');
  auto chunks = chunker.Split(data);
  for (auto chunk : chunks) {
    EXPECT_LE(chunk.size(), 4096);
  }
  EXPECT_EQ(Join(chunks), data);
}

TEST(ChunkerTest, Deterministic) {
  Chunker chunker(MakeConfig());
  std::string data = RandomBytes(50000, 3);
  auto first = chunker.Split(data);
  auto second = chunker.Split(data);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].size(), second[i].size());
  }
}

// ============================================================================
// Locality
// ============================================================================

TEST(ChunkerTest, PrefixInsertionKeepsLaterChunks) {
  Chunker chunker(MakeConfig());
  std::string original = RandomBytes(100000, 4);
  std::string edited = "inserted bytes at the front" + original;

  auto before = chunker.Split(original);
  auto after = chunker.Split(edited);

  // Boundaries resynchronize, so the tail chunks are shared
  size_t shared = 0;
  auto before_it = before.rbegin();
  auto after_it = after.rbegin();
  while (before_it != before.rend() && after_it != after.rend() && *before_it == *after_it) {
    ++shared;
    ++before_it;
    ++after_it;
  }
  EXPECT_GE(shared, before.size() / 2);
}

TEST(ChunkerTest, CutNeverExceedsInput) {
  Chunker chunker(MakeConfig());
  std::string data = RandomBytes(300, 5);
  EXPECT_EQ(chunker.Cut(std::string_view(data).substr(0, 100)), 100);
  size_t cut = chunker.Cut(data);
  EXPECT_GE(cut, 1);
  EXPECT_LE(cut, data.size());
}

}  // namespace
}  // namespace memex::storage
