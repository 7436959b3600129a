/**
 * @file chunker.cpp
 * @brief Content-defined chunking implementation
 */

#include "storage/chunker.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace memex::storage {

namespace {

constexpr size_t kGearTableSize = 256;

/**
 * @brief Build the gear table from a fixed splitmix64 sequence
 *
 * The table is part of the on-disk contract: changing the seed changes every
 * chunk boundary and defeats deduplication against existing repositories.
 */
constexpr std::array<uint32_t, kGearTableSize> MakeGearTable() {
  std::array<uint32_t, kGearTableSize> table{};
  uint64_t state = 0x6D656D6578434443ULL;  // "memexCDC"
  for (size_t i = 0; i < kGearTableSize; ++i) {
    state += 0x9E3779B97F4A7C15ULL;
    uint64_t mixed = state;
    mixed = (mixed ^ (mixed >> 30)) * 0xBF58476D1CE4E5B9ULL;
    mixed = (mixed ^ (mixed >> 27)) * 0x94D049BB133111EBULL;
    mixed ^= mixed >> 31;
    table[i] = static_cast<uint32_t>(mixed >> 32);
  }
  return table;
}

constexpr std::array<uint32_t, kGearTableSize> kGearTable = MakeGearTable();

inline uint32_t Roll(uint32_t hash, char byte) {
  return (hash >> 1) + kGearTable[static_cast<uint8_t>(byte)];
}

}  // namespace

Chunker::Chunker(const config::ChunkerConfig& config)
    : min_size_(config.min_size), avg_size_(config.avg_size), max_size_(config.max_size) {
  int bits = static_cast<int>(std::lround(std::log2(static_cast<double>(avg_size_))));
  mask_strict_ = (1U << (bits + 1)) - 1;
  mask_loose_ = (1U << (bits - 1)) - 1;
}

size_t Chunker::Cut(std::string_view data) const {
  if (data.size() <= min_size_) {
    return data.size();
  }
  size_t len = std::min(data.size(), max_size_);
  size_t limit = std::min(avg_size_, len);

  size_t offset = min_size_;
  uint32_t hash = 0;

  while (offset < limit) {
    hash = Roll(hash, data[offset++]);
    if ((hash & mask_strict_) == 0) {
      return offset;
    }
  }
  while (offset < len) {
    hash = Roll(hash, data[offset++]);
    if ((hash & mask_loose_) == 0) {
      return offset;
    }
  }

  return len;
}

std::vector<std::string_view> Chunker::Split(std::string_view data) const {
  std::vector<std::string_view> chunks;
  if (!data.empty()) {
    chunks.reserve(data.size() / avg_size_ + 1);
  }

  while (!data.empty()) {
    size_t cut = Cut(data);
    chunks.push_back(data.substr(0, cut));
    data.remove_prefix(cut);
  }

  return chunks;
}

}  // namespace memex::storage
