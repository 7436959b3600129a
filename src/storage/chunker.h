/**
 * @file chunker.h
 * @brief Content-defined chunking with a gear rolling hash
 *
 * Boundaries depend only on the bytes around them, so an insertion or
 * deletion in one region of a payload leaves the chunks of unrelated regions
 * unchanged and they deduplicate against earlier versions.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "config/config.h"

namespace memex::storage {

/**
 * @brief Splits byte payloads into variable-length chunks
 *
 * Normalized chunking: before the average size a mask with more bits makes a
 * cut less likely, after it a mask with fewer bits makes it more likely. No
 * cut happens before min_size and one is forced at max_size.
 *
 * The chunker holds no mutable state; Split() may be called concurrently.
 */
class Chunker {
 public:
  /**
   * @brief Construct from chunker configuration
   *
   * Sizes must have passed config::ValidateConfig().
   */
  explicit Chunker(const config::ChunkerConfig& config);

  /**
   * @brief Split a payload into chunks
   *
   * @param data Payload bytes
   * @return Slices of @p data in order; their concatenation equals @p data.
   *         Empty input yields no chunks.
   */
  std::vector<std::string_view> Split(std::string_view data) const;

  /**
   * @brief Length of the first chunk of @p data
   *
   * @param data Remaining payload (non-empty)
   * @return Cut position in [1, max_size]
   */
  size_t Cut(std::string_view data) const;

  [[nodiscard]] size_t GetMinSize() const { return min_size_; }
  [[nodiscard]] size_t GetAvgSize() const { return avg_size_; }
  [[nodiscard]] size_t GetMaxSize() const { return max_size_; }

 private:
  size_t min_size_;
  size_t avg_size_;
  size_t max_size_;
  uint32_t mask_strict_;  ///< Applied before the average size
  uint32_t mask_loose_;   ///< Applied after the average size
};

}  // namespace memex::storage
