/**
 * @file repository_format.h
 * @brief Binary layout of the repository file header
 *
 * Every repository file starts with a fixed 128-byte header, all integers
 * little-endian:
 *   - 7 bytes:  Magic "MEMEX01"
 *   - 1 byte:   Format major version
 *   - 1 byte:   Format minor version
 *   - 32 bytes: Creator string (NUL padded)
 *   - 8 bytes:  Created (int64, Unix seconds)
 *   - 8 bytes:  Modified (int64, Unix seconds)
 *   - 4 bytes:  Node count (uint32)
 *   - 4 bytes:  Edge count (uint32)
 *   - 8 bytes:  Node index offset (uint64, reserved, always 0)
 *   - 8 bytes:  Edge index offset (uint64, reserved, always 0)
 *   - 47 bytes: Zero padding
 *
 * Chunk records (see chunk_format.h) follow immediately after the header.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace memex::repository {

/**
 * @brief Repository header constants
 */
namespace repository_format {

// Magic string (no terminating NUL on disk)
constexpr std::array<char, 7> kMagic = {'M', 'E', 'M', 'E', 'X', '0', '1'};

// Format version written by this build
// Bump the major version for layout changes older readers cannot handle
constexpr uint8_t kMajorVersion = 1;
constexpr uint8_t kMinorVersion = 0;

constexpr size_t kHeaderSize = 128;
constexpr size_t kCreatorSize = 32;

// Field offsets
constexpr size_t kMagicOffset = 0;
constexpr size_t kMajorOffset = 7;
constexpr size_t kMinorOffset = 8;
constexpr size_t kCreatorOffset = 9;
constexpr size_t kCreatedOffset = 41;
constexpr size_t kModifiedOffset = 49;
constexpr size_t kNodeCountOffset = 57;
constexpr size_t kEdgeCountOffset = 61;
constexpr size_t kNodeIndexOffset = 65;
constexpr size_t kEdgeIndexOffset = 73;
constexpr size_t kPaddingOffset = 81;

static_assert(kPaddingOffset <= kHeaderSize, "header fields exceed header size");

}  // namespace repository_format

/**
 * @brief Decoded repository header
 */
struct RepositoryHeader {
  uint8_t major_version = repository_format::kMajorVersion;
  uint8_t minor_version = repository_format::kMinorVersion;
  std::string creator;      ///< Software that created the file (at most 32 bytes)
  int64_t created = 0;      ///< Unix seconds
  int64_t modified = 0;     ///< Unix seconds
  uint32_t node_count = 0;  ///< Live nodes
  uint32_t edge_count = 0;  ///< Live links
  uint64_t node_index = 0;  ///< Reserved
  uint64_t edge_index = 0;  ///< Reserved
};

using RepositoryHeaderBytes = std::array<uint8_t, repository_format::kHeaderSize>;

/**
 * @brief Serialize a header (creator is truncated to 32 bytes)
 */
RepositoryHeaderBytes EncodeRepositoryHeader(const RepositoryHeader& header);

/**
 * @brief Parse a header
 * @return kStorageInvalidMagic if the magic string does not match
 */
utils::Expected<RepositoryHeader, utils::Error> DecodeRepositoryHeader(const uint8_t* bytes);

/**
 * @brief Check that a file's format version can be opened by this build
 *
 * The major version must match; any minor version is accepted.
 *
 * @return kStorageVersionIncompatible on a major version mismatch
 */
utils::Expected<void, utils::Error> CheckFormatVersion(const RepositoryHeader& header);

/**
 * @brief "major.minor"
 */
std::string FormatVersionString(uint8_t major_version, uint8_t minor_version);

}  // namespace memex::repository
