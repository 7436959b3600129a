/**
 * @file tar_archive.h
 * @brief Minimal POSIX ustar archive writer/reader with optional gzip
 *
 * Only regular files are written. The reader returns regular files and
 * skips every other entry type (directories, pax headers, links).
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace memex::migration {

/**
 * @brief ustar layout constants
 */
namespace tar_format {
constexpr size_t kBlockSize = 512;
constexpr size_t kNameSize = 100;
constexpr size_t kPrefixSize = 155;

// Field offsets within a header block
constexpr size_t kNameOffset = 0;
constexpr size_t kModeOffset = 100;
constexpr size_t kUidOffset = 108;
constexpr size_t kGidOffset = 116;
constexpr size_t kSizeOffset = 124;
constexpr size_t kMtimeOffset = 136;
constexpr size_t kChecksumOffset = 148;
constexpr size_t kTypeflagOffset = 156;
constexpr size_t kMagicOffset = 257;
constexpr size_t kVersionOffset = 263;
constexpr size_t kPrefixOffset = 345;

// Field sizes
constexpr size_t kModeSize = 8;
constexpr size_t kIdSize = 8;
constexpr size_t kSizeSize = 12;
constexpr size_t kMtimeSize = 12;
constexpr size_t kChecksumSize = 8;

constexpr char kRegularFile = '0';
constexpr char kRegularFileOld = '\0';
constexpr uint32_t kFileMode = 0644;

// Largest size representable in 11 octal digits
constexpr uint64_t kMaxEntrySize = 077777777777ULL;
}  // namespace tar_format

/**
 * @brief One regular file in an archive
 */
struct TarEntry {
  std::string name;
  std::string data;
};

/**
 * @brief Builds an archive in memory
 */
class TarWriter {
 public:
  /**
   * @brief Append a regular file
   *
   * Names longer than 100 bytes are split into the ustar prefix field at a
   * '/' boundary.
   *
   * @return kInvalidArgument if the name cannot be represented
   */
  utils::Expected<void, utils::Error> AddFile(const std::string& name, std::string_view data, int64_t mtime);

  /**
   * @brief Terminate the archive (two zero blocks) and return its bytes
   */
  std::string Finish();

  /**
   * @brief Whether a name fits in the header (directly or with a prefix split)
   */
  static bool FitsHeader(const std::string& name);

 private:
  std::string buffer_;
};

/**
 * @brief Parse an uncompressed archive
 * @return kMigrationInvalidArchive on a bad checksum, bad size or truncation
 */
utils::Expected<std::vector<TarEntry>, utils::Error> ReadTarArchive(std::string_view data);

/**
 * @brief Check for the gzip magic bytes
 */
bool IsGzip(std::string_view data);

/**
 * @brief gzip-compress a buffer (zlib deflate with a gzip wrapper)
 */
utils::Expected<std::string, utils::Error> GzipCompress(std::string_view data);

/**
 * @brief Decompress a gzip buffer
 * @return kMigrationCompressionError on a corrupt or truncated stream
 */
utils::Expected<std::string, utils::Error> GzipDecompress(std::string_view data);

}  // namespace memex::migration
