/**
 * @file tar_archive.cpp
 * @brief ustar archive and gzip implementation
 */

#include "migration/tar_archive.h"

#include <zlib.h>

#include <array>
#include <cstdio>
#include <cstring>

namespace memex::migration {

namespace {

using HeaderBlock = std::array<char, tar_format::kBlockSize>;

// zlib windowBits: 15 plus 16 selects the gzip wrapper, plus 32 auto-detects on inflate
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kInflateAutoWindowBits = 15 + 32;
constexpr int kMemLevel = 8;
constexpr size_t kInflateChunk = 64 * 1024;

/**
 * @brief Write @p value as zero-padded octal digits followed by NUL
 */
void WriteOctal(char* dest, size_t size, uint64_t value) {
  size_t digits = size - 1;
  dest[digits] = '\0';
  for (size_t i = digits; i > 0; --i) {
    dest[i - 1] = static_cast<char>('0' + (value & 7));
    value >>= 3;
  }
}

/**
 * @brief Parse an octal field (leading spaces allowed, NUL or space terminated)
 */
bool ParseOctal(const char* data, size_t size, uint64_t* out) {
  uint64_t result = 0;
  size_t i = 0;
  while (i < size && data[i] == ' ') {
    ++i;
  }
  bool any = false;
  for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
    if (data[i] < '0' || data[i] > '7') {
      return false;
    }
    result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
    any = true;
  }
  *out = result;
  return any;
}

/**
 * @brief Header checksum, counting the checksum field as spaces
 */
uint32_t ComputeChecksum(const char* block) {
  uint32_t sum = 0;
  for (size_t i = 0; i < tar_format::kBlockSize; ++i) {
    if (i >= tar_format::kChecksumOffset && i < tar_format::kChecksumOffset + tar_format::kChecksumSize) {
      sum += static_cast<uint32_t>(' ');
    } else {
      sum += static_cast<unsigned char>(block[i]);
    }
  }
  return sum;
}

bool IsZeroBlock(const char* block) {
  for (size_t i = 0; i < tar_format::kBlockSize; ++i) {
    if (block[i] != '\0') {
      return false;
    }
  }
  return true;
}

/**
 * @brief NUL-terminated (or full-width) string field
 */
std::string ReadField(const char* data, size_t size) {
  size_t len = 0;
  while (len < size && data[len] != '\0') {
    ++len;
  }
  return std::string(data, len);
}

/**
 * @brief Split a long name into (prefix, name) at a '/' boundary
 */
bool SplitName(const std::string& path, std::string* prefix, std::string* name) {
  if (path.size() <= tar_format::kNameSize) {
    prefix->clear();
    *name = path;
    return true;
  }
  // The name part must fit in 100 bytes, the prefix in 155
  size_t split = path.rfind('/', tar_format::kPrefixSize);
  if (split == std::string::npos || split == 0 || split + 1 == path.size() ||
      path.size() - split - 1 > tar_format::kNameSize) {
    return false;
  }
  *prefix = path.substr(0, split);
  *name = path.substr(split + 1);
  return true;
}

utils::Unexpected<utils::Error> InvalidArchive(const std::string& message, size_t offset) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationInvalidArchive, message,
                                                "offset " + std::to_string(offset)));
}

}  // namespace

// ============================================================================
// Writer
// ============================================================================

bool TarWriter::FitsHeader(const std::string& name) {
  std::string prefix;
  std::string base;
  return !name.empty() && SplitName(name, &prefix, &base);
}

utils::Expected<void, utils::Error> TarWriter::AddFile(const std::string& name, std::string_view data,
                                                       int64_t mtime) {
  std::string prefix;
  std::string base;
  if (name.empty() || !SplitName(name, &prefix, &base)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Entry name cannot be stored in a ustar header", name));
  }
  if (data.size() > tar_format::kMaxEntrySize) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Entry too large", name));
  }

  HeaderBlock header{};
  std::memcpy(header.data() + tar_format::kNameOffset, base.data(), base.size());
  std::memcpy(header.data() + tar_format::kPrefixOffset, prefix.data(), prefix.size());
  WriteOctal(header.data() + tar_format::kModeOffset, tar_format::kModeSize, tar_format::kFileMode);
  WriteOctal(header.data() + tar_format::kUidOffset, tar_format::kIdSize, 0);
  WriteOctal(header.data() + tar_format::kGidOffset, tar_format::kIdSize, 0);
  WriteOctal(header.data() + tar_format::kSizeOffset, tar_format::kSizeSize, data.size());
  WriteOctal(header.data() + tar_format::kMtimeOffset, tar_format::kMtimeSize,
             mtime > 0 ? static_cast<uint64_t>(mtime) : 0);
  header[tar_format::kTypeflagOffset] = tar_format::kRegularFile;
  std::memcpy(header.data() + tar_format::kMagicOffset, "ustar", 6);
  header[tar_format::kVersionOffset] = '0';
  header[tar_format::kVersionOffset + 1] = '0';

  // Six octal digits, NUL, space
  uint32_t checksum = ComputeChecksum(header.data());
  char checksum_str[tar_format::kChecksumSize];
  std::snprintf(checksum_str, sizeof(checksum_str), "%06o", checksum);
  std::memcpy(header.data() + tar_format::kChecksumOffset, checksum_str, 6);
  header[tar_format::kChecksumOffset + 6] = '\0';
  header[tar_format::kChecksumOffset + 7] = ' ';

  buffer_.append(header.data(), header.size());
  buffer_.append(data);
  size_t padding = (tar_format::kBlockSize - data.size() % tar_format::kBlockSize) % tar_format::kBlockSize;
  buffer_.append(padding, '\0');
  return {};
}

std::string TarWriter::Finish() {
  buffer_.append(2 * tar_format::kBlockSize, '\0');
  std::string result;
  result.swap(buffer_);
  return result;
}

// ============================================================================
// Reader
// ============================================================================

utils::Expected<std::vector<TarEntry>, utils::Error> ReadTarArchive(std::string_view data) {
  std::vector<TarEntry> entries;
  size_t pos = 0;

  while (pos + tar_format::kBlockSize <= data.size()) {
    const char* block = data.data() + pos;
    if (IsZeroBlock(block)) {
      return entries;
    }

    uint64_t stored_checksum = 0;
    if (!ParseOctal(block + tar_format::kChecksumOffset, tar_format::kChecksumSize, &stored_checksum) ||
        stored_checksum != ComputeChecksum(block)) {
      return InvalidArchive("Tar header checksum mismatch", pos);
    }

    uint64_t size = 0;
    if (!ParseOctal(block + tar_format::kSizeOffset, tar_format::kSizeSize, &size)) {
      return InvalidArchive("Tar header has an invalid size field", pos);
    }
    size_t data_start = pos + tar_format::kBlockSize;
    if (size > data.size() - data_start) {
      return InvalidArchive("Tar entry extends past the end of the archive", pos);
    }

    char typeflag = block[tar_format::kTypeflagOffset];
    if (typeflag == tar_format::kRegularFile || typeflag == tar_format::kRegularFileOld) {
      TarEntry entry;
      std::string prefix = ReadField(block + tar_format::kPrefixOffset, tar_format::kPrefixSize);
      entry.name = ReadField(block + tar_format::kNameOffset, tar_format::kNameSize);
      if (!prefix.empty()) {
        entry.name = prefix + "/" + entry.name;
      }
      entry.data.assign(data.data() + data_start, size);
      entries.push_back(std::move(entry));
    }

    size_t padded = (size + tar_format::kBlockSize - 1) / tar_format::kBlockSize * tar_format::kBlockSize;
    pos = data_start + padded;
  }

  // Some writers omit the end-of-archive blocks; a clean end on a block boundary is accepted
  if (pos >= data.size()) {
    return entries;
  }
  return InvalidArchive("Truncated tar header", pos);
}

// ============================================================================
// gzip
// ============================================================================

bool IsGzip(std::string_view data) {
  return data.size() >= 2 && static_cast<unsigned char>(data[0]) == 0x1F &&
         static_cast<unsigned char>(data[1]) == 0x8B;
}

utils::Expected<std::string, utils::Error> GzipCompress(std::string_view data) {
  z_stream strm{};
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) !=
      Z_OK) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kMigrationCompressionError, "deflateInit2 failed"));
  }

  std::string output(deflateBound(&strm, static_cast<uLong>(data.size())), '\0');
  // zlib's API takes non-const input pointers
  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));  // NOLINT
  strm.avail_in = static_cast<uInt>(data.size());
  strm.next_out = reinterpret_cast<Bytef*>(output.data());
  strm.avail_out = static_cast<uInt>(output.size());

  int ret = deflate(&strm, Z_FINISH);
  size_t written = strm.total_out;
  deflateEnd(&strm);

  if (ret != Z_STREAM_END) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationCompressionError,
                                                  "deflate failed with code " + std::to_string(ret)));
  }
  output.resize(written);
  return output;
}

utils::Expected<std::string, utils::Error> GzipDecompress(std::string_view data) {
  z_stream strm{};
  if (inflateInit2(&strm, kInflateAutoWindowBits) != Z_OK) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kMigrationCompressionError, "inflateInit2 failed"));
  }

  strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));  // NOLINT
  strm.avail_in = static_cast<uInt>(data.size());

  std::string output;
  std::array<char, kInflateChunk> buffer{};
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    strm.next_out = reinterpret_cast<Bytef*>(buffer.data());
    strm.avail_out = static_cast<uInt>(buffer.size());
    ret = inflate(&strm, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&strm);
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationCompressionError,
                                                    "inflate failed with code " + std::to_string(ret)));
    }
    output.append(buffer.data(), buffer.size() - strm.avail_out);
    if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
      inflateEnd(&strm);
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kMigrationCompressionError, "Truncated gzip stream"));
    }
  }

  inflateEnd(&strm);
  return output;
}

}  // namespace memex::migration
