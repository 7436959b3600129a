/**
 * @file chunk_store.cpp
 * @brief Append-only, reference-counted chunk store implementation
 */

#include "storage/chunk_store.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <mutex>

#include "utils/encoding.h"
#include "utils/endian.h"
#include "utils/structured_log.h"

namespace memex::storage {

namespace {

constexpr mode_t kFileMode = 0644;

/**
 * @brief pread() until @p len bytes are read
 * @return Bytes read (short only at end of file), or -1 on error
 */
ssize_t PreadFull(int fd, void* buf, size_t len, uint64_t offset) {
  auto* out = static_cast<char*>(buf);
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pread(fd, out + done, len - done, static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return -1;
    }
    if (n == 0) {
      break;
    }
    done += static_cast<size_t>(n);
  }
  return static_cast<ssize_t>(done);
}

/**
 * @brief pwrite() until all bytes are written
 */
bool PwriteFull(int fd, const void* buf, size_t len, uint64_t offset) {
  const auto* in = static_cast<const char*>(buf);
  size_t done = 0;
  while (done < len) {
    ssize_t n = ::pwrite(fd, in + done, len - done, static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    done += static_cast<size_t>(n);
  }
  return true;
}

/**
 * @brief Printable form of an address for error messages
 */
std::string DisplayAddress(std::string_view address) {
  for (char chr : address) {
    if (static_cast<unsigned char>(chr) < 0x20 || static_cast<unsigned char>(chr) >= 0x7F) {
      return utils::HexEncode(address);
    }
  }
  return std::string(address);
}

std::string OffsetContext(const std::string& path, uint64_t offset) {
  return path + "@" + std::to_string(offset);
}

}  // namespace

ChunkStore::ChunkStore(const config::StorageConfig& config) : config_(config), chunker_(config.chunker) {}

ChunkStore::~ChunkStore() {
  Close();
}

utils::Expected<void, utils::Error> ChunkStore::Open(const std::string& path, uint64_t data_offset) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (fd_.IsValid()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Chunk store is already open", path_));
  }

  utils::FDGuard guard(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, kFileMode));
  if (!guard.IsValid()) {
    std::string error_msg = std::string("Failed to open chunk store: ") + std::strerror(errno);
    utils::LogStorageError("chunk_store_open", path, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path));
  }

  path_ = path;
  data_offset_ = data_offset;
  fd_ = std::move(guard);

  auto scan_result = ScanRecords();
  if (!scan_result) {
    fd_.Close();
    by_hash_.clear();
    by_key_.clear();
    return utils::MakeUnexpected(scan_result.error());
  }

  utils::StructuredLog()
      .Event("chunk_store_open")
      .Field("filepath", path_)
      .Field("hashed_records", static_cast<uint64_t>(by_hash_.size()))
      .Field("keyed_records", static_cast<uint64_t>(by_key_.size()))
      .Field("file_size", end_offset_)
      .Debug();
  return {};
}

void ChunkStore::Close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (fd_.IsValid() && fd_.Close() != 0) {
    utils::LogStorageWarning("chunk_store_close", std::string("close() failed: ") + std::strerror(errno));
  }
  by_hash_.clear();
  by_key_.clear();
  end_offset_ = 0;
}

utils::Expected<void, utils::Error> ChunkStore::ScanRecords() {
  struct stat file_stat {};
  if (::fstat(fd_.Get(), &file_stat) != 0) {
    std::string error_msg = std::string("fstat() failed: ") + std::strerror(errno);
    utils::LogStorageError("chunk_store_scan", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
  }
  const auto file_size = static_cast<uint64_t>(file_stat.st_size);

  if (file_size < data_offset_) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageCorrupted,
                                                  "File is shorter than its header", path_));
  }

  uint64_t pos = data_offset_;
  uint64_t stray_bytes = 0;
  uint64_t stray_run = 0;  // stray bytes directly before pos
  bool torn_record = false;
  HeaderBytes header_bytes{};

  while (pos + chunk_format::kHeaderSize <= file_size) {
    ssize_t n = PreadFull(fd_.Get(), header_bytes.data(), header_bytes.size(), pos);
    if (n < 0) {
      std::string error_msg = std::string("Failed to read record header: ") + std::strerror(errno);
      utils::LogStorageError("chunk_store_scan", path_, error_msg);
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, OffsetContext(path_, pos)));
    }
    if (static_cast<size_t>(n) < header_bytes.size()) {
      break;
    }

    // Resynchronize one byte at a time on anything that is not a record
    if (utils::LoadLE32(header_bytes.data() + chunk_format::kMagicOffset) != chunk_format::kMagic) {
      ++pos;
      ++stray_bytes;
      ++stray_run;
      continue;
    }

    if (!VerifyHeaderChecksum(header_bytes.data())) {
      utils::LogStorageError("chunk_store_scan", OffsetContext(path_, pos), "header checksum mismatch");
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageChecksumMismatch,
                                                    "Chunk record header checksum mismatch",
                                                    OffsetContext(path_, pos)));
    }

    RecordHeader header = DecodeHeader(header_bytes.data());
    uint64_t next = pos + chunk_format::kHeaderSize + header.size;
    if (next > file_size) {
      // Torn append: the payload never made it to disk
      torn_record = true;
      break;
    }
    stray_run = 0;

    if (header.ref_count == 0) {
      utils::LogChunkRecordSkipped(path_, pos, "released");
      pos = next;
      continue;
    }

    IndexEntry entry;
    entry.offset = pos;
    entry.header = header;

    if (header.IsKeyed()) {
      uint8_t len_bytes[chunk_format::kKeyLengthSize];
      if (header.size < chunk_format::kKeyLengthSize ||
          PreadFull(fd_.Get(), len_bytes, sizeof(len_bytes), pos + chunk_format::kHeaderSize) !=
              static_cast<ssize_t>(sizeof(len_bytes))) {
        return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageCorrupted,
                                                      "Keyed record without key prefix",
                                                      OffsetContext(path_, pos)));
      }
      uint32_t key_len = utils::LoadLE32(len_bytes);
      if (key_len == 0 || key_len > chunk_format::kMaxKeyLength ||
          key_len > header.size - chunk_format::kKeyLengthSize) {
        return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageCorrupted,
                                                      "Keyed record with invalid key length",
                                                      OffsetContext(path_, pos)));
      }
      entry.key.resize(key_len);
      if (PreadFull(fd_.Get(), entry.key.data(), key_len,
                    pos + chunk_format::kHeaderSize + chunk_format::kKeyLengthSize) !=
          static_cast<ssize_t>(key_len)) {
        std::string error_msg = std::string("Failed to read record key: ") + std::strerror(errno);
        return utils::MakeUnexpected(
            utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, OffsetContext(path_, pos)));
      }
      // A later record under the same key supersedes an earlier one
      std::string key = entry.key;
      by_key_[key] = std::move(entry);
    } else {
      by_hash_[HashKey(header.Kind(), header.hash)] = std::move(entry);
    }

    pos = next;
  }

  if (stray_bytes > 0) {
    utils::LogStorageWarning("chunk_store_scan",
                             "Skipped " + std::to_string(stray_bytes) + " stray bytes in " + path_);
  }

  // Only a torn append is removed: a record header whose payload runs past
  // the end of the file, or a partial header right after a complete record.
  // Appends must start right after it, otherwise a later scan would read the
  // torn bytes as a header. Stray bytes the scan skipped are never removed;
  // appends go after them and the next scan resynchronizes past them.
  if (pos < file_size && (torn_record || stray_run == 0)) {
    utils::LogStorageWarning("chunk_store_scan", "Truncating " + std::to_string(file_size - pos) +
                                                     " bytes of torn record at " + OffsetContext(path_, pos));
    if (::ftruncate(fd_.Get(), static_cast<off_t>(pos)) != 0) {
      std::string error_msg = std::string("ftruncate() failed: ") + std::strerror(errno);
      utils::LogStorageError("chunk_store_scan", path_, error_msg);
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
    }
    end_offset_ = pos;
    return {};
  }

  end_offset_ = file_size;
  return {};
}

utils::Expected<std::vector<std::string>, utils::Error> ChunkStore::Put(std::string_view content, RecordKind kind) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!fd_.IsValid()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Chunk store is not open"));
  }

  std::vector<std::string> addresses;
  std::vector<std::string> stored_keys;

  for (std::string_view chunk : chunker_.Split(content)) {
    utils::Digest digest = utils::Sha256::Hash(chunk);
    std::string map_key = HashKey(kind, digest);

    auto iter = by_hash_.find(map_key);
    if (iter != by_hash_.end()) {
      RecordHeader updated = iter->second.header;
      ++updated.ref_count;
      auto write_result = WriteHeader(iter->second.offset, updated);
      if (!write_result) {
        RollbackLocked(stored_keys);
        return utils::MakeUnexpected(write_result.error());
      }
      iter->second.header.ref_count = updated.ref_count;
    } else {
      RecordHeader header;
      header.size = static_cast<uint32_t>(chunk.size());
      header.hash = digest;
      header.ref_count = 1;
      header.flags = MakeFlags(kind, false);
      auto entry = AppendRecord(header, chunk);
      if (!entry) {
        RollbackLocked(stored_keys);
        return utils::MakeUnexpected(entry.error());
      }
      by_hash_.emplace(map_key, std::move(*entry));
    }

    stored_keys.push_back(map_key);
    addresses.push_back(utils::DigestToBytes(digest));
  }

  return addresses;
}

utils::Expected<std::string, utils::Error> ChunkStore::PutWhole(std::string_view content, RecordKind kind) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!fd_.IsValid()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Chunk store is not open"));
  }
  if (content.size() > UINT32_MAX) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Record payload exceeds 4 GiB"));
  }

  utils::Digest digest = utils::Sha256::Hash(content);
  std::string map_key = HashKey(kind, digest);

  auto iter = by_hash_.find(map_key);
  if (iter != by_hash_.end()) {
    RecordHeader updated = iter->second.header;
    ++updated.ref_count;
    auto write_result = WriteHeader(iter->second.offset, updated);
    if (!write_result) {
      return utils::MakeUnexpected(write_result.error());
    }
    iter->second.header.ref_count = updated.ref_count;
    return utils::DigestToBytes(digest);
  }

  RecordHeader header;
  header.size = static_cast<uint32_t>(content.size());
  header.hash = digest;
  header.ref_count = 1;
  header.flags = MakeFlags(kind, false);
  auto entry = AppendRecord(header, content);
  if (!entry) {
    return utils::MakeUnexpected(entry.error());
  }
  by_hash_.emplace(map_key, std::move(*entry));
  return utils::DigestToBytes(digest);
}

utils::Expected<void, utils::Error> ChunkStore::PutWithID(const std::string& id, std::string_view content,
                                                          RecordKind kind) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!fd_.IsValid()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Chunk store is not open"));
  }
  if (id.empty() || id.size() > chunk_format::kMaxKeyLength) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                  "Record key must be 1 to " +
                                                      std::to_string(chunk_format::kMaxKeyLength) + " bytes"));
  }

  std::string payload = EncodeKeyedPayload(id, content);
  if (payload.size() > UINT32_MAX) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Record payload exceeds 4 GiB", id));
  }

  RecordHeader header;
  header.size = static_cast<uint32_t>(payload.size());
  header.hash = utils::Sha256::Hash(content);
  header.ref_count = 1;
  header.flags = MakeFlags(kind, true);

  // Write the new record before releasing the old one so a failed write
  // leaves the previous value in place
  auto entry = AppendRecord(header, payload);
  if (!entry) {
    return utils::MakeUnexpected(entry.error());
  }
  entry->key = id;

  auto previous = by_key_.find(id);
  if (previous != by_key_.end()) {
    RecordHeader released = previous->second.header;
    released.ref_count = 0;
    auto write_result = WriteHeader(previous->second.offset, released);
    if (!write_result) {
      utils::LogStorageWarning("put_with_id", "Failed to release superseded record for key " + id + ": " +
                                                  write_result.error().message());
    }
  }

  by_key_[id] = std::move(*entry);
  return {};
}

utils::Expected<std::string, utils::Error> ChunkStore::Get(const std::vector<std::string>& addresses) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::string result;
  for (const auto& address : addresses) {
    const IndexEntry* entry = Resolve(address, RecordKind::kContent);
    if (entry == nullptr) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageChunkNotFound, "Chunk not found",
                                                    DisplayAddress(address)));
    }
    auto value = ReadValue(*entry);
    if (!value) {
      return utils::MakeUnexpected(value.error());
    }
    result.append(*value);
  }
  return result;
}

utils::Expected<std::string, utils::Error> ChunkStore::Get(std::string_view address, RecordKind kind) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  const IndexEntry* entry = Resolve(address, kind);
  if (entry == nullptr) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageChunkNotFound, "Chunk not found", DisplayAddress(address)));
  }
  return ReadValue(*entry);
}

utils::Expected<void, utils::Error> ChunkStore::Delete(const std::vector<std::string>& addresses, RecordKind kind) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (!fd_.IsValid()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Chunk store is not open"));
  }

  for (const auto& address : addresses) {
    IndexEntry* entry = ResolveMutable(address, kind);
    if (entry == nullptr) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageChunkNotFound, "Chunk not found",
                                                    DisplayAddress(address)));
    }
    auto release_result = Release(entry);
    if (!release_result) {
      return release_result;
    }
  }
  return {};
}

bool ChunkStore::Contains(std::string_view address) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return Resolve(address, RecordKind::kContent) != nullptr;
}

utils::Expected<ChunkEntry, utils::Error> ChunkStore::Stat(std::string_view address, RecordKind kind) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const IndexEntry* entry = Resolve(address, kind);
  if (entry == nullptr) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageChunkNotFound, "Chunk not found", DisplayAddress(address)));
  }
  return ToChunkEntry(*entry);
}

std::vector<ChunkEntry> ChunkStore::ListChunks() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<ChunkEntry> entries;
  entries.reserve(by_hash_.size() + by_key_.size());
  for (const auto& [map_key, entry] : by_hash_) {
    entries.push_back(ToChunkEntry(entry));
  }
  for (const auto& [key, entry] : by_key_) {
    entries.push_back(ToChunkEntry(entry));
  }
  return entries;
}

std::vector<ChunkEntry> ChunkStore::ListChunks(RecordKind kind) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  std::vector<ChunkEntry> entries;
  for (const auto& [map_key, entry] : by_hash_) {
    if (entry.header.Kind() == kind) {
      entries.push_back(ToChunkEntry(entry));
    }
  }
  for (const auto& [key, entry] : by_key_) {
    if (entry.header.Kind() == kind) {
      entries.push_back(ToChunkEntry(entry));
    }
  }
  return entries;
}

size_t ChunkStore::GetChunkCount() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return by_hash_.size() + by_key_.size();
}

uint64_t ChunkStore::GetFileSize() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return end_offset_;
}

std::string ChunkStore::HashKey(RecordKind kind, const utils::Digest& digest) {
  std::string key(1, static_cast<char>(kind));
  key.append(reinterpret_cast<const char*>(digest.data()), digest.size());
  return key;
}

std::string ChunkStore::HashKey(RecordKind kind, std::string_view raw_digest) {
  std::string key(1, static_cast<char>(kind));
  key.append(raw_digest);
  return key;
}

const ChunkStore::IndexEntry* ChunkStore::Resolve(std::string_view address, RecordKind preferred) const {
  // The same hash may be stored once per kind; the bytes are identical, the
  // preferred kind only matters for reference counting
  auto find_hash = [&](std::string_view raw_digest) -> const IndexEntry* {
    if (raw_digest.size() != utils::kSha256Size) {
      return nullptr;
    }
    for (RecordKind kind : {preferred, RecordKind::kContent, RecordKind::kNode, RecordKind::kLink}) {
      auto iter = by_hash_.find(HashKey(kind, raw_digest));
      if (iter != by_hash_.end()) {
        return &iter->second;
      }
    }
    return nullptr;
  };

  // 1. Raw key
  auto key_iter = by_key_.find(std::string(address));
  if (key_iter != by_key_.end()) {
    return &key_iter->second;
  }
  if (const IndexEntry* entry = find_hash(address)) {
    return entry;
  }

  // 2. Hex-encoded hash
  if (utils::IsHexDigest(address)) {
    auto raw = utils::HexDecode(address);
    if (raw) {
      return find_hash(*raw);
    }
    return nullptr;
  }

  // 3. Hash suffix of a longer (prefixed) id
  constexpr size_t kHexDigestLength = utils::kSha256Size * 2;
  if (address.size() > kHexDigestLength) {
    std::string_view suffix = address.substr(address.size() - kHexDigestLength);
    if (utils::IsHexDigest(suffix)) {
      auto raw = utils::HexDecode(suffix);
      if (raw) {
        return find_hash(*raw);
      }
    }
  }

  return nullptr;
}

void ChunkStore::RollbackLocked(const std::vector<std::string>& map_keys) {
  for (auto iter = map_keys.rbegin(); iter != map_keys.rend(); ++iter) {
    auto found = by_hash_.find(*iter);
    if (found == by_hash_.end()) {
      continue;
    }
    auto release_result = Release(&found->second);
    if (!release_result) {
      utils::LogStorageWarning("chunk_store_rollback",
                               "Failed to release chunk after aborted put: " + release_result.error().message());
    }
  }
}

ChunkStore::IndexEntry* ChunkStore::ResolveMutable(std::string_view address, RecordKind preferred) {
  return const_cast<IndexEntry*>(Resolve(address, preferred));  // NOLINT(cppcoreguidelines-pro-type-const-cast)
}

utils::Expected<ChunkStore::IndexEntry, utils::Error> ChunkStore::AppendRecord(const RecordHeader& header,
                                                                              std::string_view payload) {
  HeaderBytes header_bytes = EncodeHeader(header);

  std::string buffer;
  buffer.reserve(header_bytes.size() + payload.size());
  buffer.append(reinterpret_cast<const char*>(header_bytes.data()), header_bytes.size());
  buffer.append(payload);

  if (!PwriteFull(fd_.Get(), buffer.data(), buffer.size(), end_offset_)) {
    std::string error_msg = std::string("Failed to append record: ") + std::strerror(errno);
    utils::LogStorageError("chunk_store_append", OffsetContext(path_, end_offset_), error_msg);
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, OffsetContext(path_, end_offset_)));
  }

  auto sync_result = Sync();
  if (!sync_result) {
    return utils::MakeUnexpected(sync_result.error());
  }

  IndexEntry entry;
  entry.offset = end_offset_;
  entry.header = DecodeHeader(header_bytes.data());
  end_offset_ += buffer.size();
  return entry;
}

utils::Expected<void, utils::Error> ChunkStore::WriteHeader(uint64_t offset, const RecordHeader& header) {
  HeaderBytes header_bytes = EncodeHeader(header);
  if (!PwriteFull(fd_.Get(), header_bytes.data(), header_bytes.size(), offset)) {
    std::string error_msg = std::string("Failed to update record header: ") + std::strerror(errno);
    utils::LogStorageError("chunk_store_update", OffsetContext(path_, offset), error_msg);
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, OffsetContext(path_, offset)));
  }
  return Sync();
}

utils::Expected<void, utils::Error> ChunkStore::Release(IndexEntry* entry) {
  RecordHeader updated = entry->header;
  if (updated.ref_count > 0) {
    --updated.ref_count;
  }

  auto write_result = WriteHeader(entry->offset, updated);
  if (!write_result) {
    return write_result;
  }

  if (updated.ref_count > 0) {
    entry->header.ref_count = updated.ref_count;
    return {};
  }

  // Last reference: drop the index entry, the bytes stay on disk
  if (updated.IsKeyed()) {
    std::string key = entry->key;
    by_key_.erase(key);
  } else {
    by_hash_.erase(HashKey(updated.Kind(), updated.hash));
  }
  return {};
}

utils::Expected<std::string, utils::Error> ChunkStore::ReadValue(const IndexEntry& entry) const {
  std::string payload(entry.header.size, '\0');
  ssize_t n = PreadFull(fd_.Get(), payload.data(), payload.size(), entry.offset + chunk_format::kHeaderSize);
  if (n < 0 || static_cast<size_t>(n) != payload.size()) {
    std::string error_msg = n < 0 ? std::string("Failed to read record: ") + std::strerror(errno)
                                  : std::string("Record payload truncated");
    utils::LogStorageError("chunk_store_read", OffsetContext(path_, entry.offset), error_msg);
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, OffsetContext(path_, entry.offset)));
  }

  if (entry.header.IsKeyed()) {
    auto parts = DecodeKeyedPayload(payload);
    if (!parts) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageCorrupted,
                                                    "Keyed record with invalid key prefix",
                                                    OffsetContext(path_, entry.offset)));
    }
    payload = std::string(parts->second);
  }

  if (config_.verify_hashes && utils::Sha256::Hash(payload) != entry.header.hash) {
    utils::LogStorageError("chunk_store_read", OffsetContext(path_, entry.offset), "payload hash mismatch");
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageHashMismatch,
                                                  "Chunk payload does not match its hash",
                                                  OffsetContext(path_, entry.offset)));
  }

  return payload;
}

utils::Expected<void, utils::Error> ChunkStore::Sync() {
  if (!config_.sync_writes) {
    return {};
  }
  if (::fsync(fd_.Get()) != 0) {
    std::string error_msg = std::string("fsync() failed: ") + std::strerror(errno);
    utils::LogStorageError("chunk_store_sync", path_, error_msg);
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStorageIOError, error_msg, path_));
  }
  return {};
}

ChunkEntry ChunkStore::ToChunkEntry(const IndexEntry& entry) {
  ChunkEntry result;
  result.kind = entry.header.Kind();
  result.keyed = entry.header.IsKeyed();
  result.ref_count = entry.header.ref_count;
  result.offset = entry.offset;
  if (result.keyed) {
    result.address = entry.key;
    result.size = entry.header.size - static_cast<uint32_t>(chunk_format::kKeyLengthSize + entry.key.size());
  } else {
    result.address = utils::DigestToBytes(entry.header.hash);
    result.size = entry.header.size;
  }
  return result;
}

}  // namespace memex::storage
