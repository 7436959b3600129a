/**
 * @file chunk_store.h
 * @brief Append-only, reference-counted chunk store
 *
 * Records are appended to a single file and never moved. The in-memory index
 * is rebuilt by scanning the file on Open(); deleting a record only drops its
 * reference count and index entry, the bytes stay on disk.
 */

#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "config/config.h"
#include "storage/chunk_format.h"
#include "storage/chunker.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/fd_guard.h"

namespace memex::storage {

/**
 * @brief One live record as reported by ListChunks()
 */
struct ChunkEntry {
  std::string address;     ///< Raw 32-byte hash, or the caller's key for keyed records
  RecordKind kind = RecordKind::kContent;
  bool keyed = false;      ///< Stored with PutWithID()
  uint32_t size = 0;       ///< Value size in bytes
  uint32_t ref_count = 0;  ///< Current reference count
  uint64_t offset = 0;     ///< Header offset in the file
};

/**
 * @brief Content-addressed chunk store with caller-keyed entries
 *
 * Two explicit maps are kept: content hash -> record for deduplicated
 * entries and key -> record for entries stored under a caller-chosen id.
 * Lookups accept an address in any of these representations, tried in order:
 * - the address as a raw key (caller id, or 32-byte hash)
 * - the address as a 64-character hex hash
 * - the last 64 characters of a longer string as a hex hash
 *
 * Thread-safety: mutations take an exclusive lock; reads take a shared lock.
 */
class ChunkStore {
 public:
  /**
   * @brief Construct a closed store
   * @param config Storage configuration (chunker sizes, sync and verify policy)
   */
  explicit ChunkStore(const config::StorageConfig& config);

  ~ChunkStore();

  ChunkStore(const ChunkStore&) = delete;
  ChunkStore& operator=(const ChunkStore&) = delete;
  ChunkStore(ChunkStore&&) = delete;
  ChunkStore& operator=(ChunkStore&&) = delete;

  /**
   * @brief Open (creating if missing) a store file and rebuild the index
   *
   * @param path File path
   * @param data_offset Offset of the first record (bytes before it belong to the owner)
   * @return Error on I/O failure or on a record whose header checksum does not match
   */
  utils::Expected<void, utils::Error> Open(const std::string& path, uint64_t data_offset = 0);

  /**
   * @brief Close the file and clear the index
   */
  void Close();

  /**
   * @brief Split content into chunks and store each one
   *
   * Already indexed chunks get their reference count incremented; new
   * chunks are appended with a count of one.
   *
   * @param content Bytes to store
   * @param kind Record kind for newly written chunks
   * @return Raw 32-byte chunk addresses in content order
   */
  utils::Expected<std::vector<std::string>, utils::Error> Put(std::string_view content,
                                                              RecordKind kind = RecordKind::kContent);

  /**
   * @brief Store content as one hash-addressed record without chunking
   * @return Raw 32-byte address
   */
  utils::Expected<std::string, utils::Error> PutWhole(std::string_view content, RecordKind kind);

  /**
   * @brief Store content verbatim under a caller-chosen key
   *
   * Any live record under the same key is released once the new one is durable.
   */
  utils::Expected<void, utils::Error> PutWithID(const std::string& id, std::string_view content,
                                                RecordKind kind = RecordKind::kContent);

  /**
   * @brief Read and concatenate the values of several addresses
   * @return kStorageChunkNotFound if any address does not resolve
   */
  utils::Expected<std::string, utils::Error> Get(const std::vector<std::string>& addresses) const;

  /**
   * @brief Read the value of one address
   * @param kind Preferred record kind when one hash is stored with several kinds
   */
  utils::Expected<std::string, utils::Error> Get(std::string_view address,
                                                 RecordKind kind = RecordKind::kContent) const;

  /**
   * @brief Decrement reference counts, dropping index entries that reach zero
   *
   * @param addresses Addresses to release
   * @param kind Preferred record kind when one hash is stored with several kinds
   */
  utils::Expected<void, utils::Error> Delete(const std::vector<std::string>& addresses,
                                             RecordKind kind = RecordKind::kContent);

  /**
   * @brief Check whether an address resolves
   */
  bool Contains(std::string_view address) const;

  /**
   * @brief Look up the live record behind an address
   * @param kind Preferred record kind when one hash is stored with several kinds
   */
  utils::Expected<ChunkEntry, utils::Error> Stat(std::string_view address,
                                                  RecordKind kind = RecordKind::kContent) const;

  /**
   * @brief Enumerate live records, each reported once
   */
  std::vector<ChunkEntry> ListChunks() const;

  /**
   * @brief Enumerate live records of one kind
   */
  std::vector<ChunkEntry> ListChunks(RecordKind kind) const;

  /**
   * @brief Number of live records
   */
  size_t GetChunkCount() const;

  /**
   * @brief Current file size (records are appended here)
   */
  uint64_t GetFileSize() const;

  [[nodiscard]] const std::string& GetPath() const { return path_; }
  [[nodiscard]] const Chunker& GetChunker() const { return chunker_; }
  [[nodiscard]] bool IsOpen() const { return fd_.IsValid(); }

 private:
  /**
   * @brief Index entry for a live record
   */
  struct IndexEntry {
    uint64_t offset = 0;  ///< Header offset
    RecordHeader header;  ///< Cached header
    std::string key;      ///< Caller key (keyed records only)
  };

  /// Hash map key: kind byte followed by the raw digest
  static std::string HashKey(RecordKind kind, const utils::Digest& digest);
  static std::string HashKey(RecordKind kind, std::string_view raw_digest);

  // Both helpers expect the caller to hold mutex_
  const IndexEntry* Resolve(std::string_view address, RecordKind preferred) const;
  IndexEntry* ResolveMutable(std::string_view address, RecordKind preferred);

  utils::Expected<void, utils::Error> ScanRecords();
  utils::Expected<IndexEntry, utils::Error> AppendRecord(const RecordHeader& header, std::string_view payload);
  utils::Expected<void, utils::Error> WriteHeader(uint64_t offset, const RecordHeader& header);
  utils::Expected<void, utils::Error> Release(IndexEntry* entry);
  void RollbackLocked(const std::vector<std::string>& map_keys);
  utils::Expected<std::string, utils::Error> ReadValue(const IndexEntry& entry) const;
  utils::Expected<void, utils::Error> Sync();

  static ChunkEntry ToChunkEntry(const IndexEntry& entry);

  config::StorageConfig config_;
  Chunker chunker_;
  std::string path_;
  utils::FDGuard fd_;
  uint64_t data_offset_ = 0;
  uint64_t end_offset_ = 0;

  std::unordered_map<std::string, IndexEntry> by_hash_;  ///< kind + digest -> record
  std::unordered_map<std::string, IndexEntry> by_key_;   ///< caller key -> record

  mutable std::shared_mutex mutex_;
};

}  // namespace memex::storage
