/**
 * @file action_log.h
 * @brief Append-only, hash-chained log of repository mutations
 *
 * File format: a sequence of records, each a 4-byte little-endian length
 * followed by that many bytes of compact JSON (see action.h). Records are
 * never rewritten. A torn tail left by a crash mid-append is moved to the
 * "<log>.torn" sidecar and replaced by a recover_tail action describing it.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "actions/action.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/fd_guard.h"
#include "utils/sha256.h"

namespace memex::actions {

// Upper bound on a single record, protects the reader from garbage lengths
constexpr uint32_t kMaxRecordSize = 64 * 1024 * 1024;

// Length prefix size
constexpr size_t kLengthPrefixSize = 4;

// Suffix of the file that receives torn tails
constexpr const char* kTornSuffix = ".torn";

/**
 * @brief Hash-chained action log
 *
 * Thread-safety: all operations serialize on one internal mutex.
 */
class ActionLog {
 public:
  /**
   * @param sync_writes fsync() after every appended record
   */
  explicit ActionLog(bool sync_writes = true);

  ~ActionLog();

  ActionLog(const ActionLog&) = delete;
  ActionLog& operator=(const ActionLog&) = delete;
  ActionLog(ActionLog&&) = delete;
  ActionLog& operator=(ActionLog&&) = delete;

  /**
   * @brief Log file location for a repository file
   *
   * @param repository_path Path of the repository file
   * @param dir_name Directory name created next to the repository file
   * @return "<repository dir>/<dir_name>/<repository file name>.log"
   */
  static std::string LogPathFor(const std::string& repository_path, const std::string& dir_name);

  /**
   * @brief Open (creating directory and file if missing) and recover the chain head
   *
   * The last valid record is found by scanning backward from the end of the
   * file. When the bytes after it start a record that runs past the end of
   * the file (or the file holds nothing but such a record), they are copied
   * to "<path>.torn", cut from the log, and a recover_tail action recording
   * their offset, size and SHA-256 is appended. Any other trailing bytes are
   * left in place.
   *
   * @return kActionLogCorrupted if the file holds no valid record and does
   *         not start with a torn one
   */
  utils::Expected<void, utils::Error> Open(const std::string& path);

  /**
   * @brief Close the log file
   */
  void Close();

  /**
   * @brief Append an action chained to the current head
   *
   * @param type Action type (see action_types)
   * @param payload Operation arguments
   * @param state_hash Digest of the affected entity after the mutation (zeros when it no longer exists)
   * @return The recorded action including its self hash
   */
  utils::Expected<Action, utils::Error> RecordAction(const std::string& type, const nlohmann::json& payload,
                                                     const utils::Digest& state_hash = utils::ZeroDigest());

  /**
   * @brief Read all actions in order
   * @return kActionLogCorrupted if a record is truncated or unparsable
   */
  utils::Expected<std::vector<Action>, utils::Error> GetHistory() const;

  /**
   * @brief Check the hash chain
   *
   * @return true if every record hashes to its stored self hash and links to
   *         its predecessor; false on the first mismatch or unreadable record.
   *         An error is returned only when the file itself cannot be read.
   */
  utils::Expected<bool, utils::Error> VerifyHistory() const;

  /**
   * @brief Hash of the most recent action (zeros for an empty log)
   */
  std::string GetLastHash() const;

  [[nodiscard]] const std::string& GetPath() const { return path_; }

 private:
  utils::Expected<std::string, utils::Error> ReadFile() const;
  utils::Expected<void, utils::Error> RecoverLastHash();
  utils::Expected<void, utils::Error> SetAsideTail(const std::string& data, size_t offset);
  utils::Expected<Action, utils::Error> AppendLocked(const std::string& type, const nlohmann::json& payload,
                                                     const utils::Digest& state_hash);

  bool sync_writes_;
  std::string path_;
  utils::FDGuard fd_;
  std::string last_hash_;
  mutable std::mutex mutex_;
};

/**
 * @brief Split log bytes into JSON records
 * @return kActionLogCorrupted on a truncated or unparsable record
 */
utils::Expected<std::vector<nlohmann::json>, utils::Error> ParseRecords(const std::string& data);

}  // namespace memex::actions
