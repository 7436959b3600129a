/**
 * @file repository.h
 * @brief Graph repository: nodes and links over a chunk store and an action log
 *
 * A repository is one file: a 128-byte header (repository_format.h) followed
 * by chunk records (chunk_format.h). Node content is chunked and deduplicated;
 * node and link envelopes are stored as whole records of their own kind.
 * Every mutation is appended to a hash-chained action log kept in a directory
 * next to the file.
 *
 * Lifecycle: construct, then Create() or Open(), then any number of
 * operations, then Close(). A closed repository cannot be reopened; every
 * operation on it returns kRepositoryClosed.
 */

#pragma once

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "actions/action_log.h"
#include "config/config.h"
#include "repository/node.h"
#include "repository/repository_format.h"
#include "storage/chunk_store.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/fd_guard.h"
#include "utils/time_utils.h"

namespace memex::repository {

/**
 * @brief Summary returned by Repository::GetStats()
 */
struct RepositoryStats {
  RepositoryHeader header;     ///< Current header (counters, timestamps, version)
  size_t chunk_count = 0;      ///< Live chunk store records of all kinds
  uint64_t file_size = 0;      ///< Repository file size in bytes
  std::string path;            ///< Repository file
  std::string action_log_path;  ///< Action log file
};

/**
 * @brief File-backed graph repository
 *
 * Thread-safety: mutations are serialized on an exclusive lock, reads share it.
 */
class Repository {
 public:
  /**
   * @param config Storage and action log settings (other sections are ignored)
   */
  explicit Repository(const config::Config& config = config::Config());

  ~Repository();

  Repository(const Repository&) = delete;
  Repository& operator=(const Repository&) = delete;
  Repository(Repository&&) = delete;
  Repository& operator=(Repository&&) = delete;

  /**
   * @brief Create a new repository file
   *
   * @return kRepositoryExists if the file (or a non-empty action log for it) exists
   */
  utils::Expected<void, utils::Error> Create(const std::string& path);

  /**
   * @brief Open an existing repository file
   *
   * @return kStorageInvalidMagic for a foreign file, kStorageVersionIncompatible
   *         when the major format version differs
   */
  utils::Expected<void, utils::Error> Open(const std::string& path);

  /**
   * @brief Close the repository (terminal)
   */
  utils::Expected<void, utils::Error> Close();

  // ==========================================================================
  // Nodes
  // ==========================================================================

  /**
   * @brief Add a content-addressed node
   *
   * The content is chunked into the store, the chunk list is added to a copy
   * of @p meta under "chunks", and the resulting envelope is stored as one
   * record whose hash becomes the node id.
   *
   * @param content Node content
   * @param type Type tag
   * @param meta Metadata object (null is treated as empty)
   * @return Node id (64 hex characters)
   */
  utils::Expected<std::string, utils::Error> AddNode(std::string_view content, const std::string& type,
                                                     const nlohmann::json& meta = nlohmann::json::object());

  /**
   * @brief Add or replace a node under a caller-chosen id
   *
   * Replacing keeps the node count and releases the previous content.
   */
  utils::Expected<void, utils::Error> AddNodeWithID(const std::string& id, std::string_view content,
                                                    const std::string& type,
                                                    const nlohmann::json& meta = nlohmann::json::object());

  /**
   * @brief Load a node with its content
   *
   * A node record that is not a node envelope is returned as an untyped
   * node wrapping the raw bytes. The returned id is canonical: the key of a
   * keyed node, the lowercase hex digest otherwise.
   *
   * @return kNodeNotFound if the id does not resolve to a node record
   */
  utils::Expected<Node, utils::Error> GetNode(const std::string& id) const;

  /**
   * @brief Content of a node
   */
  utils::Expected<std::string, utils::Error> GetContent(const std::string& id) const;

  /**
   * @brief Delete a node, the links touching it and its content references
   */
  utils::Expected<void, utils::Error> DeleteNode(const std::string& id);

  /**
   * @brief Ids of all nodes, sorted
   */
  utils::Expected<std::vector<std::string>, utils::Error> ListNodes() const;

  // ==========================================================================
  // Links
  // ==========================================================================

  /**
   * @brief Add a link between two existing nodes
   *
   * Endpoints may be given in any form the store resolves. The link stores
   * their canonical ids, so every spelling of a node matches its links.
   *
   * @return kLinkEndpointMissing if either endpoint is not a node
   */
  utils::Expected<void, utils::Error> AddLink(const std::string& source, const std::string& target,
                                              const std::string& type,
                                              const nlohmann::json& meta = nlohmann::json::object());

  /**
   * @brief Links with @p node_id as source or target
   *
   * Ordered by creation time, ties broken by numeric meta "order".
   */
  utils::Expected<std::vector<Link>, utils::Error> GetLinks(const std::string& node_id) const;

  /**
   * @brief Delete the first link matching (source, target, type)
   *
   * Deleting a link that does not exist succeeds without effect.
   */
  utils::Expected<void, utils::Error> DeleteLink(const std::string& source, const std::string& target,
                                                 const std::string& type);

  /**
   * @brief All links, in GetLinks() order
   */
  utils::Expected<std::vector<Link>, utils::Error> ListLinks() const;

  // ==========================================================================
  // Summary and history
  // ==========================================================================

  utils::Expected<RepositoryStats, utils::Error> GetStats() const;

  utils::Expected<std::vector<actions::Action>, utils::Error> GetHistory() const;

  /**
   * @brief Check the action log hash chain
   */
  utils::Expected<bool, utils::Error> VerifyHistory() const;

  [[nodiscard]] bool IsOpen() const;
  [[nodiscard]] const std::string& GetPath() const { return path_; }

 private:
  enum class State : uint8_t { kUnopened, kOpen, kClosed };

  /**
   * @brief A link envelope found by a scan, with the address it is stored under
   */
  struct StoredLink {
    std::string address;
    Link link;
  };

  // Helpers below expect the caller to hold mutex_
  utils::Expected<void, utils::Error> CheckOpen() const;
  utils::Expected<void, utils::Error> OpenComponents();
  utils::Expected<void, utils::Error> PersistHeader(const RepositoryHeader& header);
  utils::Expected<Node, utils::Error> LoadNode(const std::string& id) const;
  // Canonical id of a node record, kNodeNotFound for anything else
  utils::Expected<std::string, utils::Error> ResolveNodeId(const std::string& id) const;
  // As ResolveNodeId(), but an unknown id is returned unchanged
  utils::Expected<std::string, utils::Error> CanonicalNodeId(const std::string& id) const;
  utils::Expected<std::vector<StoredLink>, utils::Error> ScanLinks() const;
  utils::Expected<void, utils::Error> RemoveLink(const StoredLink& stored);
  utils::Expected<void, utils::Error> RecordAction(const std::string& type, const nlohmann::json& payload,
                                                   const utils::Digest& state_hash);
  void ReleaseChunks(const std::vector<std::string>& addresses, storage::RecordKind kind);
  utils::Timestamp NextTimestamp();

  config::Config config_;
  std::string path_;
  utils::FDGuard fd_;
  RepositoryHeader header_;
  storage::ChunkStore store_;
  actions::ActionLog log_;
  State state_ = State::kUnopened;
  utils::Timestamp last_timestamp_;

  mutable std::shared_mutex mutex_;
};

}  // namespace memex::repository
