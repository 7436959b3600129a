/**
 * @file importer.h
 * @brief Import nodes and links from an export archive
 */

#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>

#include "repository/repository.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace memex::migration {

/**
 * @brief What to do when an imported id (or link) already exists
 */
enum class ConflictPolicy : uint8_t {
  kSkip,     ///< Keep the existing entry
  kReplace,  ///< Overwrite the existing entry
  kRename,   ///< Import under "<id>-<n>"; links follow the new id
};

/**
 * @brief Parse "skip", "replace" or "rename"
 */
utils::Expected<ConflictPolicy, utils::Error> ParseConflictPolicy(const std::string& name);

const char* ConflictPolicyToString(ConflictPolicy policy);

/**
 * @brief Import options
 */
struct ImportOptions {
  ConflictPolicy on_conflict = ConflictPolicy::kSkip;
  bool merge = false;  ///< Allow importing into a repository that already has nodes
  std::string prefix;  ///< Prepended to node ids and to link endpoints
};

/**
 * @brief Import counters
 */
struct ImportStats {
  uint64_t nodes_imported = 0;
  uint64_t nodes_skipped = 0;
  uint64_t nodes_renamed = 0;
  uint64_t links_imported = 0;
  uint64_t links_skipped = 0;
};

/**
 * @brief Reads export archives (see archive_format.h) into a repository
 *
 * Nodes are added with their archived ids (plus prefix) through
 * Repository::AddNodeWithID(); the content is rechunked with the destination's
 * chunker. An import that fails part way leaves the entries imported so far.
 */
class Importer {
 public:
  explicit Importer(repository::Repository& repo, ImportOptions options = ImportOptions());

  /**
   * @brief Import from a stream (gzip is detected automatically)
   *
   * @return kMigrationConflict when the repository is not empty and merge is
   *         off, kMigrationUnsupportedVersion for an unknown manifest version,
   *         kMigrationInvalidArchive for a malformed archive,
   *         kLinkEndpointMissing for a link whose endpoints are not present
   */
  utils::Expected<ImportStats, utils::Error> Import(std::istream& source);

  /**
   * @brief Import from a file
   */
  utils::Expected<ImportStats, utils::Error> ImportFromFile(const std::string& path);

  /**
   * @brief Import from archive bytes
   */
  utils::Expected<ImportStats, utils::Error> ImportArchive(std::string_view bytes);

 private:
  repository::Repository& repo_;
  ImportOptions options_;
};

}  // namespace memex::migration
