/**
 * @file exporter.h
 * @brief Export a repository's nodes and links to an archive
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "repository/repository.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace memex::migration {

/**
 * @brief Export options
 */
struct ExportOptions {
  bool compress = false;  ///< gzip the archive
};

/**
 * @brief What an export wrote
 */
struct ExportStats {
  uint64_t nodes = 0;
  uint64_t edges = 0;
  uint64_t bytes = 0;  ///< Archive size as written
};

/**
 * @brief Writes export archives (see archive_format.h)
 *
 * The repository is read through its public API only.
 */
class Exporter {
 public:
  explicit Exporter(const repository::Repository& repo, ExportOptions options = ExportOptions());

  /**
   * @brief Write the archive to a stream
   *
   * An empty repository produces an archive holding only the manifest.
   */
  utils::Expected<ExportStats, utils::Error> Export(std::ostream& sink) const;

  /**
   * @brief Write the archive to a file
   *
   * The archive is written to "<path>.tmp" and renamed into place, so a
   * failed export never leaves a partial file at @p path.
   */
  utils::Expected<ExportStats, utils::Error> ExportToFile(const std::string& path) const;

 private:
  utils::Expected<std::string, utils::Error> BuildArchive(ExportStats* stats) const;

  const repository::Repository& repo_;
  ExportOptions options_;
};

/**
 * @brief Archive entry name for a node id
 *
 * Ids that do not fit a ustar header are replaced by their SHA-256 hex.
 */
std::string NodeEntryName(const std::string& id);

}  // namespace memex::migration
