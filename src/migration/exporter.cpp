/**
 * @file exporter.cpp
 * @brief Repository export implementation
 */

#include "migration/exporter.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "migration/archive_format.h"
#include "migration/tar_archive.h"
#include "utils/encoding.h"
#include "utils/fd_guard.h"
#include "utils/sha256.h"
#include "utils/structured_log.h"
#include "utils/time_utils.h"
#include "version.h"

namespace memex::migration {

std::string NodeEntryName(const std::string& id) {
  std::string name = std::string(archive_format::kNodesDir) + id + archive_format::kEntrySuffix;
  if (TarWriter::FitsHeader(name)) {
    return name;
  }
  return std::string(archive_format::kNodesDir) + utils::HexEncode(utils::Sha256::Hash(id)) +
         archive_format::kEntrySuffix;
}

Exporter::Exporter(const repository::Repository& repo, ExportOptions options)
    : repo_(repo), options_(options) {}

utils::Expected<ExportStats, utils::Error> Exporter::Export(std::ostream& sink) const {
  ExportStats stats;
  auto archive = BuildArchive(&stats);
  if (!archive) {
    return utils::MakeUnexpected(archive.error());
  }

  sink.write(archive->data(), static_cast<std::streamsize>(archive->size()));
  sink.flush();
  if (!sink) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIOError, "Failed to write export archive"));
  }
  stats.bytes = archive->size();

  utils::LogMigrationEvent("export", stats.nodes, stats.edges, 0);
  return stats;
}

utils::Expected<ExportStats, utils::Error> Exporter::ExportToFile(const std::string& path) const {
  std::string temp_path = path + ".tmp";

  std::ofstream output_stream(temp_path, std::ios::binary | std::ios::trunc);
  if (!output_stream) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIOError,
                         "Failed to open file for writing: " + temp_path + " (" + std::strerror(errno) + ")"));
  }

  utils::ScopeGuard remove_temp([&]() {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
  });

  auto stats = Export(output_stream);
  if (!stats) {
    return stats;
  }
  output_stream.close();
  if (!output_stream) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIOError, "Failed to close archive", temp_path));
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kIOError, "Failed to move archive into place: " + ec.message(), path));
  }
  remove_temp.Release();

  utils::LogStorageInfo("export", "Export written to " + path);
  return stats;
}

utils::Expected<std::string, utils::Error> Exporter::BuildArchive(ExportStats* stats) const {
  auto node_ids = repo_.ListNodes();
  if (!node_ids) {
    return utils::MakeUnexpected(node_ids.error());
  }
  auto links = repo_.ListLinks();
  if (!links) {
    return utils::MakeUnexpected(links.error());
  }

  auto now = std::chrono::system_clock::now();
  int64_t mtime = utils::ToUnixSeconds(now);
  TarWriter writer;

  try {
    nlohmann::json manifest;
    manifest["version"] = archive_format::kVersion;
    manifest["created"] = utils::FormatTimestamp(now);
    manifest["creator"] = Version::Creator();
    manifest["nodes"] = node_ids->size();
    manifest["edges"] = links->size();
    auto add_result = writer.AddFile(archive_format::kManifestName, manifest.dump(2), mtime);
    if (!add_result) {
      return utils::MakeUnexpected(add_result.error());
    }

    for (const auto& id : *node_ids) {
      auto node = repo_.GetNode(id);
      if (!node) {
        return utils::MakeUnexpected(node.error());
      }

      nlohmann::json entry;
      entry["id"] = id;
      entry["type"] = node->type;
      entry["content"] = utils::Base64Encode(node->content);
      entry["meta"] = node->meta;
      entry["created"] = utils::FormatTimestamp(node->created);
      entry["modified"] = utils::FormatTimestamp(node->modified);

      add_result = writer.AddFile(NodeEntryName(id), entry.dump(2), mtime);
      if (!add_result) {
        return utils::MakeUnexpected(add_result.error());
      }
      ++stats->nodes;
    }

    for (const auto& link : *links) {
      nlohmann::json entry;
      entry["source"] = link.source;
      entry["target"] = link.target;
      entry["type"] = link.type;
      entry["meta"] = link.meta;
      entry["created"] = utils::FormatTimestamp(link.created);
      entry["modified"] = utils::FormatTimestamp(link.modified);

      std::string name =
          std::string(archive_format::kEdgesDir) + std::to_string(stats->edges) + archive_format::kEntrySuffix;
      add_result = writer.AddFile(name, entry.dump(2), mtime);
      if (!add_result) {
        return utils::MakeUnexpected(add_result.error());
      }
      ++stats->edges;
    }
  } catch (const nlohmann::json::exception& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kEnvelopeInvalid,
                                                  std::string("Failed to serialize export entry: ") + e.what()));
  }

  std::string archive = writer.Finish();
  if (!options_.compress) {
    return archive;
  }
  return GzipCompress(archive);
}

}  // namespace memex::migration
