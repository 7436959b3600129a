/**
 * @file importer.cpp
 * @brief Repository import implementation
 */

#include "migration/importer.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "migration/archive_format.h"
#include "migration/tar_archive.h"
#include "repository/node.h"
#include "utils/encoding.h"
#include "utils/structured_log.h"

namespace memex::migration {

namespace {

/**
 * @brief State shared by the node and link passes of one import
 */
struct ImportContext {
  repository::Repository& repo;
  const ImportOptions& options;
  std::unordered_set<std::string> existing;              ///< Node ids present in the destination
  std::unordered_map<std::string, std::string> id_map;  ///< Archived id -> destination id
  ImportStats stats;
};

bool StartsWith(const std::string& str, const char* prefix) {
  return str.compare(0, std::strlen(prefix), prefix) == 0;
}

bool EndsWith(const std::string& str, const char* suffix) {
  size_t len = std::strlen(suffix);
  return str.size() >= len && str.compare(str.size() - len, len, suffix) == 0;
}

utils::Unexpected<utils::Error> InvalidEntry(const std::string& name, const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationInvalidArchive, message, name));
}

utils::Expected<nlohmann::json, utils::Error> ParseEntryObject(const TarEntry& entry) {
  auto body = nlohmann::json::parse(entry.data, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return InvalidEntry(entry.name, "Archive entry is not a JSON object");
  }
  return body;
}

/**
 * @brief Required string member
 */
bool GetString(const nlohmann::json& body, const char* key, std::string* out) {
  auto iter = body.find(key);
  if (iter == body.end() || !iter->is_string()) {
    return false;
  }
  *out = iter->get<std::string>();
  return true;
}

/**
 * @brief Optional metadata member (missing or null becomes an empty object)
 */
bool GetMeta(const nlohmann::json& body, nlohmann::json* out) {
  auto iter = body.find("meta");
  if (iter == body.end() || iter->is_null()) {
    *out = nlohmann::json::object();
    return true;
  }
  if (!iter->is_object()) {
    return false;
  }
  *out = *iter;
  return true;
}

/**
 * @brief Sort key for edges/<n>.json so links are re-added in export order
 */
std::tuple<bool, uint64_t, std::string> EdgeOrderKey(const std::string& name) {
  size_t begin = std::strlen(archive_format::kEdgesDir);
  size_t end = name.size() - std::strlen(archive_format::kEntrySuffix);
  std::string index = name.substr(begin, end - begin);
  if (!index.empty() && std::all_of(index.begin(), index.end(), [](char chr) { return chr >= '0' && chr <= '9'; })) {
    errno = 0;
    uint64_t value = std::strtoull(index.c_str(), nullptr, 10);
    if (errno == 0) {
      return {false, value, name};
    }
  }
  return {true, 0, name};
}

utils::Expected<void, utils::Error> ImportNode(ImportContext& ctx, const TarEntry& entry) {
  auto body = ParseEntryObject(entry);
  if (!body) {
    return utils::MakeUnexpected(body.error());
  }

  std::string id;
  std::string type;
  std::string encoded;
  nlohmann::json meta;
  if (!GetString(*body, "id", &id) || id.empty() || !GetString(*body, "type", &type) ||
      !GetString(*body, "content", &encoded) || !GetMeta(*body, &meta)) {
    return InvalidEntry(entry.name, "Node entry is missing id, type, content or meta");
  }
  auto content = utils::Base64Decode(encoded);
  if (!content) {
    return InvalidEntry(entry.name, "Node content is not valid base64");
  }
  // Chunk addresses are recomputed by the destination
  meta.erase(repository::meta_keys::kChunks);

  std::string target_id = ctx.options.prefix + id;
  if (ctx.existing.count(target_id) > 0) {
    switch (ctx.options.on_conflict) {
      case ConflictPolicy::kSkip:
        ctx.id_map[id] = target_id;
        ++ctx.stats.nodes_skipped;
        return {};
      case ConflictPolicy::kReplace:
        // Content-addressed nodes cannot be replaced in place
        if (utils::IsHexDigest(target_id)) {
          auto delete_result = ctx.repo.DeleteNode(target_id);
          if (!delete_result) {
            return delete_result;
          }
        }
        break;
      case ConflictPolicy::kRename: {
        std::string candidate;
        uint64_t suffix = 1;
        do {
          candidate = target_id + "-" + std::to_string(suffix++);
        } while (ctx.existing.count(candidate) > 0);
        target_id = candidate;
        ++ctx.stats.nodes_renamed;
        break;
      }
    }
  }

  auto add_result = ctx.repo.AddNodeWithID(target_id, *content, type, meta);
  if (!add_result) {
    return add_result;
  }
  ctx.existing.insert(target_id);
  ctx.id_map[id] = target_id;
  ++ctx.stats.nodes_imported;
  return {};
}

utils::Expected<void, utils::Error> ImportLink(ImportContext& ctx, const TarEntry& entry) {
  auto body = ParseEntryObject(entry);
  if (!body) {
    return utils::MakeUnexpected(body.error());
  }

  std::string source;
  std::string target;
  std::string type;
  nlohmann::json meta;
  if (!GetString(*body, "source", &source) || !GetString(*body, "target", &target) ||
      !GetString(*body, "type", &type) || !GetMeta(*body, &meta)) {
    return InvalidEntry(entry.name, "Link entry is missing source, target, type or meta");
  }

  auto map_id = [&ctx](const std::string& id) {
    auto iter = ctx.id_map.find(id);
    return iter != ctx.id_map.end() ? iter->second : ctx.options.prefix + id;
  };
  source = map_id(source);
  target = map_id(target);

  if (ctx.options.on_conflict != ConflictPolicy::kRename) {
    auto links = ctx.repo.GetLinks(source);
    if (!links) {
      return utils::MakeUnexpected(links.error());
    }
    bool duplicate = std::any_of(links->begin(), links->end(), [&](const repository::Link& link) {
      return link.source == source && link.target == target && link.type == type;
    });
    if (duplicate) {
      if (ctx.options.on_conflict == ConflictPolicy::kSkip) {
        ++ctx.stats.links_skipped;
        return {};
      }
      auto delete_result = ctx.repo.DeleteLink(source, target, type);
      if (!delete_result) {
        return delete_result;
      }
    }
  }

  auto add_result = ctx.repo.AddLink(source, target, type, meta);
  if (!add_result) {
    return add_result;
  }
  ++ctx.stats.links_imported;
  return {};
}

}  // namespace

utils::Expected<ConflictPolicy, utils::Error> ParseConflictPolicy(const std::string& name) {
  if (name == "skip") {
    return ConflictPolicy::kSkip;
  }
  if (name == "replace") {
    return ConflictPolicy::kReplace;
  }
  if (name == "rename") {
    return ConflictPolicy::kRename;
  }
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                "Conflict policy must be one of: skip, replace, rename", name));
}

const char* ConflictPolicyToString(ConflictPolicy policy) {
  switch (policy) {
    case ConflictPolicy::kSkip:
      return "skip";
    case ConflictPolicy::kReplace:
      return "replace";
    case ConflictPolicy::kRename:
      return "rename";
  }
  return "unknown";
}

Importer::Importer(repository::Repository& repo, ImportOptions options) : repo_(repo), options_(std::move(options)) {}

utils::Expected<ImportStats, utils::Error> Importer::Import(std::istream& source) {
  std::string data((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());
  if (source.bad()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIOError, "Failed to read import archive"));
  }
  return ImportArchive(data);
}

utils::Expected<ImportStats, utils::Error> Importer::ImportFromFile(const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return utils::MakeUnexpected(
        utils::MakeError(errno == ENOENT ? utils::ErrorCode::kNotFound : utils::ErrorCode::kIOError,
                         std::string("Failed to open archive: ") + std::strerror(errno), path));
  }
  return Import(input_stream);
}

utils::Expected<ImportStats, utils::Error> Importer::ImportArchive(std::string_view bytes) {
  std::string decompressed;
  if (IsGzip(bytes)) {
    auto inflated = GzipDecompress(bytes);
    if (!inflated) {
      return utils::MakeUnexpected(inflated.error());
    }
    decompressed = std::move(*inflated);
    bytes = decompressed;
  }

  auto entries = ReadTarArchive(bytes);
  if (!entries) {
    return utils::MakeUnexpected(entries.error());
  }
  if (entries->empty() || entries->front().name != archive_format::kManifestName) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationInvalidArchive,
                                                  "Archive does not start with a manifest"));
  }

  auto manifest = ParseEntryObject(entries->front());
  if (!manifest) {
    return utils::MakeUnexpected(manifest.error());
  }
  auto version = manifest->find("version");
  if (version == manifest->end() || !version->is_number_integer() ||
      version->get<int64_t>() != archive_format::kVersion) {
    std::string found = version == manifest->end() ? "missing" : version->dump();
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationUnsupportedVersion,
                                                  "Unsupported archive version",
                                                  found + " (supported: " + std::to_string(archive_format::kVersion) +
                                                      ")"));
  }

  auto existing_ids = repo_.ListNodes();
  if (!existing_ids) {
    return utils::MakeUnexpected(existing_ids.error());
  }
  if (!options_.merge && !existing_ids->empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMigrationConflict,
                                                  "Destination repository is not empty (enable merge to import)",
                                                  std::to_string(existing_ids->size()) + " nodes"));
  }

  ImportContext ctx{repo_, options_, {existing_ids->begin(), existing_ids->end()}, {}, {}};

  // Nodes first, links once every endpoint can exist
  std::vector<const TarEntry*> edge_entries;
  for (size_t i = 1; i < entries->size(); ++i) {
    const TarEntry& entry = (*entries)[i];
    if (!EndsWith(entry.name, archive_format::kEntrySuffix)) {
      continue;
    }
    if (StartsWith(entry.name, archive_format::kNodesDir)) {
      auto node_result = ImportNode(ctx, entry);
      if (!node_result) {
        utils::StructuredLog()
            .Event("import_failed")
            .Field("entry", entry.name)
            .Field("error", node_result.error().message())
            .Error();
        return utils::MakeUnexpected(node_result.error());
      }
    } else if (StartsWith(entry.name, archive_format::kEdgesDir)) {
      edge_entries.push_back(&entry);
    }
  }

  std::sort(edge_entries.begin(), edge_entries.end(), [](const TarEntry* lhs, const TarEntry* rhs) {
    return EdgeOrderKey(lhs->name) < EdgeOrderKey(rhs->name);
  });
  for (const TarEntry* entry : edge_entries) {
    auto link_result = ImportLink(ctx, *entry);
    if (!link_result) {
      utils::StructuredLog()
          .Event("import_failed")
          .Field("entry", entry->name)
          .Field("error", link_result.error().message())
          .Error();
      return utils::MakeUnexpected(link_result.error());
    }
  }

  utils::LogMigrationEvent("import", ctx.stats.nodes_imported, ctx.stats.links_imported,
                           ctx.stats.nodes_skipped + ctx.stats.links_skipped);
  return ctx.stats;
}

}  // namespace memex::migration
