/**
 * @file archive_format.h
 * @brief Layout of repository export archives
 *
 * An export is a ustar archive (optionally gzip-compressed) holding:
 *   - manifest.json: {"version", "created", "creator", "nodes", "edges"}
 *   - nodes/<id>.json: {"id", "type", "content" (base64), "meta", "created", "modified"}
 *   - edges/<n>.json: {"source", "target", "type", "meta", "created", "modified"}
 *
 * The manifest is always the first entry. Node entries carry their id in the
 * JSON body; the file name is informational.
 */

#pragma once

#include <cstdint>

namespace memex::migration {

namespace archive_format {

// Archive format version written to the manifest
constexpr int64_t kVersion = 1;

constexpr const char* kManifestName = "manifest.json";
constexpr const char* kNodesDir = "nodes/";
constexpr const char* kEdgesDir = "edges/";
constexpr const char* kEntrySuffix = ".json";

}  // namespace archive_format

}  // namespace memex::migration
