/**
 * @file config.h
 * @brief Configuration structures and YAML parser for memex
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace memex::config {

// Default values for configuration
namespace defaults {

// Content-defined chunking
constexpr uint32_t kChunkMinSize = 2 * 1024;
constexpr uint32_t kChunkAvgSize = 8 * 1024;
constexpr uint32_t kChunkMaxSize = 64 * 1024;

// Lower bounds accepted for chunker sizes
constexpr uint32_t kChunkMinSizeFloor = 64;
constexpr uint32_t kChunkAvgSizeFloor = 256;
constexpr uint32_t kChunkMaxSizeFloor = 1024;

// Action log directory, created next to the repository file
constexpr const char* kActionsDirName = ".actions";

// Import conflict policy
constexpr const char* kOnConflict = "skip";

}  // namespace defaults

/**
 * @brief Content-defined chunker configuration
 */
struct ChunkerConfig {
  uint32_t min_size = defaults::kChunkMinSize;  ///< No boundary is placed before this many bytes
  uint32_t avg_size = defaults::kChunkAvgSize;  ///< Target chunk size
  uint32_t max_size = defaults::kChunkMaxSize;  ///< A boundary is forced at this size
};

/**
 * @brief Chunk store configuration
 */
struct StorageConfig {
  ChunkerConfig chunker;      ///< Chunking parameters
  bool sync_writes = true;    ///< fsync() after every record write
  bool verify_hashes = true;  ///< Re-hash payloads on read and reject mismatches
};

/**
 * @brief Action log configuration
 */
struct ActionsConfig {
  std::string dir_name = defaults::kActionsDirName;  ///< Directory (relative to the repository file) for logs
};

/**
 * @brief Export/import defaults used by memexctl
 */
struct MigrationConfig {
  std::string on_conflict = defaults::kOnConflict;  ///< "skip", "replace" or "rename"
  bool compress = false;                            ///< gzip archives on export
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  std::string format = "json";  ///< Structured log format: json or text
  std::string file;             ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  StorageConfig storage;      ///< Chunk store configuration
  ActionsConfig actions;      ///< Action log configuration
  MigrationConfig migration;  ///< Export/import configuration
  LoggingConfig logging;      ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * The document is validated against the embedded JSON Schema first, then
 * parsed section by section and checked with ValidateConfig().
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace memex::config
