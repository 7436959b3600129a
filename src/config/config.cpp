/**
 * @file config.cpp
 * @brief Configuration parser implementation for memex
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace memex::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    // Scalars are untyped in YAML; try the narrowest interpretation first
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.as<std::string>();
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      json_object[pair.first.as<std::string>()] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Parse storage configuration
 */
StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;

  if (node["chunker"]) {
    const auto& chunker_node = node["chunker"];
    if (chunker_node["min_size"]) {
      config.chunker.min_size = chunker_node["min_size"].as<uint32_t>();
    }
    if (chunker_node["avg_size"]) {
      config.chunker.avg_size = chunker_node["avg_size"].as<uint32_t>();
    }
    if (chunker_node["max_size"]) {
      config.chunker.max_size = chunker_node["max_size"].as<uint32_t>();
    }
  }
  if (node["sync_writes"]) {
    config.sync_writes = node["sync_writes"].as<bool>();
  }
  if (node["verify_hashes"]) {
    config.verify_hashes = node["verify_hashes"].as<bool>();
  }

  return config;
}

/**
 * @brief Parse action log configuration
 */
ActionsConfig ParseActionsConfig(const YAML::Node& node) {
  ActionsConfig config;

  if (node["dir_name"]) {
    config.dir_name = node["dir_name"].as<std::string>();
  }

  return config;
}

/**
 * @brief Parse migration configuration
 */
MigrationConfig ParseMigrationConfig(const YAML::Node& node) {
  MigrationConfig config;

  if (node["on_conflict"]) {
    config.on_conflict = node["on_conflict"].as<std::string>();
  }
  if (node["compress"]) {
    config.compress = node["compress"].as<bool>();
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["format"]) {
    config.format = node["format"].as<std::string>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed: " << e.what() << "\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (sections are storage, actions, migration, logging)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid enum values (check allowed values)\n";
      err_msg << "    - Out of range values (check min/max constraints)";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty document is a valid configuration with all defaults
    nlohmann::json config_json = root.IsNull() ? nlohmann::json::object() : YamlToJson(root);

    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["actions"]) {
      config.actions = ParseActionsConfig(root["actions"]);
    }
    if (root["migration"]) {
      config.migration = ParseMigrationConfig(root["migration"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigFileNotFound,
                                                  "Failed to open config file: " + std::string(e.what()), path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  const auto& chunker = config.storage.chunker;

  // Validate chunker sizes
  if (chunker.min_size < defaults::kChunkMinSizeFloor) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "storage.chunker.min_size must be >= " + std::to_string(defaults::kChunkMinSizeFloor)));
  }
  if (chunker.avg_size < defaults::kChunkAvgSizeFloor) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "storage.chunker.avg_size must be >= " + std::to_string(defaults::kChunkAvgSizeFloor)));
  }
  if (chunker.max_size < defaults::kChunkMaxSizeFloor) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "storage.chunker.max_size must be >= " + std::to_string(defaults::kChunkMaxSizeFloor)));
  }
  if (chunker.min_size > chunker.avg_size || chunker.avg_size > chunker.max_size) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                         "storage.chunker sizes must satisfy min_size <= avg_size <= max_size"));
  }

  // Validate action log configuration
  if (config.actions.dir_name.empty() || config.actions.dir_name.find('/') != std::string::npos ||
      config.actions.dir_name == "." || config.actions.dir_name == "..") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "actions.dir_name must be a single non-empty path component (got: " + config.actions.dir_name + ")"));
  }

  // Validate migration configuration
  if (config.migration.on_conflict != "skip" && config.migration.on_conflict != "replace" &&
      config.migration.on_conflict != "rename") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "migration.on_conflict must be one of: skip, replace, rename (got: " + config.migration.on_conflict + ")"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }
  if (config.logging.format != "json" && config.logging.format != "text") {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                         "logging.format must be one of: json, text (got: " + config.logging.format + ")"));
  }

  return {};
}

}  // namespace memex::config
