/**
 * @file error.h
 * @brief Error codes and error type used with Expected<T, Error>
 *
 * Error codes are grouped by subsystem in numeric ranges so that a code
 * can be mapped back to the layer that produced it when read from logs.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace memex::utils {

/**
 * @brief Error codes
 *
 * Ranges:
 *   0-999      General
 *   1000-1999  Configuration
 *   2000-2999  Storage (repository file and chunk records)
 *   3000-3999  Action log
 *   4000-4999  Repository
 *   5000-5999  Migration
 */
enum class ErrorCode : std::uint16_t {
  // General (0-999)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kAlreadyExists = 4,
  kOutOfRange = 5,
  kTimeout = 6,
  kInternalError = 7,
  kNotImplemented = 8,
  kIOError = 9,

  // Configuration (1000-1999)
  kConfigFileNotFound = 1000,
  kConfigYamlError = 1001,
  kConfigParseError = 1002,
  kConfigInvalidValue = 1003,
  kConfigValidationError = 1004,

  // Storage (2000-2999)
  kStorageIOError = 2000,
  kStorageInvalidMagic = 2001,
  kStorageVersionIncompatible = 2002,
  kStorageChecksumMismatch = 2003,
  kStorageCorrupted = 2004,
  kStorageChunkNotFound = 2005,
  kStorageHashMismatch = 2006,

  // Action log (3000-3999)
  kActionLogIOError = 3000,
  kActionLogCorrupted = 3001,
  kActionLogSerializationError = 3002,

  // Repository (4000-4999)
  kRepositoryClosed = 4000,
  kRepositoryExists = 4001,
  kNodeNotFound = 4002,
  kLinkEndpointMissing = 4003,
  kEnvelopeInvalid = 4004,

  // Migration (5000-5999)
  kMigrationInvalidArchive = 5000,
  kMigrationUnsupportedVersion = 5001,
  kMigrationConflict = 5002,
  kMigrationCompressionError = 5003,
};

/**
 * @brief Get a stable name for an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kNotImplemented:
      return "NotImplemented";
    case ErrorCode::kIOError:
      return "IOError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kStorageIOError:
      return "StorageIOError";
    case ErrorCode::kStorageInvalidMagic:
      return "StorageInvalidMagic";
    case ErrorCode::kStorageVersionIncompatible:
      return "StorageVersionIncompatible";
    case ErrorCode::kStorageChecksumMismatch:
      return "StorageChecksumMismatch";
    case ErrorCode::kStorageCorrupted:
      return "StorageCorrupted";
    case ErrorCode::kStorageChunkNotFound:
      return "StorageChunkNotFound";
    case ErrorCode::kStorageHashMismatch:
      return "StorageHashMismatch";
    case ErrorCode::kActionLogIOError:
      return "ActionLogIOError";
    case ErrorCode::kActionLogCorrupted:
      return "ActionLogCorrupted";
    case ErrorCode::kActionLogSerializationError:
      return "ActionLogSerializationError";
    case ErrorCode::kRepositoryClosed:
      return "RepositoryClosed";
    case ErrorCode::kRepositoryExists:
      return "RepositoryExists";
    case ErrorCode::kNodeNotFound:
      return "NodeNotFound";
    case ErrorCode::kLinkEndpointMissing:
      return "LinkEndpointMissing";
    case ErrorCode::kEnvelopeInvalid:
      return "EnvelopeInvalid";
    case ErrorCode::kMigrationInvalidArchive:
      return "MigrationInvalidArchive";
    case ErrorCode::kMigrationUnsupportedVersion:
      return "MigrationUnsupportedVersion";
    case ErrorCode::kMigrationConflict:
      return "MigrationConflict";
    case ErrorCode::kMigrationCompressionError:
      return "MigrationCompressionError";
  }
  return "Unknown";
}

/**
 * @brief Error value carried by Expected<T, Error>
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code, std::string message = "", std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  /**
   * @brief Error code
   */
  [[nodiscard]] ErrorCode code() const { return code_; }

  /**
   * @brief Human-readable message
   */
  [[nodiscard]] const std::string& message() const { return message_; }

  /**
   * @brief Optional context (file path, id, operation)
   */
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Code] message (context)"
   */
  [[nodiscard]] std::string to_string() const {  // NOLINT(readability-identifier-naming)
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += "]";
    if (!message_.empty()) {
      result += " " + message_;
    }
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 * @param code Error code
 * @param message Human-readable message
 * @param context Optional context
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace memex::utils
