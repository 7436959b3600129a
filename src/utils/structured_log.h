/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON or key=value logs
 *
 * Every subsystem of the store (chunk store, action log, repository,
 * migration) reports through the helpers at the bottom of this file so that
 * log lines stay machine-parseable.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace memex::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Structured log builder for JSON or text-formatted logs
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("chunk_store_error")
 *   .Field("operation", "put")
 *   .Field("offset", offset)
 *   .Field("size", size)
 *   .Error();
 * @endcode
 *
 * Format can be changed globally via SetFormat():
 * @code
 * StructuredLog::SetFormat(LogFormat::TEXT);  // Switch to text format
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global log format (JSON or TEXT)
   * Thread-safe: Uses atomic store with relaxed memory order
   */
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  /**
   * @brief Get current log format
   * Thread-safe: Uses atomic load with relaxed memory order
   */
  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Parse format string to LogFormat enum
   * @param format_str Format string ("json" or "text")
   * @return LogFormat enum value (defaults to JSON for unknown values)
   */
  static LogFormat ParseFormat(const std::string& format_str) {
    if (format_str == "text") {
      return LogFormat::TEXT;
    }
    return LogFormat::JSON;  // Default to JSON
  }

  /**
   * @brief Set event type
   */
  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  /**
   * @brief Add string field (const char*)
   */
  StructuredLog& Field(const std::string& key, const char* value) {
    fields_.push_back(MakeJSONField(key, Escape(std::string(value))));
    fields_text_.push_back(MakeTextField(key, std::string(value)));
    return *this;
  }

  /**
   * @brief Add string field (std::string)
   */
  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_.push_back(MakeJSONField(key, Escape(value)));
    fields_text_.push_back(MakeTextField(key, value));
    return *this;
  }

  /**
   * @brief Add string field (std::string_view)
   */
  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_.push_back(MakeJSONField(key, Escape(std::string(value))));
    fields_text_.push_back(MakeTextField(key, std::string(value)));
    return *this;
  }

  /**
   * @brief Add integer field
   */
  StructuredLog& Field(const std::string& key, int64_t value) {
    std::string val_str = std::to_string(value);
    fields_.push_back(MakeJSONField(key, val_str, true));  // Quoted for JSON
    fields_text_.push_back(key + "=" + val_str);
    return *this;
  }

  /**
   * @brief Add unsigned integer field
   */
  StructuredLog& Field(const std::string& key, uint64_t value) {
    std::string val_str = std::to_string(value);
    fields_.push_back(MakeJSONField(key, val_str, true));  // Quoted for JSON
    fields_text_.push_back(key + "=" + val_str);
    return *this;
  }

  /**
   * @brief Add double field
   */
  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    std::string val_str = oss.str();
    fields_.push_back(MakeJSONField(key, val_str, true));  // Quoted for JSON
    fields_text_.push_back(key + "=" + val_str);
    return *this;
  }

  /**
   * @brief Add boolean field
   */
  StructuredLog& Field(const std::string& key, bool value) {
    std::string val_str = value ? "true" : "false";
    fields_.push_back(MakeJSONField(key, val_str, false));  // No quotes for booleans in JSON
    fields_text_.push_back(key + "=" + val_str);
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  /**
   * @brief Log as error level
   */
  void Error() { spdlog::error("{}", Build()); }

  /**
   * @brief Log as warning level
   */
  void Warn() { spdlog::warn("{}", Build()); }

  /**
   * @brief Log as info level
   */
  void Info() { spdlog::info("{}", Build()); }

  /**
   * @brief Log as debug level
   */
  void Debug() { spdlog::debug("{}", Build()); }

  /**
   * @brief Log as critical level
   */
  void Critical() { spdlog::critical("{}", Build()); }

 private:
  std::string event_;
  std::string message_;
  std::vector<std::string> fields_;                               // JSON format fields
  std::vector<std::string> fields_text_;                          // Text format fields
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};  // Default to JSON (thread-safe)

  /**
   * @brief Build log string in selected format
   * Thread-safe: Reads format atomically
   */
  std::string Build() const {
    if (format_.load(std::memory_order_relaxed) == LogFormat::TEXT) {
      return BuildText();
    }
    return BuildJSON();
  }

  /**
   * @brief Build JSON string
   */
  std::string BuildJSON() const {
    std::ostringstream json;
    json << "{";

    bool first = true;

    // Add event type
    if (!event_.empty()) {
      json << R"("event":")" << Escape(event_) << R"(")";
      first = false;
    }

    // Add message if present
    if (!message_.empty()) {
      if (!first) {
        json << ",";
      }
      json << R"("message":")" << Escape(message_) << R"(")";
      first = false;
    }

    // Add custom fields
    for (const auto& field : fields_) {
      if (!first) {
        json << ",";
      }
      json << field;
      first = false;
    }

    json << "}";
    return json.str();
  }

  /**
   * @brief Build text string (key=value format)
   */
  std::string BuildText() const {
    std::ostringstream text;

    bool first = true;

    // Add event type
    if (!event_.empty()) {
      text << "event=" << EscapeText(event_);
      first = false;
    }

    // Add message if present
    if (!message_.empty()) {
      if (!first) {
        text << " ";
      }
      text << "message=\"" << EscapeText(message_) << "\"";
      first = false;
    }

    // Add custom fields
    for (const auto& field : fields_text_) {
      if (!first) {
        text << " ";
      }
      text << field;
      first = false;
    }

    return text.str();
  }

  /**
   * @brief Create a JSON field
   */
  static std::string MakeJSONField(const std::string& key, const std::string& value, bool quoted = true) {
    std::ostringstream oss;
    oss << "\"" << key << "\":";
    if (quoted) {
      oss << "\"" << value << "\"";
    } else {
      oss << value;
    }
    return oss.str();
  }

  /**
   * @brief Create a text field (key=value or key="value")
   */
  static std::string MakeTextField(const std::string& key, const std::string& value) {
    // Quote string values that contain spaces or special characters
    if (value.find(' ') != std::string::npos || value.find('"') != std::string::npos ||
        value.find('\n') != std::string::npos) {
      return key + "=\"" + EscapeText(value) + "\"";
    }
    return key + "=" + value;
  }

  /**
   * @brief Escape text for text format (escape quotes and backslashes)
   */
  static std::string EscapeText(const std::string& str) {
    std::ostringstream escaped;
    for (char chr : str) {
      if (chr == '"' || chr == '\\') {
        escaped << '\\' << chr;
      } else if (chr == '\n') {
        escaped << "\\n";
      } else if (chr == '\r') {
        escaped << "\\r";
      } else if (chr == '\t') {
        escaped << "\\t";
      } else {
        escaped << chr;
      }
    }
    return escaped.str();
  }

  /**
   * @brief Escape JSON string
   */
  static std::string Escape(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            // Control characters
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage info in structured format
 */
inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a chunk record that failed validation during an index scan
 */
inline void LogChunkRecordSkipped(const std::string& filepath, uint64_t offset, const std::string& reason) {
  StructuredLog()
      .Event("chunk_record_skipped")
      .Field("filepath", filepath)
      .Field("offset", offset)
      .Field("reason", reason)
      .Debug();
}

/**
 * @brief Log action log error in structured format
 */
inline void LogActionLogError(const std::string& operation, const std::string& filepath,
                              const std::string& error_msg) {
  StructuredLog()
      .Event("action_log_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log action log recovery (torn tail, integrity failure)
 */
inline void LogActionLogWarning(const std::string& operation, const std::string& filepath,
                                const std::string& message) {
  StructuredLog()
      .Event("action_log_warning")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("message", message)
      .Warn();
}

/**
 * @brief Log a repository mutation or lifecycle event
 */
inline void LogRepositoryEvent(const std::string& operation, const std::string& id, const std::string& type) {
  StructuredLog().Event("repository").Field("operation", operation).Field("id", id).Field("type", type).Debug();
}

/**
 * @brief Log repository error in structured format
 */
inline void LogRepositoryError(const std::string& operation, const std::string& id, const std::string& error_msg) {
  StructuredLog()
      .Event("repository_error")
      .Field("operation", operation)
      .Field("id", id)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a migration summary in structured format
 */
inline void LogMigrationEvent(const std::string& operation, uint64_t nodes, uint64_t edges, uint64_t skipped) {
  StructuredLog()
      .Event("migration")
      .Field("operation", operation)
      .Field("nodes", nodes)
      .Field("edges", edges)
      .Field("skipped", skipped)
      .Info();
}

}  // namespace memex::utils
