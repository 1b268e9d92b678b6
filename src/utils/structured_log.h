/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON-formatted logs
 *
 * Provides helper functions for logging events in structured JSON format,
 * making it easier to parse logs programmatically for monitoring and analysis.
 * A plain "key=value" text format can be selected for interactive use.
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

namespace talentvault::utils {

/**
 * @brief Structured log builder for JSON-formatted logs
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("snapshot_failed")
 *   .Field("recovery_point_id", point_id)
 *   .Field("error", error.message())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  /**
   * @brief Output format for structured logs
   */
  enum class Format : uint8_t {
    kJson = 0,  // {"event":"...","key":"value"}
    kText = 1,  // event key=value
  };

  StructuredLog() = default;

  /**
   * @brief Set process-wide output format
   */
  static void SetFormat(Format format) { FormatStorage().store(format); }

  static Format GetFormat() { return FormatStorage().load(); }

  /**
   * @brief Parse format name ("json" or "text"), defaulting to JSON
   */
  static Format ParseFormat(std::string_view name) { return name == "text" ? Format::kText : Format::kJson; }

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
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  /**
   * @brief Add string field (std::string)
   */
  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_.push_back({key, value, true});
    return *this;
  }

  /**
   * @brief Add string field (std::string_view)
   */
  StructuredLog& Field(const std::string& key, std::string_view value) {
    fields_.push_back({key, std::string(value), true});
    return *this;
  }

  /**
   * @brief Add integer field
   */
  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.push_back({key, std::to_string(value), true});
    return *this;
  }

  /**
   * @brief Add unsigned integer field
   */
  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.push_back({key, std::to_string(value), true});
    return *this;
  }

  /**
   * @brief Add double field
   */
  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.push_back({key, oss.str(), true});
    return *this;
  }

  /**
   * @brief Add boolean field
   */
  StructuredLog& Field(const std::string& key, bool value) {
    fields_.push_back({key, value ? "true" : "false", false});  // No quotes for booleans
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Debug() { spdlog::debug("{}", Build()); }

  void Info() { spdlog::info("{}", Build()); }

  void Warn() { spdlog::warn("{}", Build()); }

  void Error() { spdlog::error("{}", Build()); }

  void Critical() { spdlog::critical("{}", Build()); }

 private:
  struct FieldEntry {
    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<FieldEntry> fields_;

  static std::atomic<Format>& FormatStorage() {
    static std::atomic<Format> format{Format::kJson};
    return format;
  }

  std::string Build() const { return GetFormat() == Format::kText ? BuildText() : BuildJson(); }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";

    bool first = true;

    if (!event_.empty()) {
      json << R"("event":")" << Escape(event_) << R"(")";
      first = false;
    }

    if (!message_.empty()) {
      if (!first) {
        json << ",";
      }
      json << R"("message":")" << Escape(message_) << R"(")";
      first = false;
    }

    for (const auto& field : fields_) {
      if (!first) {
        json << ",";
      }
      json << "\"" << field.key << "\":";
      if (field.quoted) {
        json << "\"" << Escape(field.value) << "\"";
      } else {
        json << field.value;
      }
      first = false;
    }

    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    if (!message_.empty()) {
      text << ": " << message_;
    }
    for (const auto& field : fields_) {
      text << " " << field.key << "=" << field.value;
    }
    return text.str();
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
inline void LogStorageError(const std::string& operation, const std::string& target, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("target", target)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log recovery operation failure in structured format
 */
inline void LogRecoveryError(const std::string& operation, uint64_t recovery_point_id, const std::string& error_msg) {
  StructuredLog()
      .Event("recovery_error")
      .Field("operation", operation)
      .Field("recovery_point_id", recovery_point_id)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log an audit event that could not be delivered to its sink
 *
 * The event is written to the local log instead so that it is never lost silently.
 */
inline void LogAuditSinkFailure(const std::string& action, const std::string& resource, const std::string& details,
                                const std::string& error_msg) {
  StructuredLog()
      .Event("audit_sink_failure")
      .Field("action", action)
      .Field("resource", resource)
      .Field("details", details)
      .Field("error", error_msg)
      .Error();
}

}  // namespace talentvault::utils
