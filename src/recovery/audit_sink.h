/**
 * @file audit_sink.h
 * @brief Audit event sink and its collection-backed implementation
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "store/collection_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::recovery {

using utils::Error;
using utils::Expected;

constexpr const char* kRedactedValue = "***REDACTED***";

struct AuditEvent {
  std::string user_id;
  std::string action;
  std::string resource;
  nlohmann::json details = nlohmann::json::object();
  std::string ip;
  std::string user_agent;
};

/**
 * @brief Destination of audit events
 */
class AuditSink {
 public:
  virtual ~AuditSink() = default;

  AuditSink() = default;
  AuditSink(const AuditSink&) = delete;
  AuditSink& operator=(const AuditSink&) = delete;
  AuditSink(AuditSink&&) = delete;
  AuditSink& operator=(AuditSink&&) = delete;

  virtual Expected<void, Error> LogAudit(const AuditEvent& event) = 0;
};

/**
 * @brief Appends audit rows to the auditLogs collection
 *
 * Row: {id, timestamp, user_id, action, resource, details, ip, user_agent}
 * with sensitive detail values redacted.
 */
class CollectionAuditSink : public AuditSink {
 public:
  explicit CollectionAuditSink(store::CollectionStore& store) : store_(store) {}

  Expected<void, Error> LogAudit(const AuditEvent& event) override;

 private:
  store::CollectionStore& store_;
};

/**
 * @brief Redact values whose key names a credential
 *
 * A key is sensitive when it contains "password", "token", "secret" or
 * "key" (case-insensitive), unless it is an identifier ending in "Id" or
 * "_id". Nested objects and arrays are processed recursively.
 */
nlohmann::json SanitizeDetails(const nlohmann::json& details);

}  // namespace talentvault::recovery
