/**
 * @file audit_sink.cpp
 * @brief Collection-backed audit sink
 */

#include "recovery/audit_sink.h"

#include <openssl/rand.h>

#include <array>

#include "store/collection_id.h"
#include "utils/datetime_converter.h"
#include "utils/string_utils.h"

namespace talentvault::recovery {

using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kAuditIdBytes = 16;
constexpr std::array<const char*, 4> kSensitiveMarkers = {"password", "token", "secret", "key"};

bool EndsWith(const std::string& text, const std::string& suffix) {
  return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsSensitiveKey(const std::string& key) {
  if (EndsWith(key, "Id") || EndsWith(key, "_id")) {
    return false;
  }
  std::string lower = utils::ToLower(key);
  for (const char* marker : kSensitiveMarkers) {
    if (lower.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

Expected<std::string, Error> NewAuditId() {
  std::array<unsigned char, kAuditIdBytes> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoRandomFailed, "Failed to generate audit id"));
  }
  return utils::ToHex(std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
}

}  // namespace

nlohmann::json SanitizeDetails(const nlohmann::json& details) {
  if (details.is_object()) {
    nlohmann::json sanitized = nlohmann::json::object();
    for (const auto& item : details.items()) {
      sanitized[item.key()] = IsSensitiveKey(item.key()) ? nlohmann::json(kRedactedValue) : SanitizeDetails(item.value());
    }
    return sanitized;
  }
  if (details.is_array()) {
    nlohmann::json sanitized = nlohmann::json::array();
    for (const auto& item : details) {
      sanitized.push_back(SanitizeDetails(item));
    }
    return sanitized;
  }
  return details;
}

Expected<void, Error> CollectionAuditSink::LogAudit(const AuditEvent& event) {
  auto audit_id = NewAuditId();
  if (!audit_id) {
    return MakeUnexpected(audit_id.error());
  }

  nlohmann::json row;
  row["id"] = *audit_id;
  row["timestamp"] = utils::FormatIso8601(utils::NowMillis());
  row["user_id"] = event.user_id;
  row["action"] = event.action;
  row["resource"] = event.resource;
  row["details"] = SanitizeDetails(event.details);
  row["ip"] = event.ip;
  row["user_agent"] = event.user_agent;

  store::Records rows;
  rows.push_back(std::move(row));
  return store_.BulkInsert(std::string(store::CollectionName(store::CollectionId::kAuditLogs)), rows);
}

}  // namespace talentvault::recovery
