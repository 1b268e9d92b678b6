/**
 * @file recovery_types.cpp
 * @brief Recovery type conversions
 */

#include "recovery/recovery_types.h"

#include "crypto/integrity_codec.h"

namespace talentvault::recovery {

namespace {

Error Corrupted(const std::string& what, const std::string& detail) {
  return MakeError(utils::ErrorCode::kStorageCorrupted, "Malformed " + what + " row", detail);
}

Expected<Timestamp, Error> ParseTimestamp(const nlohmann::json& row, const char* key, const std::string& what) {
  if (!row.contains(key) || !row[key].is_string()) {
    return MakeUnexpected(Corrupted(what, std::string("missing ") + key));
  }
  auto parsed = utils::ParseIso8601(row[key].get<std::string>());
  if (!parsed) {
    return MakeUnexpected(Corrupted(what, std::string("bad ") + key + ": " + row[key].get<std::string>()));
  }
  return *parsed;
}

}  // namespace

const char* ToString(RecoveryKind kind) {
  switch (kind) {
    case RecoveryKind::kFull:
      return "full";
    case RecoveryKind::kIncremental:
      return "incremental";
  }
  return "unknown";
}

const char* ToString(RecoveryTrigger trigger) {
  switch (trigger) {
    case RecoveryTrigger::kManual:
      return "manual";
    case RecoveryTrigger::kAutomatic:
      return "automatic";
  }
  return "unknown";
}

const char* ToString(RecoveryStatus status) {
  switch (status) {
    case RecoveryStatus::kPending:
      return "pending";
    case RecoveryStatus::kCompleted:
      return "completed";
    case RecoveryStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::optional<RecoveryKind> ParseRecoveryKind(std::string_view text) {
  if (text == "full") {
    return RecoveryKind::kFull;
  }
  if (text == "incremental") {
    return RecoveryKind::kIncremental;
  }
  return std::nullopt;
}

std::optional<RecoveryTrigger> ParseRecoveryTrigger(std::string_view text) {
  if (text == "manual") {
    return RecoveryTrigger::kManual;
  }
  if (text == "automatic") {
    return RecoveryTrigger::kAutomatic;
  }
  return std::nullopt;
}

std::optional<RecoveryStatus> ParseRecoveryStatus(std::string_view text) {
  if (text == "pending") {
    return RecoveryStatus::kPending;
  }
  if (text == "completed") {
    return RecoveryStatus::kCompleted;
  }
  if (text == "failed") {
    return RecoveryStatus::kFailed;
  }
  return std::nullopt;
}

nlohmann::json ToJson(const RecoveryPoint& point) {
  nlohmann::json row;
  row["id"] = point.id;
  row["timestamp"] = utils::FormatIso8601(point.timestamp);
  row["kind"] = ToString(point.kind);
  row["trigger"] = ToString(point.trigger);
  row["description"] = point.description;
  row["size_bytes"] = point.size_bytes;
  row["checksum"] = point.checksum;
  row["key_id"] = point.key_id;
  row["status"] = ToString(point.status);
  row["metadata"] = {
      {"schema_version", point.metadata.schema_version},
      {"collections", point.metadata.collections},
      {"record_counts", point.metadata.record_counts},
  };
  return row;
}

Expected<RecoveryPoint, Error> RecoveryPointFromJson(const nlohmann::json& row) {
  const std::string what = "recovery point";
  if (!row.is_object() || !row.contains("id") || !row["id"].is_number_unsigned()) {
    return MakeUnexpected(Corrupted(what, "missing id"));
  }

  RecoveryPoint point;
  point.id = row["id"].get<RecoveryPointId>();
  const std::string id_context = "id=" + std::to_string(point.id);

  auto timestamp = ParseTimestamp(row, "timestamp", what);
  if (!timestamp) {
    return MakeUnexpected(timestamp.error());
  }
  point.timestamp = *timestamp;

  try {
    auto kind = ParseRecoveryKind(row.at("kind").get<std::string>());
    auto trigger = ParseRecoveryTrigger(row.at("trigger").get<std::string>());
    auto status = ParseRecoveryStatus(row.at("status").get<std::string>());
    if (!kind || !trigger || !status) {
      return MakeUnexpected(Corrupted(what, "unknown kind, trigger or status (" + id_context + ")"));
    }
    point.kind = *kind;
    point.trigger = *trigger;
    point.status = *status;
    point.description = row.at("description").get<std::string>();
    point.size_bytes = row.at("size_bytes").get<uint64_t>();
    point.checksum = row.at("checksum").get<std::string>();
    point.key_id = row.value("key_id", "");

    const auto& metadata = row.at("metadata");
    point.metadata.schema_version = metadata.at("schema_version").get<std::string>();
    point.metadata.collections = metadata.at("collections").get<std::vector<std::string>>();
    point.metadata.record_counts = metadata.at("record_counts").get<std::map<std::string, uint64_t>>();
  } catch (const nlohmann::json::exception& e) {
    return MakeUnexpected(Corrupted(what, id_context + ": " + e.what()));
  }
  return point;
}

nlohmann::json ToJson(const RecoveryData& data) {
  nlohmann::json row;
  row["recovery_point_id"] = data.recovery_point_id;
  row["payload"] = crypto::Base64Encode(data.payload);
  row["timestamp"] = utils::FormatIso8601(data.timestamp);
  return row;
}

Expected<RecoveryData, Error> RecoveryDataFromJson(const nlohmann::json& row) {
  const std::string what = "recovery data";
  if (!row.is_object() || !row.contains("recovery_point_id") || !row["recovery_point_id"].is_number_unsigned()) {
    return MakeUnexpected(Corrupted(what, "missing recovery_point_id"));
  }

  RecoveryData data;
  data.recovery_point_id = row["recovery_point_id"].get<RecoveryPointId>();
  const std::string id_context = "recovery_point_id=" + std::to_string(data.recovery_point_id);

  if (!row.contains("payload") || !row["payload"].is_string()) {
    return MakeUnexpected(Corrupted(what, "missing payload (" + id_context + ")"));
  }
  auto payload = crypto::Base64Decode(row["payload"].get<std::string>());
  if (!payload) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryPayloadMalformed, "Recovery payload is not base64",
                                    id_context));
  }
  data.payload = std::move(*payload);

  auto timestamp = ParseTimestamp(row, "timestamp", what);
  if (!timestamp) {
    return MakeUnexpected(timestamp.error());
  }
  data.timestamp = *timestamp;
  return data;
}

nlohmann::json ToJson(const RestoreOptions& options) {
  nlohmann::json json;
  if (options.collections) {
    json["collections"] = *options.collections;
  } else {
    json["collections"] = nullptr;
  }
  json["validate"] = options.validate;
  json["preserve_audit_trail"] = options.preserve_audit_trail;
  json["notify_users"] = options.notify_users;
  return json;
}

}  // namespace talentvault::recovery
