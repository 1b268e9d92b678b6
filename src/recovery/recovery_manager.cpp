/**
 * @file recovery_manager.cpp
 * @brief Recovery manager implementation
 */

#include "recovery/recovery_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

#include "store/collection_id.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace talentvault::recovery {

namespace {

std::string IdContext(RecoveryPointId id) {
  return "id=" + std::to_string(id);
}

Error IntegrityFailure(RecoveryPointId id, const std::string& reason) {
  return MakeError(utils::ErrorCode::kRecoveryIntegrityError, "Data integrity check failed: " + reason,
                   IdContext(id));
}

const std::string& AuditCollection() {
  static const std::string name(store::CollectionName(store::CollectionId::kAuditLogs));
  return name;
}

}  // namespace

RecoveryManager::RecoveryManager(store::CollectionStore& store, RecoveryCatalog& catalog,
                                 const crypto::IntegrityCodec& codec, const SchemaValidator& validator,
                                 AuditSink& audit_sink, RecoveryManagerOptions options)
    : store_(store),
      catalog_(catalog),
      codec_(codec),
      validator_(validator),
      audit_sink_(audit_sink),
      options_(std::move(options)) {}

Expected<RecoveryPoint, Error> RecoveryManager::CreateSnapshot(const std::string& description,
                                                               RecoveryTrigger trigger, const std::string& actor) {
  auto listed = store_.ListCollections();
  if (!listed) {
    utils::LogStorageError("list_collections", "*", listed.error().to_string());
    return MakeUnexpected(listed.error());
  }

  RecoveryMetadata metadata;
  metadata.schema_version = options_.schema_version;
  nlohmann::json payload = nlohmann::json::object();
  for (const auto& name : *listed) {
    if (store::IsCatalogCollection(name)) {
      continue;
    }
    auto records = store_.ReadAll(name);
    if (!records) {
      utils::LogStorageError("snapshot_read", name, records.error().to_string());
      return MakeUnexpected(records.error());
    }
    metadata.collections.push_back(name);
    metadata.record_counts[name] = records->size();
    payload[name] = std::move(*records);
  }

  auto serialized = crypto::IntegrityCodec::CanonicalSerialize(payload);
  if (!serialized) {
    return MakeUnexpected(serialized.error());
  }
  auto checksum = crypto::IntegrityCodec::ChecksumBytes(*serialized);
  if (!checksum) {
    return MakeUnexpected(checksum.error());
  }

  RecoveryPoint point;
  point.timestamp = utils::NowMillis();
  point.kind = RecoveryKind::kFull;
  point.trigger = trigger;
  point.description = description;
  point.size_bytes = serialized->size();
  point.checksum = *checksum;
  point.key_id = codec_.KeyId();
  point.status = RecoveryStatus::kPending;
  point.metadata = std::move(metadata);

  auto point_id = catalog_.AddPoint(point);
  if (!point_id) {
    return MakeUnexpected(point_id.error());
  }
  point.id = *point_id;

  // From here on the point exists in the catalog and failures mark it failed
  auto envelope = codec_.Encrypt(*serialized);
  if (!envelope) {
    return MakeUnexpected(FailSnapshot(point.id, envelope.error()));
  }

  RecoveryData data;
  data.recovery_point_id = point.id;
  data.payload = std::move(*envelope);
  data.timestamp = std::max(utils::NowMillis(), point.timestamp);
  auto stored = catalog_.AddData(data);
  if (!stored) {
    return MakeUnexpected(FailSnapshot(point.id, stored.error()));
  }

  auto completed = catalog_.UpdatePointStatus(point.id, RecoveryStatus::kCompleted);
  if (!completed) {
    return MakeUnexpected(FailSnapshot(point.id, completed.error()));
  }
  point.status = RecoveryStatus::kCompleted;

  utils::StructuredLog()
      .Event("recovery_point_created")
      .Field("recovery_point_id", static_cast<uint64_t>(point.id))
      .Field("trigger", ToString(trigger))
      .Field("collections", static_cast<uint64_t>(point.metadata.collections.size()))
      .Field("size", utils::FormatBytes(point.size_bytes))
      .Info();

  EmitAudit(actor, "create_recovery_point",
            {{"recoveryPointId", point.id}, {"type", ToString(trigger)}, {"description", description}});
  return point;
}

Error RecoveryManager::FailSnapshot(RecoveryPointId id, const Error& cause) {
  utils::LogRecoveryError("create_snapshot", id, cause.to_string());
  auto marked = catalog_.UpdatePointStatus(id, RecoveryStatus::kFailed);
  if (!marked) {
    utils::LogRecoveryError("mark_failed", id, marked.error().to_string());
  }
  return MakeError(utils::ErrorCode::kRecoverySnapshotFailed, "Failed to create recovery point " + std::to_string(id),
                   cause.to_string());
}

Expected<RecoveryManager::VerifiedPayload, Error> RecoveryManager::LoadVerifiedPayload(RecoveryPointId id) const {
  auto point = catalog_.GetPoint(id);
  if (!point) {
    return MakeUnexpected(point.error());
  }
  if (!point->has_value()) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryPointNotFound, "Recovery point not found", IdContext(id)));
  }
  const RecoveryPoint& found = **point;
  if (found.status != RecoveryStatus::kCompleted) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryInvalidState,
                                    std::string("Recovery point is ") + ToString(found.status), IdContext(id)));
  }
  if (found.kind != RecoveryKind::kFull) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryInvalidState,
                                    std::string("Unsupported recovery kind: ") + ToString(found.kind), IdContext(id)));
  }

  auto data = catalog_.GetData(id);
  if (!data) {
    if (data.error().code() == utils::ErrorCode::kRecoveryPayloadMalformed) {
      utils::LogRecoveryError("decode", id, data.error().to_string());
      return MakeUnexpected(IntegrityFailure(id, "payload is not a valid envelope"));
    }
    return MakeUnexpected(data.error());
  }
  if (!data->has_value()) {
    // A completed point always has data; this is catalog corruption
    utils::StructuredLog()
        .Event("recovery_data_missing")
        .Field("recovery_point_id", static_cast<uint64_t>(id))
        .Message("completed recovery point has no recovery data")
        .Critical();
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryDataNotFound, "Recovery data not found", IdContext(id)));
  }

  const bool key_recorded = !found.key_id.empty();
  if (key_recorded && found.key_id != codec_.KeyId()) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryDecryptionError,
                                    "Recovery point was encrypted with a different key", IdContext(id)));
  }

  auto plaintext = codec_.Decrypt((*data)->payload);
  if (!plaintext) {
    const auto code = plaintext.error().code();
    // With the right key, an envelope that does not open has been modified
    if (code == utils::ErrorCode::kCryptoAuthenticationFailed ||
        (key_recorded && code == utils::ErrorCode::kRecoveryDecryptionError)) {
      utils::LogRecoveryError("decrypt", id, plaintext.error().to_string());
      return MakeUnexpected(IntegrityFailure(id, "ciphertext failed authentication"));
    }
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryDecryptionError, "Failed to decrypt recovery data",
                                    plaintext.error().to_string()));
  }

  // The plaintext is the canonical serialization the checksum was computed over
  auto checksum = crypto::IntegrityCodec::ChecksumBytes(*plaintext);
  if (!checksum) {
    return MakeUnexpected(checksum.error());
  }
  if (*checksum != found.checksum) {
    utils::LogRecoveryError("verify", id, "checksum mismatch");
    return MakeUnexpected(IntegrityFailure(id, "checksum mismatch"));
  }

  auto payload = crypto::IntegrityCodec::ParsePayload(*plaintext);
  if (!payload || !payload->is_object()) {
    return MakeUnexpected(IntegrityFailure(id, "payload is not a collection mapping"));
  }
  for (const auto& item : payload->items()) {
    if (!item.value().is_array()) {
      return MakeUnexpected(IntegrityFailure(id, "collection " + item.key() + " is not a record array"));
    }
  }

  return VerifiedPayload{found, std::move(*payload)};
}

std::vector<CollectionValidation> RecoveryManager::ValidatePayload(const nlohmann::json& payload) const {
  std::vector<CollectionValidation> results;
  for (const auto& item : payload.items()) {
    CollectionValidation result;
    result.collection = item.key();
    size_t index = 0;
    for (const auto& record : item.value()) {
      ValidationOutcome outcome = validator_.Validate(item.key(), record);
      if (!outcome.success) {
        result.valid = false;
        for (const auto& error : outcome.errors) {
          result.errors.push_back("record " + std::to_string(index) + ": " + error);
        }
      }
      ++index;
    }
    results.push_back(std::move(result));
  }
  return results;
}

Expected<RestoreResult, Error> RecoveryManager::RestoreFromPoint(RecoveryPointId id, const RestoreOptions& options,
                                                                 const std::string& actor) {
  auto verified = LoadVerifiedPayload(id);
  if (!verified) {
    return MakeUnexpected(verified.error());
  }
  const nlohmann::json& payload = verified->payload;

  if (options.validate) {
    std::vector<std::string> invalid;
    std::vector<std::string> details;
    for (const auto& result : ValidatePayload(payload)) {
      if (!result.valid) {
        invalid.push_back(result.collection);
        details.push_back(result.collection + ": " + utils::Join(result.errors, "; "));
      }
    }
    if (!invalid.empty()) {
      utils::LogRecoveryError("validate", id, utils::Join(details, " | "));
      return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryValidationError,
                                      "Data validation failed for collections: " + utils::Join(invalid, ", "),
                                      utils::Join(details, " | ")));
    }
  }

  std::vector<std::string> targets;
  if (options.collections) {
    std::set<std::string> seen;
    for (const auto& name : *options.collections) {
      if (!payload.contains(name)) {
        return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument,
                                        "Collection is not part of recovery point: " + name, IdContext(id)));
      }
      if (seen.insert(name).second) {
        targets.push_back(name);
      }
    }
  } else {
    for (const auto& item : payload.items()) {
      targets.push_back(item.key());
    }
  }

  auto safety = CreateSnapshot(kPreRestoreDescription, RecoveryTrigger::kAutomatic, actor);
  if (!safety) {
    utils::LogRecoveryError("pre_restore_snapshot", id, safety.error().to_string());
    return MakeUnexpected(safety.error());
  }

  const bool preserve_audit = options.preserve_audit_trail;
  auto written = store_.WithTransaction(targets, [&](store::StoreTransaction& txn) -> Expected<void, Error> {
    for (const auto& name : targets) {
      if (preserve_audit && name == AuditCollection()) {
        continue;
      }
      auto cleared = txn.Clear(name);
      if (!cleared) {
        return cleared;
      }
      auto inserted = txn.BulkInsert(name, payload.at(name).get<store::Records>());
      if (!inserted) {
        return inserted;
      }
    }
    return {};
  });
  if (!written) {
    utils::LogRecoveryError("restore", id, written.error().to_string());
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryRestoreFailed,
                                    "Failed to restore from recovery point " + std::to_string(id),
                                    written.error().to_string()));
  }

  RestoreResult result;
  result.restored_collections = targets;
  result.recovery_point_id = id;
  result.pre_restore_point_id = safety->id;
  result.timestamp = utils::NowMillis();

  utils::StructuredLog()
      .Event("recovery_restored")
      .Field("recovery_point_id", static_cast<uint64_t>(id))
      .Field("pre_restore_point_id", static_cast<uint64_t>(safety->id))
      .Field("collections", utils::Join(targets, ","))
      .Field("preserve_audit_trail", preserve_audit)
      .Info();

  EmitAudit(actor, "restore_from_point",
            {{"recoveryPointId", id}, {"preRestoreSnapshotId", safety->id}, {"options", ToJson(options)}});

  if (options.notify_users) {
    NotifyRestoreListeners(result);
  }
  return result;
}

Expected<std::vector<RecoveryPoint>, Error> RecoveryManager::ListRecoveryPoints() const {
  return catalog_.ListPoints();
}

Expected<void, Error> RecoveryManager::DeleteRecoveryPoint(RecoveryPointId id, const std::string& actor) {
  auto deleted = catalog_.DeletePoint(id);
  if (!deleted) {
    return deleted;
  }
  spdlog::info("Deleted recovery point {}", id);
  EmitAudit(actor, "delete_recovery_point", {{"recoveryPointId", id}});
  return {};
}

Expected<std::vector<CollectionValidation>, Error> RecoveryManager::ValidateRecoveryPoint(RecoveryPointId id) const {
  auto verified = LoadVerifiedPayload(id);
  if (!verified) {
    return MakeUnexpected(verified.error());
  }
  return ValidatePayload(verified->payload);
}

Expected<RecoveryPoint, Error> RecoveryManager::VerifyRecoveryPoint(RecoveryPointId id) const {
  auto verified = LoadVerifiedPayload(id);
  if (!verified) {
    return MakeUnexpected(verified.error());
  }
  return std::move(verified->point);
}

Expected<std::vector<RecoveryPointId>, Error> RecoveryManager::PruneRecoveryPoints(size_t retain,
                                                                                   const std::string& actor) {
  auto points = catalog_.ListPoints();
  if (!points) {
    return MakeUnexpected(points.error());
  }

  std::vector<RecoveryPointId> doomed;
  size_t kept_completed = 0;
  for (const auto& point : *points) {
    switch (point.status) {
      case RecoveryStatus::kPending:
        break;
      case RecoveryStatus::kCompleted:
        if (kept_completed < retain) {
          ++kept_completed;
        } else {
          doomed.push_back(point.id);
        }
        break;
      case RecoveryStatus::kFailed:
        if (kept_completed >= retain) {
          doomed.push_back(point.id);
        }
        break;
    }
  }

  std::vector<RecoveryPointId> deleted;
  for (RecoveryPointId id : doomed) {
    auto removed = catalog_.DeletePoint(id);
    if (!removed) {
      // Deleted by someone else in the meantime
      if (removed.error().code() == utils::ErrorCode::kRecoveryPointNotFound) {
        continue;
      }
      utils::LogRecoveryError("prune", id, removed.error().to_string());
      return MakeUnexpected(removed.error());
    }
    deleted.push_back(id);
  }

  if (!deleted.empty()) {
    spdlog::info("Pruned {} recovery points (retain={})", deleted.size(), retain);
    EmitAudit(actor, "prune_recovery_points", {{"retain", retain}, {"deletedIds", deleted}});
  }
  return deleted;
}

void RecoveryManager::AddRestoreListener(RestoreListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void RecoveryManager::NotifyRestoreListeners(const RestoreResult& result) {
  std::vector<RestoreListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto& listener : listeners) {
    try {
      listener(result);
    } catch (const std::exception& e) {
      spdlog::warn("Restore listener failed for recovery point {}: {}", result.recovery_point_id, e.what());
    }
  }
  spdlog::debug("Notified {} restore listeners", listeners.size());
}

void RecoveryManager::EmitAudit(const std::string& actor, const std::string& action, const nlohmann::json& details) {
  AuditEvent event;
  event.user_id = actor;
  event.action = action;
  event.resource = kAuditResource;
  event.details = details;
  event.ip = options_.audit_ip;
  event.user_agent = options_.audit_user_agent;

  try {
    auto logged = audit_sink_.LogAudit(event);
    if (!logged) {
      utils::LogAuditSinkFailure(action, kAuditResource, details.dump(), logged.error().to_string());
    }
  } catch (const std::exception& e) {
    utils::LogAuditSinkFailure(action, kAuditResource, details.dump(), e.what());
  }
}

}  // namespace talentvault::recovery
