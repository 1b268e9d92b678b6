/**
 * @file recovery_manager.h
 * @brief Snapshot creation and transactional point-in-time restore
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "crypto/integrity_codec.h"
#include "recovery/audit_sink.h"
#include "recovery/recovery_catalog.h"
#include "recovery/recovery_types.h"
#include "recovery/schema_validator.h"
#include "store/collection_store.h"

namespace talentvault::recovery {

constexpr const char* kSystemActor = "system";
constexpr const char* kAuditResource = "recovery";
constexpr const char* kPreRestoreDescription = "automatic pre-restore snapshot";

struct RecoveryManagerOptions {
  std::string schema_version = kDefaultSchemaVersion;
  std::string audit_ip = "internal";
  std::string audit_user_agent = "system";
};

/**
 * @brief Recovery manager
 *
 * Store impact of errors:
 * - Every error returned before the write-back transaction leaves the live
 *   collections untouched. RestoreFromPoint() may already have written the
 *   pre-restore snapshot to the catalog at that point.
 * - kRecoveryRestoreFailed comes from the write-back transaction, which the
 *   store rolls back as a whole.
 *
 * All members are thread-safe. No lock is held across CreateSnapshot(); a
 * snapshot reads each collection consistently but not all collections at
 * one instant.
 */
class RecoveryManager {
 public:
  RecoveryManager(store::CollectionStore& store, RecoveryCatalog& catalog, const crypto::IntegrityCodec& codec,
                  const SchemaValidator& validator, AuditSink& audit_sink, RecoveryManagerOptions options = {});

  RecoveryManager(const RecoveryManager&) = delete;
  RecoveryManager& operator=(const RecoveryManager&) = delete;
  RecoveryManager(RecoveryManager&&) = delete;
  RecoveryManager& operator=(RecoveryManager&&) = delete;
  ~RecoveryManager() = default;

  /**
   * @brief Snapshot every collection except the recovery catalog
   *
   * @return Completed point. Errors raised after the point was persisted
   *         mark it failed and are reported as kRecoverySnapshotFailed.
   */
  Expected<RecoveryPoint, Error> CreateSnapshot(const std::string& description,
                                                RecoveryTrigger trigger = RecoveryTrigger::kManual,
                                                const std::string& actor = kSystemActor);

  /**
   * @brief Restore collections from a completed point
   *
   * Verifies integrity (and schemas when options.validate is set), takes a
   * pre-restore snapshot, then replaces the target collections in one
   * store transaction.
   */
  Expected<RestoreResult, Error> RestoreFromPoint(RecoveryPointId id, const RestoreOptions& options = {},
                                                  const std::string& actor = kSystemActor);

  /**
   * @brief All points, newest first
   */
  [[nodiscard]] Expected<std::vector<RecoveryPoint>, Error> ListRecoveryPoints() const;

  /**
   * @brief Delete a point and its data atomically
   *
   * @return kRecoveryPointNotFound if the id does not exist
   */
  Expected<void, Error> DeleteRecoveryPoint(RecoveryPointId id, const std::string& actor = kSystemActor);

  /**
   * @brief Decrypt, verify and schema-check a point without touching the live store
   *
   * @return One entry per collection in the payload
   */
  [[nodiscard]] Expected<std::vector<CollectionValidation>, Error> ValidateRecoveryPoint(RecoveryPointId id) const;

  /**
   * @brief Decrypt and checksum-verify a point
   */
  [[nodiscard]] Expected<RecoveryPoint, Error> VerifyRecoveryPoint(RecoveryPointId id) const;

  /**
   * @brief Retention: keep the newest `retain` completed points
   *
   * Older completed points and failed points outside the retained window
   * are deleted. Pending points are never touched.
   *
   * @return Ids of deleted points
   */
  Expected<std::vector<RecoveryPointId>, Error> PruneRecoveryPoints(size_t retain,
                                                                    const std::string& actor = kSystemActor);

  /**
   * @brief Register a listener called after restores with notify_users set
   */
  void AddRestoreListener(RestoreListener listener);

 private:
  struct VerifiedPayload {
    RecoveryPoint point;
    nlohmann::json payload;  // collection -> [records]
  };

  Expected<VerifiedPayload, Error> LoadVerifiedPayload(RecoveryPointId id) const;
  std::vector<CollectionValidation> ValidatePayload(const nlohmann::json& payload) const;
  Error FailSnapshot(RecoveryPointId id, const Error& cause);
  void EmitAudit(const std::string& actor, const std::string& action, const nlohmann::json& details);
  void NotifyRestoreListeners(const RestoreResult& result);

  store::CollectionStore& store_;
  RecoveryCatalog& catalog_;
  const crypto::IntegrityCodec& codec_;
  const SchemaValidator& validator_;
  AuditSink& audit_sink_;
  RecoveryManagerOptions options_;

  std::mutex listeners_mutex_;
  std::vector<RestoreListener> listeners_;
};

}  // namespace talentvault::recovery
