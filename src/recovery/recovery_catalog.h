/**
 * @file recovery_catalog.h
 * @brief Persistent index of recovery points and their encrypted data
 */

#pragma once

#include <optional>
#include <vector>

#include "recovery/recovery_types.h"
#include "store/collection_store.h"

namespace talentvault::recovery {

/**
 * @brief Recovery catalog stored in the recoveryPoints, recoveryData and
 * recoverySequence collections
 *
 * Every mutation is a single store transaction, so the catalog inherits
 * the store's thread safety and atomicity. Ids come from a persisted
 * sequence and are never reused.
 */
class RecoveryCatalog {
 public:
  explicit RecoveryCatalog(store::CollectionStore& store) : store_(store) {}

  /**
   * @brief Persist a new point
   *
   * point.id is ignored and replaced by the next sequence value.
   *
   * @return Assigned id
   */
  [[nodiscard]] Expected<RecoveryPointId, Error> AddPoint(const RecoveryPoint& point);

  /**
   * @brief Move a pending point to completed or failed
   *
   * @return kRecoveryPointNotFound if absent, kRecoveryInvalidState if the
   *         point is not pending or status is kPending
   */
  Expected<void, Error> UpdatePointStatus(RecoveryPointId id, RecoveryStatus status);

  [[nodiscard]] Expected<std::optional<RecoveryPoint>, Error> GetPoint(RecoveryPointId id) const;

  /**
   * @brief Persist the data of an existing point
   *
   * The duplicate check reads every recoveryData row inside the
   * transaction, so its cost grows with the catalog's total payload size.
   *
   * @return kRecoveryPointNotFound if the point does not exist,
   *         kAlreadyExists if the point already has data
   */
  Expected<void, Error> AddData(const RecoveryData& data);

  [[nodiscard]] Expected<std::optional<RecoveryData>, Error> GetData(RecoveryPointId id) const;

  /**
   * @brief All points, newest first (ties: higher id first)
   */
  [[nodiscard]] Expected<std::vector<RecoveryPoint>, Error> ListPoints() const;

  /**
   * @brief Remove a point and its data in one transaction
   *
   * Both collections are rewritten, so the cost grows with the catalog size.
   *
   * @return kRecoveryPointNotFound if neither exists
   */
  Expected<void, Error> DeletePoint(RecoveryPointId id);

 private:
  store::CollectionStore& store_;
};

}  // namespace talentvault::recovery
