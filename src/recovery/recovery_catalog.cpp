/**
 * @file recovery_catalog.cpp
 * @brief Recovery catalog implementation
 */

#include "recovery/recovery_catalog.h"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "store/collection_id.h"

namespace talentvault::recovery {

namespace {

constexpr const char* kPointId = "id";
constexpr const char* kDataPointId = "recovery_point_id";
constexpr const char* kNextId = "next_id";

const std::string& PointsCollection() {
  static const std::string name(store::CollectionName(store::CollectionId::kRecoveryPoints));
  return name;
}

const std::string& DataCollection() {
  static const std::string name(store::CollectionName(store::CollectionId::kRecoveryData));
  return name;
}

const std::string& SequenceCollection() {
  static const std::string name(store::CollectionName(store::CollectionId::kRecoverySequence));
  return name;
}

/**
 * @brief ReadAll that treats a missing collection as empty
 */
template <typename Source>
Expected<store::Records, Error> ReadRows(const Source& source, const std::string& name) {
  auto rows = source.ReadAll(name);
  if (!rows && rows.error().code() == utils::ErrorCode::kStorageCollectionNotFound) {
    return store::Records{};
  }
  return rows;
}

/**
 * @brief Rows whose id field equals id; a missing collection has none
 */
Expected<store::Records, Error> FindRows(const store::CollectionStore& store, const std::string& name,
                                         const char* key, RecoveryPointId id) {
  auto rows = store.FindByField(name, key, nlohmann::json(id));
  if (!rows && rows.error().code() == utils::ErrorCode::kStorageCollectionNotFound) {
    return store::Records{};
  }
  return rows;
}

bool MatchesId(const nlohmann::json& row, const char* key, RecoveryPointId id) {
  return row.is_object() && row.contains(key) && row[key].is_number_unsigned() &&
         row[key].get<RecoveryPointId>() == id;
}

store::Records SingleRow(nlohmann::json row) {
  store::Records rows;
  rows.push_back(std::move(row));
  return rows;
}

Error PointNotFound(RecoveryPointId id) {
  return MakeError(utils::ErrorCode::kRecoveryPointNotFound, "Recovery point not found",
                   "id=" + std::to_string(id));
}

}  // namespace

Expected<RecoveryPointId, Error> RecoveryCatalog::AddPoint(const RecoveryPoint& point) {
  RecoveryPointId assigned = 0;
  auto result = store_.WithTransaction(
      {PointsCollection(), SequenceCollection()}, [&](store::StoreTransaction& txn) -> Expected<void, Error> {
        auto sequence_rows = ReadRows(txn, SequenceCollection());
        if (!sequence_rows) {
          return MakeUnexpected(sequence_rows.error());
        }
        auto point_rows = ReadRows(txn, PointsCollection());
        if (!point_rows) {
          return MakeUnexpected(point_rows.error());
        }

        RecoveryPointId next_id = 1;
        if (!sequence_rows->empty()) {
          const auto& row = sequence_rows->front();
          if (!row.contains(kNextId) || !row[kNextId].is_number_unsigned()) {
            return MakeUnexpected(
                MakeError(utils::ErrorCode::kStorageCorrupted, "Malformed recovery sequence row", row.dump()));
          }
          next_id = row[kNextId].get<RecoveryPointId>();
        }
        // Sequence row may be missing or stale (e.g. hand-edited store file)
        for (const auto& row : *point_rows) {
          if (row.is_object() && row.contains(kPointId) && row[kPointId].is_number_unsigned()) {
            next_id = std::max(next_id, row[kPointId].get<RecoveryPointId>() + 1);
          }
        }

        RecoveryPoint stored = point;
        stored.id = next_id;

        nlohmann::json sequence_row = nlohmann::json::object();
        sequence_row[kNextId] = next_id + 1;
        auto cleared = txn.Clear(SequenceCollection());
        if (!cleared) {
          return cleared;
        }
        auto inserted = txn.BulkInsert(SequenceCollection(), SingleRow(std::move(sequence_row)));
        if (!inserted) {
          return inserted;
        }
        inserted = txn.BulkInsert(PointsCollection(), SingleRow(ToJson(stored)));
        if (!inserted) {
          return inserted;
        }
        assigned = next_id;
        return {};
      });
  if (!result) {
    return MakeUnexpected(result.error());
  }

  spdlog::debug("Catalog: added recovery point {}", assigned);
  return assigned;
}

Expected<void, Error> RecoveryCatalog::UpdatePointStatus(RecoveryPointId id, RecoveryStatus status) {
  if (status == RecoveryStatus::kPending) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryInvalidState,
                                    "Recovery point status cannot return to pending", "id=" + std::to_string(id)));
  }

  return store_.WithTransaction({PointsCollection()}, [&](store::StoreTransaction& txn) -> Expected<void, Error> {
    auto rows = ReadRows(txn, PointsCollection());
    if (!rows) {
      return MakeUnexpected(rows.error());
    }

    auto iter = std::find_if(rows->begin(), rows->end(),
                             [id](const nlohmann::json& row) { return MatchesId(row, kPointId, id); });
    if (iter == rows->end()) {
      return MakeUnexpected(PointNotFound(id));
    }

    auto current = RecoveryPointFromJson(*iter);
    if (!current) {
      return MakeUnexpected(current.error());
    }
    if (current->status != RecoveryStatus::kPending) {
      return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryInvalidState,
                                      std::string("Recovery point is already ") + ToString(current->status),
                                      "id=" + std::to_string(id)));
    }

    (*iter)["status"] = ToString(status);
    auto cleared = txn.Clear(PointsCollection());
    if (!cleared) {
      return cleared;
    }
    return txn.BulkInsert(PointsCollection(), *rows);
  });
}

Expected<std::optional<RecoveryPoint>, Error> RecoveryCatalog::GetPoint(RecoveryPointId id) const {
  auto rows = FindRows(store_, PointsCollection(), kPointId, id);
  if (!rows) {
    return MakeUnexpected(rows.error());
  }
  for (const auto& row : *rows) {
    if (MatchesId(row, kPointId, id)) {
      auto point = RecoveryPointFromJson(row);
      if (!point) {
        return MakeUnexpected(point.error());
      }
      return std::optional<RecoveryPoint>(std::move(*point));
    }
  }
  return std::optional<RecoveryPoint>();
}

Expected<void, Error> RecoveryCatalog::AddData(const RecoveryData& data) {
  const RecoveryPointId id = data.recovery_point_id;
  return store_.WithTransaction(
      {PointsCollection(), DataCollection()}, [&](store::StoreTransaction& txn) -> Expected<void, Error> {
        auto point_rows = ReadRows(txn, PointsCollection());
        if (!point_rows) {
          return MakeUnexpected(point_rows.error());
        }
        if (std::none_of(point_rows->begin(), point_rows->end(),
                         [id](const nlohmann::json& row) { return MatchesId(row, kPointId, id); })) {
          return MakeUnexpected(PointNotFound(id));
        }

        auto data_rows = ReadRows(txn, DataCollection());
        if (!data_rows) {
          return MakeUnexpected(data_rows.error());
        }
        if (std::any_of(data_rows->begin(), data_rows->end(),
                        [id](const nlohmann::json& row) { return MatchesId(row, kDataPointId, id); })) {
          return MakeUnexpected(MakeError(utils::ErrorCode::kAlreadyExists, "Recovery data already exists",
                                          "id=" + std::to_string(id)));
        }

        return txn.BulkInsert(DataCollection(), SingleRow(ToJson(data)));
      });
}

Expected<std::optional<RecoveryData>, Error> RecoveryCatalog::GetData(RecoveryPointId id) const {
  auto rows = FindRows(store_, DataCollection(), kDataPointId, id);
  if (!rows) {
    return MakeUnexpected(rows.error());
  }
  for (const auto& row : *rows) {
    if (MatchesId(row, kDataPointId, id)) {
      auto data = RecoveryDataFromJson(row);
      if (!data) {
        return MakeUnexpected(data.error());
      }
      return std::optional<RecoveryData>(std::move(*data));
    }
  }
  return std::optional<RecoveryData>();
}

Expected<std::vector<RecoveryPoint>, Error> RecoveryCatalog::ListPoints() const {
  auto rows = ReadRows(store_, PointsCollection());
  if (!rows) {
    return MakeUnexpected(rows.error());
  }

  std::vector<RecoveryPoint> points;
  points.reserve(rows->size());
  for (const auto& row : *rows) {
    auto point = RecoveryPointFromJson(row);
    if (!point) {
      return MakeUnexpected(point.error());
    }
    points.push_back(std::move(*point));
  }

  std::sort(points.begin(), points.end(), [](const RecoveryPoint& lhs, const RecoveryPoint& rhs) {
    if (lhs.timestamp != rhs.timestamp) {
      return lhs.timestamp > rhs.timestamp;
    }
    return lhs.id > rhs.id;
  });
  return points;
}

Expected<void, Error> RecoveryCatalog::DeletePoint(RecoveryPointId id) {
  auto result = store_.WithTransaction(
      {PointsCollection(), DataCollection()}, [&](store::StoreTransaction& txn) -> Expected<void, Error> {
        auto point_rows = ReadRows(txn, PointsCollection());
        if (!point_rows) {
          return MakeUnexpected(point_rows.error());
        }
        auto data_rows = ReadRows(txn, DataCollection());
        if (!data_rows) {
          return MakeUnexpected(data_rows.error());
        }

        size_t points_before = point_rows->size();
        size_t data_before = data_rows->size();
        point_rows->erase(std::remove_if(point_rows->begin(), point_rows->end(),
                                         [id](const nlohmann::json& row) { return MatchesId(row, kPointId, id); }),
                          point_rows->end());
        data_rows->erase(std::remove_if(data_rows->begin(), data_rows->end(),
                                        [id](const nlohmann::json& row) { return MatchesId(row, kDataPointId, id); }),
                         data_rows->end());
        if (point_rows->size() == points_before && data_rows->size() == data_before) {
          return MakeUnexpected(PointNotFound(id));
        }

        auto status = txn.Clear(PointsCollection());
        if (!status) {
          return status;
        }
        status = txn.BulkInsert(PointsCollection(), *point_rows);
        if (!status) {
          return status;
        }
        status = txn.Clear(DataCollection());
        if (!status) {
          return status;
        }
        return txn.BulkInsert(DataCollection(), *data_rows);
      });
  if (!result) {
    return result;
  }

  spdlog::debug("Catalog: deleted recovery point {}", id);
  return {};
}

}  // namespace talentvault::recovery
