/**
 * @file collection_store.h
 * @brief Abstract named-collection store with multi-collection transactions
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::store {

using utils::Error;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

/// One record: a JSON object
using Record = nlohmann::json;
using Records = std::vector<Record>;

/// True when record is an object whose top-level field equals value
inline bool FieldEquals(const Record& record, const std::string& field, const Record& value) {
  if (!record.is_object()) {
    return false;
  }
  auto iter = record.find(field);
  return iter != record.end() && *iter == value;
}

/**
 * @brief View of the store inside WithTransaction()
 *
 * Only the collections declared when the transaction was opened may be
 * accessed; anything else fails with kStorageCollectionNotLocked.
 * Reads observe the transaction's own uncommitted writes.
 */
class StoreTransaction {
 public:
  virtual ~StoreTransaction() = default;

  StoreTransaction() = default;
  StoreTransaction(const StoreTransaction&) = delete;
  StoreTransaction& operator=(const StoreTransaction&) = delete;
  StoreTransaction(StoreTransaction&&) = delete;
  StoreTransaction& operator=(StoreTransaction&&) = delete;

  virtual Expected<Records, Error> ReadAll(const std::string& name) const = 0;
  virtual Expected<size_t, Error> Count(const std::string& name) const = 0;
  virtual Expected<void, Error> Clear(const std::string& name) = 0;
  virtual Expected<void, Error> BulkInsert(const std::string& name, const Records& records) = 0;
};

/**
 * @brief Transaction body
 *
 * Returning an error (or throwing) rolls the transaction back.
 */
using TransactionFn = std::function<Expected<void, Error>(StoreTransaction&)>;

/**
 * @brief Collection store contract
 *
 * Implementations must be safe for concurrent use. ReadAll/Count on a
 * collection that does not exist fail with kStorageCollectionNotFound;
 * Clear/BulkInsert create it. Each call outside WithTransaction() is its
 * own atomic unit.
 */
class CollectionStore {
 public:
  virtual ~CollectionStore() = default;

  CollectionStore() = default;
  CollectionStore(const CollectionStore&) = delete;
  CollectionStore& operator=(const CollectionStore&) = delete;
  CollectionStore(CollectionStore&&) = delete;
  CollectionStore& operator=(CollectionStore&&) = delete;

  /**
   * @brief Names of all collections, sorted
   */
  virtual Expected<std::vector<std::string>, Error> ListCollections() const = 0;

  virtual Expected<Records, Error> ReadAll(const std::string& name) const = 0;

  virtual Expected<size_t, Error> Count(const std::string& name) const = 0;

  /**
   * @brief Records whose top-level field equals value
   *
   * The default filters a full ReadAll(). Implementations that can skip
   * copying non-matching records should override it.
   */
  virtual Expected<Records, Error> FindByField(const std::string& name, const std::string& field,
                                               const Record& value) const {
    auto records = ReadAll(name);
    if (!records) {
      return records;
    }
    Records matches;
    for (auto& record : *records) {
      if (FieldEquals(record, field, value)) {
        matches.push_back(std::move(record));
      }
    }
    return matches;
  }

  virtual Expected<void, Error> Clear(const std::string& name) = 0;

  /**
   * @brief Append records (no deduplication)
   *
   * Every record must be a JSON object.
   */
  virtual Expected<void, Error> BulkInsert(const std::string& name, const Records& records) = 0;

  /**
   * @brief Run fn with exclusive write access to the named collections
   *
   * All mutations made through the transaction become visible together
   * when fn succeeds, and none of them when it fails. Overlapping
   * transactions are serialized.
   *
   * @param names Collections the transaction may touch (order irrelevant)
   * @param fn Transaction body
   * @return fn's error, or kStorageTransactionFailed if fn threw
   */
  virtual Expected<void, Error> WithTransaction(const std::vector<std::string>& names, const TransactionFn& fn) = 0;
};

}  // namespace talentvault::store
