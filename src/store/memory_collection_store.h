/**
 * @file memory_collection_store.h
 * @brief In-memory CollectionStore with staged transactions and file persistence
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "store/collection_store.h"

namespace talentvault::store {

constexpr uint32_t kStoreFileVersion = 1;

/**
 * @brief In-memory collection store
 *
 * Transactions stage shadow copies of their declared collections and swap
 * them in under the exclusive lock at commit, so readers (shared lock)
 * never observe a partial commit. Each collection has a writer mutex;
 * transactions acquire them in sorted name order, which serializes
 * overlapping transactions without deadlock.
 *
 * Thread-safe.
 */
class MemoryCollectionStore : public CollectionStore {
 public:
  MemoryCollectionStore() = default;
  ~MemoryCollectionStore() override = default;

  MemoryCollectionStore(const MemoryCollectionStore&) = delete;
  MemoryCollectionStore& operator=(const MemoryCollectionStore&) = delete;
  MemoryCollectionStore(MemoryCollectionStore&&) = delete;
  MemoryCollectionStore& operator=(MemoryCollectionStore&&) = delete;

  Expected<std::vector<std::string>, Error> ListCollections() const override;
  Expected<Records, Error> ReadAll(const std::string& name) const override;
  Expected<size_t, Error> Count(const std::string& name) const override;
  Expected<Records, Error> FindByField(const std::string& name, const std::string& field,
                                       const Record& value) const override;
  Expected<void, Error> Clear(const std::string& name) override;
  Expected<void, Error> BulkInsert(const std::string& name, const Records& records) override;
  Expected<void, Error> WithTransaction(const std::vector<std::string>& names, const TransactionFn& fn) override;

  /**
   * @brief Register an empty collection (no-op if it exists)
   */
  Expected<void, Error> CreateCollection(const std::string& name);

  /**
   * @brief Write all collections to a file
   *
   * The file is a JSON document whose "collections" member is protected by
   * a CRC32. Written to "<path>.tmp" and renamed over the target.
   */
  Expected<void, Error> SaveToFile(const std::string& path) const;

  /**
   * @brief Replace the store contents with a file written by SaveToFile()
   *
   * The current contents are kept if the file cannot be read or verified.
   */
  Expected<void, Error> LoadFromFile(const std::string& path);

 private:
  class Transaction;

  /// Writer mutex of a collection, created on first use
  std::mutex& WriterMutex(const std::string& name);

  mutable std::shared_mutex mutex_;  // Guards collections_
  std::map<std::string, Records> collections_;

  std::mutex writers_mutex_;  // Guards writers_
  std::map<std::string, std::unique_ptr<std::mutex>> writers_;
};

/**
 * @brief CRC32 (zlib) of a byte string
 */
uint32_t CalculateCRC32(const std::string& data);

}  // namespace talentvault::store
