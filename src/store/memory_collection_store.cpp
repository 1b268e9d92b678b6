/**
 * @file memory_collection_store.cpp
 * @brief In-memory collection store implementation
 */

#include "store/memory_collection_store.h"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "utils/structured_log.h"

namespace talentvault::store {

namespace {

constexpr const char* kFileFormat = "talentvault-store";

Expected<void, Error> CheckRecords(const std::string& name, const Records& records) {
  for (size_t i = 0; i < records.size(); ++i) {
    if (!records[i].is_object()) {
      return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Record is not a JSON object",
                                      name + "[" + std::to_string(i) + "]"));
    }
  }
  return {};
}

Error NotFound(const std::string& name) {
  return MakeError(utils::ErrorCode::kStorageCollectionNotFound, "Collection not found: " + name, name);
}

}  // namespace

uint32_t CalculateCRC32(const std::string& data) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
}

/**
 * @brief Staged transaction over shadow copies
 */
class MemoryCollectionStore::Transaction : public StoreTransaction {
 public:
  explicit Transaction(std::map<std::string, Records> shadows, std::set<std::string> existing)
      : shadows_(std::move(shadows)), existing_(std::move(existing)) {}

  Expected<Records, Error> ReadAll(const std::string& name) const override {
    auto iter = shadows_.find(name);
    if (iter == shadows_.end()) {
      return MakeUnexpected(NotLocked(name));
    }
    if (existing_.count(name) == 0 && dirty_.count(name) == 0) {
      return MakeUnexpected(NotFound(name));
    }
    return iter->second;
  }

  Expected<size_t, Error> Count(const std::string& name) const override {
    auto iter = shadows_.find(name);
    if (iter == shadows_.end()) {
      return MakeUnexpected(NotLocked(name));
    }
    if (existing_.count(name) == 0 && dirty_.count(name) == 0) {
      return MakeUnexpected(NotFound(name));
    }
    return iter->second.size();
  }

  Expected<void, Error> Clear(const std::string& name) override {
    auto iter = shadows_.find(name);
    if (iter == shadows_.end()) {
      return MakeUnexpected(NotLocked(name));
    }
    iter->second.clear();
    dirty_.insert(name);
    return {};
  }

  Expected<void, Error> BulkInsert(const std::string& name, const Records& records) override {
    auto iter = shadows_.find(name);
    if (iter == shadows_.end()) {
      return MakeUnexpected(NotLocked(name));
    }
    auto checked = CheckRecords(name, records);
    if (!checked) {
      return checked;
    }
    iter->second.insert(iter->second.end(), records.begin(), records.end());
    dirty_.insert(name);
    return {};
  }

  /**
   * @brief Move modified shadows into the target map
   */
  void CommitInto(std::map<std::string, Records>& collections) {
    for (const auto& name : dirty_) {
      collections[name] = std::move(shadows_[name]);
    }
  }

 private:
  static Error NotLocked(const std::string& name) {
    return MakeError(utils::ErrorCode::kStorageCollectionNotLocked,
                     "Collection was not declared by the transaction: " + name, name);
  }

  std::map<std::string, Records> shadows_;
  std::set<std::string> existing_;
  std::set<std::string> dirty_;
};

std::mutex& MemoryCollectionStore::WriterMutex(const std::string& name) {
  std::lock_guard<std::mutex> lock(writers_mutex_);
  auto& slot = writers_[name];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

Expected<std::vector<std::string>, Error> MemoryCollectionStore::ListCollections() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(collections_.size());
  for (const auto& [name, records] : collections_) {
    names.push_back(name);
  }
  return names;
}

Expected<Records, Error> MemoryCollectionStore::ReadAll(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto iter = collections_.find(name);
  if (iter == collections_.end()) {
    return MakeUnexpected(NotFound(name));
  }
  return iter->second;
}

Expected<size_t, Error> MemoryCollectionStore::Count(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto iter = collections_.find(name);
  if (iter == collections_.end()) {
    return MakeUnexpected(NotFound(name));
  }
  return iter->second.size();
}

Expected<Records, Error> MemoryCollectionStore::FindByField(const std::string& name, const std::string& field,
                                                            const Record& value) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto iter = collections_.find(name);
  if (iter == collections_.end()) {
    return MakeUnexpected(NotFound(name));
  }
  Records matches;
  for (const auto& record : iter->second) {
    if (FieldEquals(record, field, value)) {
      matches.push_back(record);
    }
  }
  return matches;
}

Expected<void, Error> MemoryCollectionStore::Clear(const std::string& name) {
  return WithTransaction({name}, [&name](StoreTransaction& txn) { return txn.Clear(name); });
}

Expected<void, Error> MemoryCollectionStore::BulkInsert(const std::string& name, const Records& records) {
  return WithTransaction({name}, [&name, &records](StoreTransaction& txn) { return txn.BulkInsert(name, records); });
}

Expected<void, Error> MemoryCollectionStore::CreateCollection(const std::string& name) {
  if (name.empty()) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Collection name must not be empty"));
  }
  std::lock_guard<std::mutex> writer(WriterMutex(name));
  std::unique_lock<std::shared_mutex> lock(mutex_);
  collections_.try_emplace(name);
  return {};
}

Expected<void, Error> MemoryCollectionStore::WithTransaction(const std::vector<std::string>& names,
                                                             const TransactionFn& fn) {
  // std::set gives the sorted, de-duplicated lock order
  std::set<std::string> declared(names.begin(), names.end());
  for (const auto& name : declared) {
    if (name.empty()) {
      return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Collection name must not be empty"));
    }
  }

  std::vector<std::unique_lock<std::mutex>> writer_locks;
  writer_locks.reserve(declared.size());
  for (const auto& name : declared) {
    writer_locks.emplace_back(WriterMutex(name));
  }

  std::map<std::string, Records> shadows;
  std::set<std::string> existing;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& name : declared) {
      auto iter = collections_.find(name);
      if (iter != collections_.end()) {
        shadows.emplace(name, iter->second);
        existing.insert(name);
      } else {
        shadows.emplace(name, Records{});
      }
    }
  }

  Transaction txn(std::move(shadows), std::move(existing));
  Expected<void, Error> result;
  try {
    result = fn(txn);
  } catch (const std::exception& e) {
    spdlog::warn("Transaction body threw, rolling back: {}", e.what());
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageTransactionFailed, "Transaction aborted", e.what()));
  }
  if (!result) {
    spdlog::debug("Transaction rolled back: {}", result.error().to_string());
    return result;
  }

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    txn.CommitInto(collections_);
  }
  return {};
}

Expected<void, Error> MemoryCollectionStore::SaveToFile(const std::string& path) const {
  nlohmann::json collections = nlohmann::json::object();
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [name, records] : collections_) {
      collections[name] = records;
    }
  }

  std::string body;
  try {
    body = collections.dump();
  } catch (const nlohmann::json::type_error& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageWriteError, "Store contents are not serializable",
                                    e.what()));
  }

  nlohmann::json document;
  document["format"] = kFileFormat;
  document["version"] = kStoreFileVersion;
  document["crc32"] = CalculateCRC32(body);
  document["collections"] = std::move(collections);

  std::string temp_path = path + ".tmp";
  try {
    std::filesystem::path file_path(path);
    if (file_path.has_parent_path()) {
      std::filesystem::create_directories(file_path.parent_path());
    }

    std::ofstream temp_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!temp_file.is_open()) {
      utils::LogStorageError("save", temp_path, "cannot open for writing");
      return MakeUnexpected(MakeError(utils::ErrorCode::kStorageWriteError, "Cannot open file for writing", temp_path));
    }
    temp_file << document.dump();
    temp_file.flush();
    if (!temp_file.good()) {
      temp_file.close();
      std::filesystem::remove(temp_path);
      utils::LogStorageError("save", temp_path, "write failed");
      return MakeUnexpected(MakeError(utils::ErrorCode::kStorageWriteError, "Failed to write store file", temp_path));
    }
    temp_file.close();

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
      std::filesystem::remove(temp_path);
      utils::LogStorageError("save", path, "rename failed");
      return MakeUnexpected(MakeError(utils::ErrorCode::kStorageWriteError, "Failed to rename store file", path));
    }
  } catch (const std::filesystem::filesystem_error& e) {
    utils::LogStorageError("save", path, e.what());
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageWriteError, "Filesystem error", e.what()));
  }

  spdlog::debug("Saved store to {}", path);
  return {};
}

Expected<void, Error> MemoryCollectionStore::LoadFromFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageFileNotFound, "Cannot open store file", path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error& e) {
    utils::LogStorageError("load", path, e.what());
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageInvalidFormat, "Store file is not valid JSON", path));
  }

  // Header fields are type-checked before get<>(), which throws on a type mismatch
  const bool has_format = document.is_object() && document.contains("format") && document["format"].is_string();
  if (!has_format || document["format"].get<std::string>() != kFileFormat || !document.contains("collections") ||
      !document["collections"].is_object() || !document.contains("crc32") ||
      !document["crc32"].is_number_unsigned()) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageInvalidFormat, "Not a store file", path));
  }
  if (!document.contains("version") || !document["version"].is_number_unsigned() ||
      document["version"].get<uint32_t>() != kStoreFileVersion) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageVersionMismatch, "Unsupported store file version", path));
  }

  const auto& collections = document["collections"];
  auto expected_crc = document["crc32"].get<uint32_t>();
  uint32_t actual_crc = CalculateCRC32(collections.dump());
  if (expected_crc != actual_crc) {
    spdlog::error("CRC32 mismatch in {}: expected 0x{:08x}, got 0x{:08x}", path, expected_crc, actual_crc);
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageCRCMismatch, "Store file checksum mismatch", path));
  }

  std::map<std::string, Records> loaded;
  for (const auto& item : collections.items()) {
    const std::string& name = item.key();
    const auto& records = item.value();
    if (!records.is_array()) {
      return MakeUnexpected(MakeError(utils::ErrorCode::kStorageCorrupted, "Collection is not an array", name));
    }
    Records& target = loaded[name];
    target.reserve(records.size());
    for (const auto& record : records) {
      if (!record.is_object()) {
        return MakeUnexpected(MakeError(utils::ErrorCode::kStorageCorrupted, "Record is not a JSON object", name));
      }
      target.push_back(record);
    }
  }

  size_t collection_count = loaded.size();
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    collections_ = std::move(loaded);
  }
  spdlog::info("Loaded {} collections from {}", collection_count, path);
  return {};
}

}  // namespace talentvault::store
