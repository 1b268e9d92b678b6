/**
 * @file memory_collection_store_test.cpp
 * @brief Unit tests for the in-memory collection store
 */

#include "store/memory_collection_store.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace talentvault::store;
using talentvault::utils::ErrorCode;
using talentvault::utils::Expected;
using talentvault::utils::Error;

namespace fs = std::filesystem;

namespace {

Record Candidate(const std::string& id, const std::string& name) {
  return Record{{"id", id}, {"name", name}};
}

/**
 * @brief Store that relies on the default FindByField()
 */
class ForwardingStore : public CollectionStore {
 public:
  explicit ForwardingStore(CollectionStore& inner) : inner_(inner) {}

  Expected<std::vector<std::string>, Error> ListCollections() const override { return inner_.ListCollections(); }
  Expected<Records, Error> ReadAll(const std::string& name) const override { return inner_.ReadAll(name); }
  Expected<size_t, Error> Count(const std::string& name) const override { return inner_.Count(name); }
  Expected<void, Error> Clear(const std::string& name) override { return inner_.Clear(name); }
  Expected<void, Error> BulkInsert(const std::string& name, const Records& records) override {
    return inner_.BulkInsert(name, records);
  }
  Expected<void, Error> WithTransaction(const std::vector<std::string>& names, const TransactionFn& fn) override {
    return inner_.WithTransaction(names, fn);
  }

 private:
  CollectionStore& inner_;
};

}  // namespace

class MemoryCollectionStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.CreateCollection("candidates"));
    ASSERT_TRUE(store_.CreateCollection("jobs"));
  }

  MemoryCollectionStore store_;
};

// ========== Basic operations ==========

TEST_F(MemoryCollectionStoreTest, ListCollectionsSorted) {
  ASSERT_TRUE(store_.CreateCollection("auditLogs"));
  auto names = store_.ListCollections();
  ASSERT_TRUE(names);
  EXPECT_EQ(*names, (std::vector<std::string>{"auditLogs", "candidates", "jobs"}));
}

TEST_F(MemoryCollectionStoreTest, CreateCollectionIsIdempotent) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada")}));
  ASSERT_TRUE(store_.CreateCollection("candidates"));
  EXPECT_EQ(*store_.Count("candidates"), 1U);

  auto empty = store_.CreateCollection("");
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(MemoryCollectionStoreTest, BulkInsertAppendsInOrder) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada"), Candidate("c2", "Grace")}));
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada")}));

  auto records = store_.ReadAll("candidates");
  ASSERT_TRUE(records);
  ASSERT_EQ(records->size(), 3U);
  EXPECT_EQ((*records)[0]["name"], "Ada");
  EXPECT_EQ((*records)[1]["name"], "Grace");
  EXPECT_EQ((*records)[2]["id"], "c1");  // Duplicates are kept
}

TEST_F(MemoryCollectionStoreTest, BulkInsertRejectsNonObjects) {
  auto result = store_.BulkInsert("candidates", {Candidate("c1", "Ada"), Record(42)});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(*store_.Count("candidates"), 0U);
}

TEST_F(MemoryCollectionStoreTest, ClearEmptiesCollection) {
  ASSERT_TRUE(store_.BulkInsert("jobs", {Record{{"id", "j1"}}}));
  ASSERT_TRUE(store_.Clear("jobs"));
  EXPECT_EQ(*store_.Count("jobs"), 0U);
}

TEST_F(MemoryCollectionStoreTest, MissingCollection) {
  auto records = store_.ReadAll("payroll");
  ASSERT_FALSE(records);
  EXPECT_EQ(records.error().code(), ErrorCode::kStorageCollectionNotFound);

  auto count = store_.Count("payroll");
  ASSERT_FALSE(count);
  EXPECT_EQ(count.error().code(), ErrorCode::kStorageCollectionNotFound);

  // Writes create the collection
  ASSERT_TRUE(store_.BulkInsert("payroll", {Record{{"employee", "e1"}}}));
  EXPECT_EQ(*store_.Count("payroll"), 1U);
}

// ========== Field lookup ==========

TEST_F(MemoryCollectionStoreTest, FindByFieldReturnsOnlyMatches) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada"), Candidate("c2", "Grace"),
                                               Candidate("c3", "Ada"), Record{{"name", 7}}}));

  auto matches = store_.FindByField("candidates", "name", "Ada");
  ASSERT_TRUE(matches);
  EXPECT_EQ(*matches, (Records{Candidate("c1", "Ada"), Candidate("c3", "Ada")}));

  auto none = store_.FindByField("candidates", "email", "ada@example.com");
  ASSERT_TRUE(none);
  EXPECT_TRUE(none->empty());

  auto missing = store_.FindByField("invoices", "id", 1);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kStorageCollectionNotFound);
}

TEST_F(MemoryCollectionStoreTest, FindByFieldComparesNumbersByValue) {
  ASSERT_TRUE(store_.BulkInsert("jobs", {Record{{"id", 3U}}, Record{{"id", "3"}}, Record{{"id", 4U}}}));

  auto matches = store_.FindByField("jobs", "id", static_cast<uint64_t>(3));
  ASSERT_TRUE(matches);
  ASSERT_EQ(matches->size(), 1U);
  EXPECT_EQ((*matches)[0], Record({{"id", 3U}}));
}

TEST_F(MemoryCollectionStoreTest, DefaultFindByFieldFiltersReadAll) {
  ForwardingStore forwarding(store_);
  ASSERT_TRUE(forwarding.BulkInsert("candidates", {Candidate("c1", "Ada"), Candidate("c2", "Grace")}));

  auto matches = forwarding.FindByField("candidates", "id", "c2");
  ASSERT_TRUE(matches);
  EXPECT_EQ(*matches, (Records{Candidate("c2", "Grace")}));

  auto missing = forwarding.FindByField("invoices", "id", "c2");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kStorageCollectionNotFound);
}

// ========== Transactions ==========

TEST_F(MemoryCollectionStoreTest, TransactionCommitsAllCollections) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("old", "Old")}));

  auto result = store_.WithTransaction({"jobs", "candidates"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    auto cleared = txn.Clear("candidates");
    if (!cleared) {
      return cleared;
    }
    auto inserted = txn.BulkInsert("candidates", {Candidate("c1", "Ada")});
    if (!inserted) {
      return inserted;
    }
    return txn.BulkInsert("jobs", {Record{{"id", "j1"}}});
  });
  ASSERT_TRUE(result) << result.error().to_string();

  auto candidates = store_.ReadAll("candidates");
  ASSERT_EQ(candidates->size(), 1U);
  EXPECT_EQ((*candidates)[0]["id"], "c1");
  EXPECT_EQ(*store_.Count("jobs"), 1U);
}

TEST_F(MemoryCollectionStoreTest, TransactionReadsOwnWrites) {
  auto result = store_.WithTransaction({"candidates"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    auto inserted = txn.BulkInsert("candidates", {Candidate("c1", "Ada")});
    if (!inserted) {
      return inserted;
    }
    auto count = txn.Count("candidates");
    EXPECT_TRUE(count);
    EXPECT_EQ(*count, 1U);
    auto records = txn.ReadAll("candidates");
    EXPECT_TRUE(records);
    EXPECT_EQ(records->size(), 1U);
    return {};
  });
  ASSERT_TRUE(result);
}

TEST_F(MemoryCollectionStoreTest, TransactionErrorRollsBack) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada")}));

  auto result = store_.WithTransaction({"candidates", "jobs"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    EXPECT_TRUE(txn.Clear("candidates"));
    EXPECT_TRUE(txn.BulkInsert("jobs", {Record{{"id", "j1"}}}));
    return talentvault::utils::MakeUnexpected(
        talentvault::utils::MakeError(ErrorCode::kStorageWriteError, "injected failure"));
  });
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageWriteError);

  EXPECT_EQ(*store_.Count("candidates"), 1U);
  EXPECT_EQ(*store_.Count("jobs"), 0U);
}

TEST_F(MemoryCollectionStoreTest, TransactionExceptionRollsBack) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada")}));

  auto result = store_.WithTransaction({"candidates"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    EXPECT_TRUE(txn.Clear("candidates"));
    throw std::runtime_error("disk on fire");
  });
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageTransactionFailed);
  EXPECT_EQ(result.error().context(), "disk on fire");
  EXPECT_EQ(*store_.Count("candidates"), 1U);
}

TEST_F(MemoryCollectionStoreTest, UndeclaredCollectionIsNotLocked) {
  auto result = store_.WithTransaction({"candidates"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    auto read = txn.ReadAll("jobs");
    EXPECT_FALSE(read);
    EXPECT_EQ(read.error().code(), ErrorCode::kStorageCollectionNotLocked);
    return txn.BulkInsert("jobs", {Record{{"id", "j1"}}});
  });
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageCollectionNotLocked);
  EXPECT_EQ(*store_.Count("jobs"), 0U);
}

TEST_F(MemoryCollectionStoreTest, TransactionReadOfAbsentCollection) {
  auto result = store_.WithTransaction({"payroll"}, [](StoreTransaction& txn) -> Expected<void, Error> {
    auto read = txn.ReadAll("payroll");
    EXPECT_FALSE(read);
    EXPECT_EQ(read.error().code(), ErrorCode::kStorageCollectionNotFound);
    return {};
  });
  ASSERT_TRUE(result);

  // Nothing was written, so the collection is still absent
  EXPECT_FALSE(store_.Count("payroll"));
}

TEST_F(MemoryCollectionStoreTest, ReadOnlyTransactionLeavesDataUntouched) {
  ASSERT_TRUE(store_.BulkInsert("jobs", {Record{{"id", "j1"}}, Record{{"id", "j2"}}}));
  size_t seen = 0;
  auto result = store_.WithTransaction({"jobs"}, [&seen](StoreTransaction& txn) -> Expected<void, Error> {
    auto count = txn.Count("jobs");
    if (!count) {
      return talentvault::utils::MakeUnexpected(count.error());
    }
    seen = *count;
    return {};
  });
  ASSERT_TRUE(result);
  EXPECT_EQ(seen, 2U);
  EXPECT_EQ(*store_.Count("jobs"), 2U);
}

TEST_F(MemoryCollectionStoreTest, ConcurrentTransactionsSerialize) {
  constexpr int kThreads = 8;
  constexpr int kIterations = 50;

  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < kThreads; ++t) {
    // Alternate declaration order to exercise lock ordering
    std::vector<std::string> names = (t % 2 == 0) ? std::vector<std::string>{"candidates", "jobs"}
                                                   : std::vector<std::string>{"jobs", "candidates"};
    threads.emplace_back([this, names, &failures]() {
      for (int i = 0; i < kIterations; ++i) {
        auto result = store_.WithTransaction(names, [](StoreTransaction& txn) -> Expected<void, Error> {
          auto inserted = txn.BulkInsert("candidates", {Record{{"n", 1}}});
          if (!inserted) {
            return inserted;
          }
          return txn.BulkInsert("jobs", {Record{{"n", 1}}});
        });
        if (!result) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(*store_.Count("candidates"), static_cast<size_t>(kThreads * kIterations));
  EXPECT_EQ(*store_.Count("jobs"), static_cast<size_t>(kThreads * kIterations));
}

// ========== Persistence ==========

class MemoryCollectionStoreFileTest : public MemoryCollectionStoreTest {
 protected:
  void SetUp() override {
    MemoryCollectionStoreTest::SetUp();
    test_dir_ = "/tmp/talentvault_store_test_" + std::to_string(std::time(nullptr)) + "_" +
                std::to_string(reinterpret_cast<uintptr_t>(this));  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  static std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  static void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
  }

  std::string test_dir_;
};

TEST_F(MemoryCollectionStoreFileTest, SaveAndLoad) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada"), Candidate("c2", "Grace")}));
  ASSERT_TRUE(store_.BulkInsert("jobs", {Record{{"id", "j1"}, {"openings", 2}}}));

  std::string path = test_dir_ + "/nested/store.json";
  auto saved = store_.SaveToFile(path);
  ASSERT_TRUE(saved) << saved.error().to_string();
  EXPECT_TRUE(fs::exists(path));
  EXPECT_FALSE(fs::exists(path + ".tmp"));

  MemoryCollectionStore loaded;
  auto result = loaded.LoadFromFile(path);
  ASSERT_TRUE(result) << result.error().to_string();

  EXPECT_EQ(*loaded.ListCollections(), *store_.ListCollections());
  EXPECT_EQ(*loaded.ReadAll("candidates"), *store_.ReadAll("candidates"));
  EXPECT_EQ((*loaded.ReadAll("jobs"))[0]["openings"], 2);
}

TEST_F(MemoryCollectionStoreFileTest, EmptyCollectionsSurviveReload) {
  std::string path = test_dir_ + "/store.json";
  ASSERT_TRUE(store_.SaveToFile(path));

  MemoryCollectionStore loaded;
  ASSERT_TRUE(loaded.LoadFromFile(path));
  EXPECT_EQ(*loaded.Count("candidates"), 0U);
  EXPECT_EQ(*loaded.Count("jobs"), 0U);
}

TEST_F(MemoryCollectionStoreFileTest, LoadMissingFile) {
  auto result = store_.LoadFromFile(test_dir_ + "/absent.json");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageFileNotFound);
}

TEST_F(MemoryCollectionStoreFileTest, TamperedFileFailsCrcAndKeepsContents) {
  ASSERT_TRUE(store_.BulkInsert("candidates", {Candidate("c1", "Ada")}));
  std::string path = test_dir_ + "/store.json";
  ASSERT_TRUE(store_.SaveToFile(path));

  std::string content = ReadFile(path);
  auto pos = content.find("Ada");
  ASSERT_NE(pos, std::string::npos);
  content.replace(pos, 3, "Eve");
  WriteFile(path, content);

  MemoryCollectionStore other;
  ASSERT_TRUE(other.BulkInsert("jobs", {Record{{"id", "keep"}}}));
  auto result = other.LoadFromFile(path);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageCRCMismatch);

  // Previous contents are kept
  EXPECT_EQ(*other.Count("jobs"), 1U);
  EXPECT_FALSE(other.Count("candidates"));
}

TEST_F(MemoryCollectionStoreFileTest, VersionMismatch) {
  std::string path = test_dir_ + "/store.json";
  ASSERT_TRUE(store_.SaveToFile(path));

  auto document = nlohmann::json::parse(ReadFile(path));
  document["version"] = kStoreFileVersion + 1;
  WriteFile(path, document.dump());

  auto result = store_.LoadFromFile(path);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageVersionMismatch);
}

TEST_F(MemoryCollectionStoreFileTest, InvalidFormat) {
  std::string path = test_dir_ + "/store.json";

  WriteFile(path, "not json at all");
  auto garbage = store_.LoadFromFile(path);
  ASSERT_FALSE(garbage);
  EXPECT_EQ(garbage.error().code(), ErrorCode::kStorageInvalidFormat);

  WriteFile(path, R"({"format": "something-else", "version": 1, "crc32": 0, "collections": {}})");
  auto foreign = store_.LoadFromFile(path);
  ASSERT_FALSE(foreign);
  EXPECT_EQ(foreign.error().code(), ErrorCode::kStorageInvalidFormat);

  WriteFile(path, R"({"format": 5, "version": 1, "crc32": 0, "collections": {}})");
  auto numeric_format = store_.LoadFromFile(path);
  ASSERT_FALSE(numeric_format);
  EXPECT_EQ(numeric_format.error().code(), ErrorCode::kStorageInvalidFormat);

  WriteFile(path, R"({"version": 1, "crc32": 0, "collections": {}})");
  auto missing_format = store_.LoadFromFile(path);
  ASSERT_FALSE(missing_format);
  EXPECT_EQ(missing_format.error().code(), ErrorCode::kStorageInvalidFormat);

  WriteFile(path, R"({"format": "talentvault-store", "version": "1", "crc32": 0, "collections": {}})");
  auto string_version = store_.LoadFromFile(path);
  ASSERT_FALSE(string_version);
  EXPECT_EQ(string_version.error().code(), ErrorCode::kStorageVersionMismatch);

  WriteFile(path, R"({"format": "talentvault-store", "version": -1, "crc32": 0, "collections": {}})");
  auto negative_version = store_.LoadFromFile(path);
  ASSERT_FALSE(negative_version);
  EXPECT_EQ(negative_version.error().code(), ErrorCode::kStorageVersionMismatch);
}

TEST_F(MemoryCollectionStoreFileTest, CorruptedCollectionShape) {
  nlohmann::json collections = {{"candidates", {1, 2, 3}}};
  nlohmann::json document;
  document["format"] = "talentvault-store";
  document["version"] = kStoreFileVersion;
  document["crc32"] = CalculateCRC32(collections.dump());
  document["collections"] = collections;

  std::string path = test_dir_ + "/store.json";
  WriteFile(path, document.dump());

  auto result = store_.LoadFromFile(path);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageCorrupted);
}

TEST(CalculateCRC32Test, KnownValue) {
  // Standard CRC-32 check value
  EXPECT_EQ(CalculateCRC32("123456789"), 0xCBF43926U);
  EXPECT_EQ(CalculateCRC32(""), 0U);
}
