#include <gtest/gtest.h>
#include <sstream>
#include <filesystem>
#include <chrono>
#include <thread>
#include <atomic>
#include <iterator>
#include "core/errors.hpp"
#include "store/local_object_store.hpp"
#include "test_utils.hpp"

using namespace docxfer::store;
using docxfer::core::InvalidNameError;
using docxfer::core::NotFoundError;
using docxfer::core::TransferFailure;

class LocalObjectStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<LocalObjectStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = std::filesystem::temp_directory_path() / 
      ("local_store_test_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
    store = std::make_unique<LocalObjectStore>(test_dir.string());
    ASSERT_TRUE(std::filesystem::exists(test_dir));
  }

  void TearDown() override {
    store.reset();
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Helper methods to reduce repetition
  void put(const std::string& bucket, const std::string& key, const std::string& data,
           ObjectVisibility visibility = ObjectVisibility::Private) {
    auto writer = store->open_write(bucket, key, WriteOptions{visibility});
    writer->write(data.data(), data.size());
    writer->commit();
  }

  std::string read(const std::string& bucket, const std::string& key) {
    auto reader = store->open_read(bucket, key);
    std::string data((std::istreambuf_iterator<char>(reader->stream())), std::istreambuf_iterator<char>());
    reader->close();
    return data;
  }

  void store_and_verify(const std::string& bucket, const std::string& key, const std::string& data) {
    ASSERT_NO_THROW(put(bucket, key, data)) << "Failed to store key: " << key;
    auto info = store->head(bucket, key);
    ASSERT_TRUE(info.has_value()) << "Key should exist after storing: " << key;
    EXPECT_EQ(info->size, data.size());
    EXPECT_EQ(read(bucket, key), data) << "Data mismatch for key: " << key;
  }

  std::size_t staging_entries() const {
    std::size_t count = 0;
    for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(test_dir / ".staging")) {
      ++count;
    }
    return count;
  }
};

TEST_F(LocalObjectStoreTest, BasicOperations) {
  store_and_verify("bucket", "docs/a.da", "Hello, Store!");
  store_and_verify("bucket", "empty.da", "");
  EXPECT_FALSE(store->head("bucket", "missing.da").has_value());
  EXPECT_THROW(store->open_read("bucket", "missing.da"), NotFoundError);
}

TEST_F(LocalObjectStoreTest, NothingVisibleBeforeCommit) {
  auto writer = store->open_write("bucket", "pending.da", WriteOptions{});
  writer->write("partial", 7);
  EXPECT_FALSE(store->head("bucket", "pending.da").has_value());
  EXPECT_EQ(staging_entries(), 1u);

  writer->commit();
  EXPECT_TRUE(store->head("bucket", "pending.da").has_value());
  EXPECT_EQ(staging_entries(), 0u);
}

TEST_F(LocalObjectStoreTest, AbortDiscardsAndKeepsPreviousVersion) {
  store_and_verify("bucket", "obj.da", "version one");

  auto writer = store->open_write("bucket", "obj.da", WriteOptions{});
  writer->write("version two", 11);
  writer->abort();
  writer->abort();

  EXPECT_EQ(read("bucket", "obj.da"), "version one");
  EXPECT_EQ(staging_entries(), 0u);
  EXPECT_THROW(writer->write("x", 1), TransferFailure);
}

TEST_F(LocalObjectStoreTest, DestroyingUncommittedWriterAborts) {
  {
    auto writer = store->open_write("bucket", "dropped.da", WriteOptions{});
    writer->write("data", 4);
  }
  EXPECT_FALSE(store->head("bucket", "dropped.da").has_value());
  EXPECT_EQ(staging_entries(), 0u);
}

TEST_F(LocalObjectStoreTest, OverwriteReplacesContent) {
  const std::string large_data(1024 * 1024, 'X');
  store_and_verify("bucket", "big.da", large_data);
  store_and_verify("bucket", "big.da", "Updated content");
}

TEST_F(LocalObjectStoreTest, ListOrderedByKey) {
  put("bucket", "ns/b.da", "b");
  put("bucket", "ns/a.da", "aa");
  put("bucket", "other/c.da", "ccc");
  put("bucket", "ns/readme.txt", "text");

  auto objects = store->list_objects("bucket");
  ASSERT_EQ(objects.size(), 4u);
  EXPECT_EQ(objects[0].key, "ns/a.da");
  EXPECT_EQ(objects[0].size, 2u);
  EXPECT_EQ(objects[1].key, "ns/b.da");
  EXPECT_EQ(objects[2].key, "ns/readme.txt");
  EXPECT_EQ(objects[3].key, "other/c.da");

  auto age = std::chrono::system_clock::now() - objects[0].last_modified;
  EXPECT_LT(std::chrono::duration_cast<std::chrono::minutes>(age).count(), 5);
}

TEST_F(LocalObjectStoreTest, ListMissingBucketIsNotFound) {
  EXPECT_THROW(store->list_objects("nope"), NotFoundError);
  store->create_bucket("fresh");
  EXPECT_TRUE(store->has_bucket("fresh"));
  EXPECT_TRUE(store->list_objects("fresh").empty());
}

TEST_F(LocalObjectStoreTest, RemoveCleansEmptyDirectories) {
  put("bucket", "a/b/c.da", "data");
  put("bucket", "a/keep.da", "data");

  store->remove("bucket", "a/b/c.da");
  EXPECT_FALSE(store->head("bucket", "a/b/c.da").has_value());
  EXPECT_FALSE(std::filesystem::exists(test_dir / "bucket" / "a" / "b"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "bucket" / "a" / "keep.da"));
  EXPECT_TRUE(std::filesystem::exists(test_dir / "bucket"));

  EXPECT_THROW(store->remove("bucket", "a/b/c.da"), NotFoundError);
}

TEST_F(LocalObjectStoreTest, UnsafeNamesRejected) {
  const std::vector<std::string> bad_keys = {
    "", "/absolute.da", "../escape.da", "a/../../escape.da", "a//b.da", "./a.da", "dir/"
  };
  for (const auto& key : bad_keys) {
    EXPECT_THROW(store->open_write("bucket", key, WriteOptions{}), InvalidNameError) << key;
    EXPECT_THROW(store->head("bucket", key), InvalidNameError) << key;
  }

  for (const std::string bucket : {"", ".staging", "a/b"}) {
    EXPECT_THROW(store->open_write(bucket, "k.da", WriteOptions{}), InvalidNameError) << bucket;
    EXPECT_THROW(store->list_objects(bucket), InvalidNameError) << bucket;
  }
}

TEST_F(LocalObjectStoreTest, VisibilityMapsToPermissions) {
  namespace fs = std::filesystem;
  put("bucket", "public.da", "p", ObjectVisibility::Public);
  put("bucket", "private.da", "p", ObjectVisibility::Private);

  auto public_perms = fs::status(test_dir / "bucket" / "public.da").permissions();
  auto private_perms = fs::status(test_dir / "bucket" / "private.da").permissions();
  EXPECT_NE(public_perms & fs::perms::others_read, fs::perms::none);
  EXPECT_EQ(private_perms & fs::perms::others_read, fs::perms::none);
  EXPECT_NE(private_perms & fs::perms::owner_read, fs::perms::none);
}

TEST_F(LocalObjectStoreTest, KeyBelowExistingObjectIsAbsent) {
  put("bucket", "x.da", "data");

  EXPECT_FALSE(store->head("bucket", "x.da/y.da").has_value());
  EXPECT_THROW(store->open_read("bucket", "x.da/y.da"), NotFoundError);
  EXPECT_THROW(store->remove("bucket", "x.da/y.da"), NotFoundError);
  EXPECT_EQ(read("bucket", "x.da"), "data");
}

TEST_F(LocalObjectStoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 20;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          std::string key = "concurrent/" + std::to_string(i) + "_" + std::to_string(j) + ".da";
          std::string data = "Data for " + key;
          put("bucket", key, data);
          if (read("bucket", key) == data) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(store->list_objects("bucket").size(), num_threads * ops_per_thread);
}
