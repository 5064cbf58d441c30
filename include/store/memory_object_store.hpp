#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include "store/object_store.hpp"

namespace docxfer {
namespace store {

// In-process object store. Thread safe; committed objects are shared
// between all handles of the same instance.
class MemoryObjectStore : public ObjectStore {
public:
  MemoryObjectStore() = default;
  ~MemoryObjectStore() override = default;


  // ---- STREAMING ACCESS ----
  std::unique_ptr<ObjectWriter> open_write(const std::string& bucket,
    const std::string& key, const WriteOptions& options) override;
  std::unique_ptr<ObjectReader> open_read(const std::string& bucket,
    const std::string& key) override;


  // ---- METADATA OPERATIONS ----
  std::vector<ObjectInfo> list_objects(const std::string& bucket) override;
  std::optional<ObjectInfo> head(const std::string& bucket, const std::string& key) override;
  void remove(const std::string& bucket, const std::string& key) override;


  // ---- DIRECT ACCESS ----
  void create_bucket(const std::string& bucket);
  // Stores an object in one step, bypassing the writer
  void put(const std::string& bucket, const std::string& key, const std::string& data,
           ObjectVisibility visibility = ObjectVisibility::Private);
  // Committed content of an object, throws NotFoundError when absent
  std::string contents(const std::string& bucket, const std::string& key) const;
  ObjectVisibility visibility(const std::string& bucket, const std::string& key) const;


  // ---- HANDLE TRACKING ----
  std::size_t open_readers() const { return open_readers_.load(); }
  std::size_t open_writers() const { return open_writers_.load(); }

private:
  struct StoredObject {
    std::shared_ptr<const std::string> data;
    ObjectVisibility visibility = ObjectVisibility::Private;
    std::chrono::system_clock::time_point last_modified;
  };
  using Bucket = std::map<std::string, StoredObject>;

  friend class MemoryObjectWriter;
  friend class MemoryObjectReader;

  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::map<std::string, Bucket> buckets_;
  std::atomic<std::size_t> open_readers_{0};
  std::atomic<std::size_t> open_writers_{0};

  void commit_object(const std::string& bucket, const std::string& key, StoredObject object);
  const StoredObject& find_object(const std::string& bucket, const std::string& key) const;
};

} // namespace store
} // namespace docxfer
