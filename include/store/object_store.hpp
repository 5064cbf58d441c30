#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docxfer {
namespace store {

enum class ObjectVisibility {
  Private,
  Public
};

struct WriteOptions {
  ObjectVisibility visibility = ObjectVisibility::Private;
};

struct ObjectInfo {
  std::string key;
  std::uintmax_t size = 0;
  std::chrono::system_clock::time_point last_modified;
};

// Write handle for a single object. Nothing written becomes visible under
// the object's key until commit() succeeds.
class ObjectWriter {
public:
  virtual ~ObjectWriter() = default;

  // Appends bytes to the pending object, throws TransferFailure
  virtual void write(const char* data, std::size_t size) = 0;
  // Publishes the pending object atomically, throws TransferFailure
  virtual void commit() = 0;
  // Discards the pending object. Safe to call more than once.
  virtual void abort() = 0;
};

// Read handle for a single object
class ObjectReader {
public:
  virtual ~ObjectReader() = default;

  virtual std::istream& stream() = 0;
  virtual void close() = 0;
};

class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // ---- STREAMING ACCESS ----
  virtual std::unique_ptr<ObjectWriter> open_write(const std::string& bucket,
    const std::string& key, const WriteOptions& options) = 0;
  // Throws NotFoundError when the object does not exist
  virtual std::unique_ptr<ObjectReader> open_read(const std::string& bucket,
    const std::string& key) = 0;


  // ---- METADATA OPERATIONS ----
  // All objects in the bucket ordered by key. Throws NotFoundError when
  // the bucket does not exist.
  virtual std::vector<ObjectInfo> list_objects(const std::string& bucket) = 0;
  // Object metadata, or nullopt when the object does not exist
  virtual std::optional<ObjectInfo> head(const std::string& bucket, const std::string& key) = 0;
  // Throws NotFoundError when the object does not exist
  virtual void remove(const std::string& bucket, const std::string& key) = 0;
};

} // namespace store
} // namespace docxfer
