#include "store/memory_object_store.hpp"
#include "core/errors.hpp"
#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace store {

using core::NotFoundError;
using core::TransferFailure;

//==============================================
// MEMORY WRITE AND READ HANDLES
//==============================================

class MemoryObjectWriter : public ObjectWriter {
public:
  MemoryObjectWriter(MemoryObjectStore& store, std::string bucket, std::string key,
                     ObjectVisibility visibility)
    : store_(store)
    , bucket_(std::move(bucket))
    , key_(std::move(key))
    , visibility_(visibility)
    , finished_(false) {
    ++store_.open_writers_;
  }

  ~MemoryObjectWriter() override {
    if (!finished_) {
      abort();
    }
  }

  void write(const char* data, std::size_t size) override {
    if (finished_) {
      throw TransferFailure("write after commit or abort on " + bucket_ + "/" + key_);
    }
    pending_.append(data, size);
  }

  void commit() override {
    if (finished_) {
      throw TransferFailure("commit after commit or abort on " + bucket_ + "/" + key_);
    }
    MemoryObjectStore::StoredObject object;
    object.data = std::make_shared<const std::string>(std::move(pending_));
    object.visibility = visibility_;
    object.last_modified = std::chrono::system_clock::now();
    store_.commit_object(bucket_, key_, std::move(object));
    finish();
  }

  void abort() override {
    if (finished_) {
      return;
    }
    pending_.clear();
    finish();
    BOOST_LOG_TRIVIAL(warning) << "Memory store: Aborted write of " << bucket_ << "/" << key_;
  }

private:
  MemoryObjectStore& store_;
  std::string bucket_;
  std::string key_;
  ObjectVisibility visibility_;
  std::string pending_;
  bool finished_;

  void finish() {
    finished_ = true;
    --store_.open_writers_;
  }
};

class MemoryObjectReader : public ObjectReader {
public:
  MemoryObjectReader(MemoryObjectStore& store, std::shared_ptr<const std::string> data)
    : store_(store)
    , data_(std::move(data))
    , stream_(data_->data(), data_->size())
    , open_(true) {
    ++store_.open_readers_;
  }

  ~MemoryObjectReader() override {
    close();
  }

  std::istream& stream() override { return stream_; }

  void close() override {
    if (open_) {
      open_ = false;
      stream_.close();
      --store_.open_readers_;
    }
  }

private:
  MemoryObjectStore& store_;
  std::shared_ptr<const std::string> data_;
  boost::iostreams::stream<boost::iostreams::array_source> stream_;
  bool open_;
};


//==============================================
// STREAMING ACCESS
//==============================================

std::unique_ptr<ObjectWriter> MemoryObjectStore::open_write(const std::string& bucket,
    const std::string& key, const WriteOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Opening " << bucket << "/" << key << " for write";
  return std::make_unique<MemoryObjectWriter>(*this, bucket, key, options.visibility);
}

std::unique_ptr<ObjectReader> MemoryObjectStore::open_read(const std::string& bucket,
    const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Opening " << bucket << "/" << key << " for read";

  std::shared_ptr<const std::string> data;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    data = find_object(bucket, key).data;
  }
  return std::make_unique<MemoryObjectReader>(*this, std::move(data));
}


//==============================================
// METADATA OPERATIONS
//==============================================

std::vector<ObjectInfo> MemoryObjectStore::list_objects(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto bucket_it = buckets_.find(bucket);
  if (bucket_it == buckets_.end()) {
    throw NotFoundError("bucket " + bucket);
  }

  std::vector<ObjectInfo> objects;
  for (const auto& [key, object] : bucket_it->second) {
    objects.push_back(ObjectInfo{key, object.data->size(), object.last_modified});
  }
  return objects;
}

std::optional<ObjectInfo> MemoryObjectStore::head(const std::string& bucket, const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto bucket_it = buckets_.find(bucket);
  if (bucket_it == buckets_.end()) {
    return std::nullopt;
  }
  auto object_it = bucket_it->second.find(key);
  if (object_it == bucket_it->second.end()) {
    return std::nullopt;
  }
  return ObjectInfo{key, object_it->second.data->size(), object_it->second.last_modified};
}

void MemoryObjectStore::remove(const std::string& bucket, const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto bucket_it = buckets_.find(bucket);
  if (bucket_it == buckets_.end() || bucket_it->second.erase(key) == 0) {
    throw NotFoundError(bucket + "/" + key);
  }
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Removed " << bucket << "/" << key;
}


//==============================================
// DIRECT ACCESS
//==============================================

void MemoryObjectStore::create_bucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_[bucket];
}

void MemoryObjectStore::put(const std::string& bucket, const std::string& key,
    const std::string& data, ObjectVisibility visibility) {
  StoredObject object;
  object.data = std::make_shared<const std::string>(data);
  object.visibility = visibility;
  object.last_modified = std::chrono::system_clock::now();
  commit_object(bucket, key, std::move(object));
}

std::string MemoryObjectStore::contents(const std::string& bucket, const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return *find_object(bucket, key).data;
}

ObjectVisibility MemoryObjectStore::visibility(const std::string& bucket, const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return find_object(bucket, key).visibility;
}

void MemoryObjectStore::commit_object(const std::string& bucket, const std::string& key,
    StoredObject object) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Committed " << object.data->size() << " bytes to "
                           << bucket << "/" << key;
  buckets_[bucket][key] = std::move(object);
}

// Caller holds mutex_
const MemoryObjectStore::StoredObject& MemoryObjectStore::find_object(const std::string& bucket,
    const std::string& key) const {
  auto bucket_it = buckets_.find(bucket);
  if (bucket_it != buckets_.end()) {
    auto object_it = bucket_it->second.find(key);
    if (object_it != bucket_it->second.end()) {
      return object_it->second;
    }
  }
  throw NotFoundError(bucket + "/" + key);
}

} // namespace store
} // namespace docxfer
