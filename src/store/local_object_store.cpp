#include "store/local_object_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace store {

using core::InvalidNameError;
using core::NotFoundError;
using core::TransferFailure;

namespace {

constexpr const char* STAGING_DIR = ".staging";

//==============================================
// LOCAL WRITE AND READ HANDLES
//==============================================

class LocalObjectWriter : public ObjectWriter {
public:
  LocalObjectWriter(std::filesystem::path staging_path, std::filesystem::path final_path,
                    ObjectVisibility visibility)
    : staging_path_(std::move(staging_path))
    , final_path_(std::move(final_path))
    , visibility_(visibility)
    , file_(staging_path_, std::ios::binary | std::ios::trunc)
    , finished_(false)
    , bytes_written_(0) {
    if (!file_) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to create staging file: " << staging_path_.string();
      throw TransferFailure("failed to create staging file " + staging_path_.string());
    }
    BOOST_LOG_TRIVIAL(debug) << "Store: Staging " << final_path_.string() << " at " << staging_path_.string();
  }

  ~LocalObjectWriter() override {
    if (!finished_) {
      abort();
    }
  }

  void write(const char* data, std::size_t size) override {
    if (finished_) {
      throw TransferFailure("write after commit or abort on " + final_path_.string());
    }
    if (!file_.write(data, static_cast<std::streamsize>(size))) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to write " << size << " bytes to " << staging_path_.string();
      throw TransferFailure("failed to write to " + staging_path_.string());
    }
    bytes_written_ += size;
  }

  void commit() override {
    if (finished_) {
      throw TransferFailure("commit after commit or abort on " + final_path_.string());
    }

    file_.close();
    if (file_.fail()) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to close staging file: " << staging_path_.string();
      abort();
      throw TransferFailure("failed to flush " + staging_path_.string());
    }

    try {
      std::filesystem::create_directories(final_path_.parent_path());

      namespace fs = std::filesystem;
      fs::perms perms = fs::perms::owner_read | fs::perms::owner_write;
      if (visibility_ == ObjectVisibility::Public) {
        perms |= fs::perms::group_read | fs::perms::others_read;
      }
      fs::permissions(staging_path_, perms, fs::perm_options::replace);

      // Rename within one filesystem replaces the old object atomically
      fs::rename(staging_path_, final_path_);
    } catch (const std::filesystem::filesystem_error& e) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit " << final_path_.string() << ": " << e.what();
      abort();
      throw TransferFailure("failed to commit " + final_path_.string() + ": " + e.what());
    }

    finished_ = true;
    BOOST_LOG_TRIVIAL(info) << "Store: Committed " << bytes_written_ << " bytes to " << final_path_.string();
  }

  void abort() override {
    if (finished_) {
      return;
    }
    finished_ = true;

    if (file_.is_open()) {
      file_.close();
    }

    std::error_code ec;
    std::filesystem::remove(staging_path_, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove staging file " << staging_path_.string()
                               << ": " << ec.message();
    }
    BOOST_LOG_TRIVIAL(warning) << "Store: Aborted write of " << final_path_.string();
  }

private:
  std::filesystem::path staging_path_;
  std::filesystem::path final_path_;
  ObjectVisibility visibility_;
  std::ofstream file_;
  bool finished_;
  std::size_t bytes_written_;
};

class LocalObjectReader : public ObjectReader {
public:
  explicit LocalObjectReader(const std::filesystem::path& path)
    : path_(path)
    , file_(path, std::ios::binary) {
    if (!file_) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to open file: " << path_.string();
      throw TransferFailure("failed to open " + path_.string());
    }
  }

  std::istream& stream() override { return file_; }

  void close() override {
    if (file_.is_open()) {
      file_.close();
      BOOST_LOG_TRIVIAL(debug) << "Store: Closed " << path_.string();
    }
  }

private:
  std::filesystem::path path_;
  std::ifstream file_;
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with root directory path and ensure it exists
LocalObjectStore::LocalObjectStore(const std::string& root_path)
  : root_path_(root_path)
  , staging_path_(root_path_ / STAGING_DIR) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing LocalObjectStore with root path: " << root_path;
  check_directory_exists(root_path_);
  check_directory_exists(staging_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << root_path;
}


//==============================================
// STREAMING ACCESS
//==============================================

std::unique_ptr<ObjectWriter> LocalObjectStore::open_write(const std::string& bucket,
    const std::string& key, const WriteOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "Store: Opening " << bucket << "/" << key << " for write";

  std::filesystem::path final_path = resolve_object_path(bucket, key);
  check_directory_exists(staging_path_);
  return std::make_unique<LocalObjectWriter>(make_staging_path(), final_path, options.visibility);
}

std::unique_ptr<ObjectReader> LocalObjectStore::open_read(const std::string& bucket,
    const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Opening " << bucket << "/" << key << " for read";

  std::filesystem::path file_path = resolve_object_path(bucket, key);
  if (!std::filesystem::is_regular_file(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw NotFoundError(bucket + "/" + key);
  }
  return std::make_unique<LocalObjectReader>(file_path);
}


//==============================================
// METADATA OPERATIONS
//==============================================

std::vector<ObjectInfo> LocalObjectStore::list_objects(const std::string& bucket) {
  BOOST_LOG_TRIVIAL(info) << "Store: Listing bucket: " << bucket;

  std::filesystem::path bucket_path = resolve_bucket_path(bucket);
  if (!std::filesystem::is_directory(bucket_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Bucket not found: " << bucket;
    throw NotFoundError("bucket " + bucket);
  }

  std::vector<ObjectInfo> objects;
  try {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(bucket_path)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::string key = std::filesystem::relative(entry.path(), bucket_path).generic_string();
      objects.push_back(make_object_info(key, entry.path()));
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to list bucket " << bucket << ": " << e.what();
    throw TransferFailure("failed to list bucket " + bucket + ": " + e.what());
  }

  std::sort(objects.begin(), objects.end(),
            [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });

  BOOST_LOG_TRIVIAL(debug) << "Store: Bucket " << bucket << " holds " << objects.size() << " objects";
  return objects;
}

std::optional<ObjectInfo> LocalObjectStore::head(const std::string& bucket, const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Checking existence of " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_object_path(bucket, key);
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);
  // A missing object may surface as ENOTDIR when a key segment is a file
  if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to stat " << file_path.string() << ": " << ec.message();
    throw TransferFailure("failed to stat " + file_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: " << bucket << "/" << key << (exists ? " exists" : " not found");
  if (!exists) {
    return std::nullopt;
  }

  try {
    return make_object_info(key, file_path);
  } catch (const std::filesystem::filesystem_error& e) {
    throw TransferFailure("failed to stat " + file_path.string() + ": " + e.what());
  }
}

void LocalObjectStore::remove(const std::string& bucket, const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing " << bucket << "/" << key;

  std::filesystem::path file_path = resolve_object_path(bucket, key);
  if (!std::filesystem::is_regular_file(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: File not found: " << file_path.string();
    throw NotFoundError(bucket + "/" + key);
  }

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove " << file_path.string() << ": " << ec.message();
    throw TransferFailure("failed to remove " + bucket + "/" + key + ": " + ec.message());
  }

  remove_empty_parents(file_path.parent_path(), resolve_bucket_path(bucket));
  BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed " << bucket << "/" << key;
}


//==============================================
// BUCKET OPERATIONS
//==============================================

void LocalObjectStore::create_bucket(const std::string& bucket) {
  BOOST_LOG_TRIVIAL(info) << "Store: Creating bucket: " << bucket;
  check_directory_exists(resolve_bucket_path(bucket));
}

bool LocalObjectStore::has_bucket(const std::string& bucket) const {
  return std::filesystem::is_directory(resolve_bucket_path(bucket));
}


//==============================================
// PATH RESOLUTION
//==============================================

std::filesystem::path LocalObjectStore::resolve_bucket_path(const std::string& bucket) const {
  if (bucket.empty() || bucket.find('/') != std::string::npos || bucket.front() == '.') {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid bucket name: " << bucket;
    throw InvalidNameError("bucket '" + bucket + "'");
  }
  return root_path_ / bucket;
}

std::filesystem::path LocalObjectStore::resolve_object_path(const std::string& bucket,
    const std::string& key) const {
  std::filesystem::path path = resolve_bucket_path(bucket);

  if (key.empty() || key.front() == '/') {
    BOOST_LOG_TRIVIAL(error) << "Store: Invalid object key: " << key;
    throw InvalidNameError("key '" + key + "'");
  }

  // Every segment must be a plain name so the key stays inside the bucket
  std::istringstream segments(key);
  std::string segment;
  while (std::getline(segments, segment, '/')) {
    if (segment.empty() || segment == "." || segment == "..") {
      BOOST_LOG_TRIVIAL(error) << "Store: Invalid object key: " << key;
      throw InvalidNameError("key '" + key + "'");
    }
    path /= segment;
  }
  if (key.back() == '/') {
    throw InvalidNameError("key '" + key + "'");
  }
  return path;
}

std::filesystem::path LocalObjectStore::make_staging_path() const {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<uint64_t> dis;

  std::stringstream name;
  name << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
  return staging_path_ / name.str();
}

void LocalObjectStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Store: Failed to create directory " << path.string() << ": " << ec.message();
      throw TransferFailure("failed to create directory " + path.string() + ": " + ec.message());
    }
  }
}

void LocalObjectStore::remove_empty_parents(const std::filesystem::path& path,
    const std::filesystem::path& bucket_path) const {
  auto current = path;
  while (current != bucket_path) {
    std::error_code ec;
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}

ObjectInfo LocalObjectStore::make_object_info(const std::string& key,
    const std::filesystem::path& path) const {
  ObjectInfo info;
  info.key = key;
  info.size = std::filesystem::file_size(path);

  auto write_time = std::filesystem::last_write_time(path);
  info.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    write_time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
  return info;
}

} // namespace store
} // namespace docxfer
