#pragma once

#include <string>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include "store/object_store.hpp"

namespace docxfer {
namespace store {

// Object store backed by a directory tree:
//   {root}/{bucket}/{key}      committed objects
//   {root}/.staging/{random}   objects being written
class LocalObjectStore : public ObjectStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit LocalObjectStore(const std::string& root_path);


  // ---- STREAMING ACCESS ----
  std::unique_ptr<ObjectWriter> open_write(const std::string& bucket,
    const std::string& key, const WriteOptions& options) override;
  std::unique_ptr<ObjectReader> open_read(const std::string& bucket,
    const std::string& key) override;


  // ---- METADATA OPERATIONS ----
  std::vector<ObjectInfo> list_objects(const std::string& bucket) override;
  std::optional<ObjectInfo> head(const std::string& bucket, const std::string& key) override;
  void remove(const std::string& bucket, const std::string& key) override;


  // ---- BUCKET OPERATIONS ----
  void create_bucket(const std::string& bucket);
  bool has_bucket(const std::string& bucket) const;

  const std::filesystem::path& root() const { return root_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all buckets
  std::filesystem::path root_path_;
  // Directory holding uncommitted objects
  std::filesystem::path staging_path_;


  // ---- PATH RESOLUTION ----
  // Resolves bucket and key to a path, rejecting names that would escape
  // the bucket directory
  std::filesystem::path resolve_object_path(const std::string& bucket, const std::string& key) const;
  std::filesystem::path resolve_bucket_path(const std::string& bucket) const;
  // Random file name under the staging directory
  std::filesystem::path make_staging_path() const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Removes empty directories between path and the bucket directory
  void remove_empty_parents(const std::filesystem::path& path, const std::filesystem::path& bucket_path) const;
  ObjectInfo make_object_info(const std::string& key, const std::filesystem::path& path) const;
};

} // namespace store
} // namespace docxfer
