#ifndef DOCXFER_CORE_NAMESPACE_PATH_HPP
#define DOCXFER_CORE_NAMESPACE_PATH_HPP

#include <string>

namespace docxfer {
namespace core {

// Suffix appended to every stored collection key
inline constexpr const char* COLLECTION_EXTENSION = ".da";

class NamespacePath {
public:
  // ---- PARSING ----
  // Splits "<bucket>/<rest>" on the first '/'. Throws InvalidNameError when
  // the separator is missing or the bucket is empty. <rest> may be empty.
  static NamespacePath parse(const std::string& path);
  // Same as parse but also requires a non-empty <rest>
  static NamespacePath parse_object_name(const std::string& name);


  // ---- GETTERS ----
  const std::string& bucket() const { return bucket_; }
  const std::string& rest() const { return rest_; }
  // <rest> with the collection extension appended
  std::string object_key() const;
  // Collection name derived from a stored key: last path segment
  // without the collection extension
  static std::string name_from_key(const std::string& key);
  // True when key carries the collection extension
  static bool has_collection_extension(const std::string& key);

  std::string to_string() const { return bucket_ + "/" + rest_; }

private:
  NamespacePath(std::string bucket, std::string rest);

  // ---- PARAMETERS ----
  std::string bucket_;
  std::string rest_;
};

} // namespace core
} // namespace docxfer

#endif // DOCXFER_CORE_NAMESPACE_PATH_HPP
