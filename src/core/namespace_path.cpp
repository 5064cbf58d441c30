#include "core/namespace_path.hpp"
#include "core/errors.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace core {

NamespacePath::NamespacePath(std::string bucket, std::string rest)
  : bucket_(std::move(bucket))
  , rest_(std::move(rest)) {}

  
//==============================================
// PARSING
//==============================================

NamespacePath NamespacePath::parse(const std::string& path) {
  std::size_t separator = path.find('/');
  if (separator == std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "NamespacePath: Missing bucket separator in: " << path;
    throw InvalidNameError("'" + path + "' has no bucket separator '/'");
  }

  if (separator == 0) {
    BOOST_LOG_TRIVIAL(error) << "NamespacePath: Empty bucket in: " << path;
    throw InvalidNameError("'" + path + "' has an empty bucket");
  }

  return NamespacePath(path.substr(0, separator), path.substr(separator + 1));
}

NamespacePath NamespacePath::parse_object_name(const std::string& name) {
  NamespacePath path = parse(name);
  if (path.rest_.empty()) {
    BOOST_LOG_TRIVIAL(error) << "NamespacePath: Empty object name in: " << name;
    throw InvalidNameError("'" + name + "' does not name an object");
  }
  return path;
}

  
//==============================================
// GETTERS
//==============================================

std::string NamespacePath::object_key() const {
  return rest_ + COLLECTION_EXTENSION;
}

bool NamespacePath::has_collection_extension(const std::string& key) {
  const std::size_t ext_len = std::strlen(COLLECTION_EXTENSION);
  return key.size() >= ext_len &&
         key.compare(key.size() - ext_len, ext_len, COLLECTION_EXTENSION) == 0;
}

std::string NamespacePath::name_from_key(const std::string& key) {
  std::string name = key;
  std::size_t last_slash = name.rfind('/');
  if (last_slash != std::string::npos) {
    name = name.substr(last_slash + 1);
  }
  if (has_collection_extension(name)) {
    name.resize(name.size() - std::strlen(COLLECTION_EXTENSION));
  }
  return name;
}

} // namespace core
} // namespace docxfer
