#ifndef DOCXFER_CATALOG_CATALOG_HPP
#define DOCXFER_CATALOG_CATALOG_HPP

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "store/object_store.hpp"

namespace docxfer {
namespace catalog {

struct CatalogEntry {
  std::string name;
  std::string key;
  std::uintmax_t size = 0;
  std::chrono::system_clock::time_point last_modified;
};

class Catalog {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Catalog(store::ObjectStore& store);


  // ---- LISTING ----
  // Names of the collections under "<bucket>/<prefix>", in store order
  std::vector<std::string> list(const std::string& ns);
  std::vector<CatalogEntry> list_entries(const std::string& ns);
  // Prints the collections under the namespace as a table
  void render_table(const std::string& ns, std::ostream& out);


  // ---- DELETION ----
  // Returns true when the collection existed and was deleted. An absent
  // collection returns false if missing_ok, otherwise throws NotFoundError.
  bool remove(const std::string& name, bool missing_ok = true);


  // ---- FORMATTING ----
  // Decimal file size, e.g. "512 bytes", "1.5 kB", "6.0 MB"
  static std::string format_size(std::uintmax_t bytes);
  static std::string format_time(std::chrono::system_clock::time_point time);

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;
};

} // namespace catalog
} // namespace docxfer

#endif // DOCXFER_CATALOG_CATALOG_HPP
