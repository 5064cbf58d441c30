#include "catalog/catalog.hpp"
#include "core/errors.hpp"
#include "core/namespace_path.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace catalog {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Catalog::Catalog(store::ObjectStore& store) : store_(store) {}


//==============================================
// LISTING
//==============================================

std::vector<std::string> Catalog::list(const std::string& ns) {
  std::vector<std::string> names;
  for (const auto& entry : list_entries(ns)) {
    names.push_back(entry.name);
  }
  return names;
}

std::vector<CatalogEntry> Catalog::list_entries(const std::string& ns) {
  core::NamespacePath path = core::NamespacePath::parse(ns);
  BOOST_LOG_TRIVIAL(info) << "Catalog: Listing bucket " << path.bucket() << " under prefix \""
                          << path.rest() << "\"";

  std::vector<CatalogEntry> entries;
  for (const auto& object : store_.list_objects(path.bucket())) {
    if (object.key.compare(0, path.rest().size(), path.rest()) != 0 ||
        !core::NamespacePath::has_collection_extension(object.key)) {
      continue;
    }
    entries.push_back(CatalogEntry{core::NamespacePath::name_from_key(object.key), object.key,
                                   object.size, object.last_modified});
  }

  BOOST_LOG_TRIVIAL(debug) << "Catalog: Found " << entries.size() << " collections";
  return entries;
}

void Catalog::render_table(const std::string& ns, std::ostream& out) {
  core::NamespacePath path = core::NamespacePath::parse(ns);
  std::vector<CatalogEntry> entries = list_entries(ns);

  std::vector<std::array<std::string, 3>> rows;
  rows.push_back({"Name", "Last Modified", "Size"});
  for (const auto& entry : entries) {
    rows.push_back({entry.name, format_time(entry.last_modified), format_size(entry.size)});
  }

  std::array<std::size_t, 3> widths{0, 0, 0};
  for (const auto& row : rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], row[i].size());
    }
  }

  out << "You have " << entries.size() << " collections in bucket " << path.bucket()
      << " under the namespace \"" << path.rest() << "\"\n\n";

  for (std::size_t r = 0; r < rows.size(); ++r) {
    const auto& row = rows[r];
    out << "  " << std::left << std::setw(static_cast<int>(widths[0])) << row[0]
        << "  " << std::setw(static_cast<int>(widths[1])) << row[1]
        << "  " << std::right << std::setw(static_cast<int>(widths[2])) << row[2] << "\n";
    if (r == 0) {
      out << "  " << std::string(widths[0] + widths[1] + widths[2] + 4, '-') << "\n";
    }
  }
  out << std::left << std::flush;
}


//==============================================
// DELETION
//==============================================

bool Catalog::remove(const std::string& name, bool missing_ok) {
  core::NamespacePath path = core::NamespacePath::parse_object_name(name);
  const std::string key = path.object_key();
  BOOST_LOG_TRIVIAL(info) << "Catalog: Deleting " << path.bucket() << "/" << key;

  if (!store_.head(path.bucket(), key)) {
    if (missing_ok) {
      BOOST_LOG_TRIVIAL(info) << "Catalog: " << name << " does not exist, nothing to delete";
      return false;
    }
    BOOST_LOG_TRIVIAL(error) << "Catalog: " << name << " does not exist";
    throw core::NotFoundError("collection " + name);
  }

  store_.remove(path.bucket(), key);
  BOOST_LOG_TRIVIAL(info) << "Catalog: Deleted " << name;
  return true;
}


//==============================================
// FORMATTING
//==============================================

std::string Catalog::format_size(std::uintmax_t bytes) {
  if (bytes == 1) {
    return "1 byte";
  }
  if (bytes < 1000) {
    return std::to_string(bytes) + " bytes";
  }

  static const char* const units[] = {"kB", "MB", "GB", "TB", "PB", "EB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  value /= 1000.0;
  while (value >= 1000.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1000.0;
    ++unit;
  }

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
  return ss.str();
}

std::string Catalog::format_time(std::chrono::system_clock::time_point time) {
  boost::posix_time::ptime ptime = boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(time));
  std::string iso = boost::posix_time::to_iso_extended_string(ptime);
  std::replace(iso.begin(), iso.end(), 'T', ' ');
  return iso;
}

} // namespace catalog
} // namespace docxfer
