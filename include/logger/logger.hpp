#ifndef DOCXFER_LOGGER_HPP
#define DOCXFER_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace docxfer::logger {

// Installs the process-wide Boost.Log sinks: a text file sink when
// log_file is non-empty and a console sink on stderr. Records below
// min_level are dropped.
void init_logging(const std::string& log_file = "docxfer.log",
                  boost::log::trivial::severity_level min_level = boost::log::trivial::info,
                  bool console = true);

// Changes the severity filter without touching the sinks
void set_log_level(boost::log::trivial::severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
bool parse_log_level(const std::string& name, boost::log::trivial::severity_level& level);

} // namespace docxfer::logger

#endif // DOCXFER_LOGGER_HPP
