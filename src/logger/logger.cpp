#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>

namespace docxfer::logger {

void init_logging(const std::string& log_file, boost::log::trivial::severity_level min_level,
                  bool console) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::format = format,
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::auto_flush = true
      );
    }

    if (console) {
      logging::add_console_log(
        std::clog,
        keywords::format = format,
        keywords::auto_flush = true
      );
    }

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

bool parse_log_level(const std::string& name, boost::log::trivial::severity_level& level) {
  using boost::log::trivial::severity_level;

  if (name == "trace")        level = severity_level::trace;
  else if (name == "debug")   level = severity_level::debug;
  else if (name == "info")    level = severity_level::info;
  else if (name == "warning") level = severity_level::warning;
  else if (name == "error")   level = severity_level::error;
  else if (name == "fatal")   level = severity_level::fatal;
  else return false;
  return true;
}

} // namespace docxfer::logger
