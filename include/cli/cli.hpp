#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <boost/log/trivial.hpp>
#include "config/transfer_config.hpp"
#include "store/object_store.hpp"

namespace docxfer {
namespace cli {

struct ProgramOptions {
  std::string root;
  std::string log_file;
  boost::log::trivial::severity_level log_level{boost::log::trivial::warning};
  std::string command;
  std::vector<std::string> arguments;
  bool public_object{false};
  bool show_progress{false};
  bool show_table{false};
  bool strict{false};
  config::TransferConfig transfer;
  bool valid{false};
};

// Store root used when neither --root nor DOCXFER_ROOT is given
inline constexpr const char* DEFAULT_ROOT = "./docxfer_store";

void print_usage(const std::string& program_name, std::ostream& out);
// Parses everything after the program name. Errors are reported to `err`
// and leave `valid` unset.
ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err);

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CLI(store::ObjectStore& store);


  // ---- COMMAND EXECUTION ----
  // Runs the parsed command. Returns 0 on success and 2 when the
  // operation failed.
  int execute(const ProgramOptions& options, std::ostream& out, std::ostream& err);

private:
  // ---- PARAMETERS ----
  store::ObjectStore& store_;


  // ---- COMMAND PROCESSING ----
  void handle_push_command(const ProgramOptions& options, std::ostream& out, std::ostream& err);
  void handle_pull_command(const ProgramOptions& options, std::ostream& out, std::ostream& err);
  void handle_list_command(const ProgramOptions& options, std::ostream& out);
  void handle_delete_command(const ProgramOptions& options, std::ostream& out);
  void log_and_display_error(const std::string& message, const std::string& error, std::ostream& err);
};

} // namespace cli
} // namespace docxfer
