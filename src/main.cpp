#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/local_object_store.hpp"
#include <iostream>
#include <string>
#include <vector>

int run_command(const docxfer::cli::ProgramOptions& options) {
  try {
    docxfer::logger::init_logging(options.log_file, options.log_level);

    docxfer::store::LocalObjectStore store(options.root);
    docxfer::cli::CLI cli(store);
    return cli.execute(options, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start: " << e.what() << '\n';
    return 2;
  }
}

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  if (const auto options = docxfer::cli::parse_command_line(args, std::cerr); !options.valid) {
    docxfer::cli::print_usage(argv[0], std::cerr);
    return 1;
  } else {
    return run_command(options);
  }
}
