#include "cli/cli.hpp"
#include "catalog/catalog.hpp"
#include "core/errors.hpp"
#include "logger/logger.hpp"
#include "transfer/download_pipeline.hpp"
#include "transfer/upload_pipeline.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace docxfer {
namespace cli {

namespace {

// Positional arguments each command takes after its name
const std::unordered_map<std::string, std::size_t> command_arity = {
  {"push", 2},
  {"pull", 1},
  {"list", 1},
  {"delete", 1}
};

transfer::ProgressFn make_progress_printer(const std::string& verb, std::ostream& err) {
  return [verb, &err](const transfer::TransferProgress& progress) {
    err << "\r" << verb << " " << progress.documents << " documents ("
        << catalog::Catalog::format_size(progress.bytes) << ")" << std::flush;
  };
}

} // namespace


//==============================================
// COMMAND LINE PARSING
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options] <command> [arguments]\n"
      << "Commands:\n"
      << "  push <bucket/name> <file>   Store each line of <file> as a document\n"
      << "  pull <bucket/name>          Print the documents of a stored collection\n"
      << "  list <bucket/prefix>        List stored collections\n"
      << "  delete <bucket/name>        Delete a stored collection\n"
      << "Options:\n"
      << "  --root <dir>          Store root (default $DOCXFER_ROOT or " << DEFAULT_ROOT << ")\n"
      << "  --log-file <file>     Also write logs to <file>\n"
      << "  --verbose             Log debug messages\n"
      << "  --log-level <level>   trace, debug, info, warning, error or fatal (default warning)\n"
      << "  --compression <c>     none, gzip or zlib (default gzip)\n"
      << "  --block-size <bytes>  Upload block capacity\n"
      << "  --public              Make pushed collections readable by others\n"
      << "  --progress            Report transfer progress on stderr\n"
      << "  --table               Print list output as a table\n"
      << "  --strict              Fail when deleting a missing collection\n"
      << "Example: " << program_name << " push mybucket/docs/train data.txt\n";
}

ProgramOptions parse_command_line(const std::vector<std::string>& args, std::ostream& err) {
  ProgramOptions options;
  if (const char* env_root = std::getenv("DOCXFER_ROOT"); env_root && *env_root) {
    options.root = env_root;
  } else {
    options.root = DEFAULT_ROOT;
  }

  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg.rfind("--", 0) != 0) {
      positional.push_back(arg);
      continue;
    }

    if (arg == "--verbose") {
      options.log_level = boost::log::trivial::debug;
    } else if (arg == "--public") {
      options.public_object = true;
    } else if (arg == "--progress") {
      options.show_progress = true;
    } else if (arg == "--table") {
      options.show_table = true;
    } else if (arg == "--strict") {
      options.strict = true;
    } else if (arg == "--root" || arg == "--log-file" || arg == "--compression" || arg == "--block-size" ||
               arg == "--log-level") {
      if (i + 1 >= args.size()) {
        err << "Error: Missing value for " << arg << '\n';
        return options;
      }
      const std::string& value = args[++i];

      if (arg == "--root") {
        options.root = value;
      } else if (arg == "--log-file") {
        options.log_file = value;
      } else if (arg == "--log-level") {
        if (!logger::parse_log_level(value, options.log_level)) {
          err << "Error: Unknown log level: " << value << '\n';
          return options;
        }
      } else if (arg == "--compression") {
        auto compression = codec::parse_compression(value);
        if (!compression) {
          err << "Error: Unknown compression: " << value << '\n';
          return options;
        }
        options.transfer.codec.compression = *compression;
      } else {
        try {
          std::size_t consumed = 0;
          unsigned long long size = std::stoull(value, &consumed);
          if (consumed != value.size() || size == 0) {
            throw std::invalid_argument(value);
          }
          options.transfer.block_capacity = static_cast<std::size_t>(size);
        } catch (const std::exception&) {
          err << "Error: Invalid block size: " << value << '\n';
          return options;
        }
      }
    } else {
      err << "Error: Unknown argument: " << arg << '\n';
      return options;
    }
  }

  if (positional.empty()) {
    err << "Error: A command is required\n";
    return options;
  }

  options.command = positional.front();
  options.arguments.assign(positional.begin() + 1, positional.end());

  auto arity = command_arity.find(options.command);
  if (arity == command_arity.end()) {
    err << "Error: Unknown command: " << options.command << '\n';
    return options;
  }
  if (options.arguments.size() != arity->second) {
    err << "Error: " << options.command << " takes " << arity->second << " argument(s)\n";
    return options;
  }

  options.valid = true;
  return options;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::ObjectStore& store) : store_(store) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// COMMAND EXECUTION
//==============================================

int CLI::execute(const ProgramOptions& options, std::ostream& out, std::ostream& err) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << options.command;

  try {
    if (options.command == "push") {
      handle_push_command(options, out, err);
    } else if (options.command == "pull") {
      handle_pull_command(options, out, err);
    } else if (options.command == "list") {
      handle_list_command(options, out);
    } else if (options.command == "delete") {
      handle_delete_command(options, out);
    } else {
      err << "Unknown command: " << options.command << std::endl;
      return 1;
    }
  } catch (const core::TransferError& e) {
    log_and_display_error("Error running " + options.command, e.what(), err);
    return 2;
  } catch (const std::exception& e) {
    log_and_display_error("Unexpected error running " + options.command, e.what(), err);
    return 2;
  }
  return 0;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_push_command(const ProgramOptions& options, std::ostream& out, std::ostream& err) {
  const std::string& name = options.arguments[0];
  const std::string& filename = options.arguments[1];

  std::ifstream file(filename);
  if (!file) {
    throw core::TransferFailure("cannot open input file " + filename);
  }

  // One document per input line, read only as the upload asks for it
  std::size_t line_number = 0;
  codec::DocumentSource source = [&file, &line_number](codec::Document& document) -> bool {
    std::string line;
    if (!std::getline(file, line)) {
      if (file.bad()) {
        throw core::TransferFailure("failed reading input file");
      }
      return false;
    }
    ++line_number;
    document = codec::Document{};
    document.id = std::to_string(line_number);
    document.blob = std::move(line);
    return true;
  };

  transfer::PushOptions push_options;
  push_options.visibility = options.public_object ? store::ObjectVisibility::Public
                                                  : store::ObjectVisibility::Private;
  if (options.show_progress) {
    push_options.progress = make_progress_printer("Pushed", err);
  }

  transfer::UploadPipeline pipeline(store_, options.transfer);
  transfer::PushResult result = pipeline.push_stream(std::move(source), name, push_options);
  if (options.show_progress) {
    err << std::endl;
  }

  out << "Pushed " << result.documents << " documents to " << name << " ("
      << catalog::Catalog::format_size(result.bytes) << ", sha256 " << result.sha256 << ")" << std::endl;
}

void CLI::handle_pull_command(const ProgramOptions& options, std::ostream& out, std::ostream& err) {
  transfer::PullOptions pull_options;
  if (options.show_progress) {
    pull_options.progress = make_progress_printer("Pulled", err);
  }

  transfer::DownloadPipeline pipeline(store_, options.transfer);
  transfer::DocumentStream stream = pipeline.pull_stream(options.arguments[0], pull_options);

  codec::Document document;
  while (stream.next(document)) {
    out << document.blob << '\n';
  }
  out.flush();
  if (options.show_progress) {
    err << std::endl;
  }
}

void CLI::handle_list_command(const ProgramOptions& options, std::ostream& out) {
  catalog::Catalog catalog(store_);
  if (options.show_table) {
    catalog.render_table(options.arguments[0], out);
    return;
  }
  for (const auto& name : catalog.list(options.arguments[0])) {
    out << name << '\n';
  }
  out.flush();
}

void CLI::handle_delete_command(const ProgramOptions& options, std::ostream& out) {
  catalog::Catalog catalog(store_);
  const std::string& name = options.arguments[0];
  if (catalog.remove(name, !options.strict)) {
    out << "Deleted " << name << std::endl;
  } else {
    out << name << " does not exist" << std::endl;
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error, std::ostream& err) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace docxfer
