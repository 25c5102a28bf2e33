#ifndef JSXFER_CLI_PROGRAM_OPTIONS_HPP
#define JSXFER_CLI_PROGRAM_OPTIONS_HPP

#include <ostream>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace jsxfer {
namespace cli {

struct ProgramOptions {
  std::string servers;
  std::string creds_file;
  // "put" or "get", lower-cased
  std::string command;
  // File path for put, stream or file name for get
  std::string target;
  logging::severity_level log_level{boost::log::trivial::info};
  std::string log_file;
  bool show_help{false};
  bool valid{false};
  // Set when parsing failed
  std::string error;
};

// Parses [-s urls] [--creds file] [-v] [--log-file file] [-h] <put|get> <target>
ProgramOptions parse_command_line(const std::vector<std::string>& args);
ProgramOptions parse_command_line(int argc, char* argv[]);

void print_usage(std::ostream& out, const std::string& program_name);

} // namespace cli
} // namespace jsxfer

#endif // JSXFER_CLI_PROGRAM_OPTIONS_HPP
