#include "cli/program_options.hpp"
#include "broker/nats_connection.hpp"
#include <algorithm>
#include <cctype>

namespace jsxfer {
namespace cli {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

ProgramOptions fail(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

} // namespace

//==============================================
// PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  ProgramOptions options;
  options.servers = broker::DEFAULT_NATS_URL;
  std::vector<std::string> positional;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help" || arg == "-help") {
      options.show_help = true;
      return options;
    }
    if (arg == "-v" || arg == "--verbose") {
      options.log_level = boost::log::trivial::debug;
      continue;
    }

    const bool takes_value = arg == "-s" || arg == "--server" || arg == "--creds" || arg == "-creds" ||
                             arg == "--log-file";
    if (takes_value) {
      if (i + 1 >= args.size()) {
        return fail(options, "Missing value for " + arg);
      }
      const std::string& value = args[++i];
      if (arg == "-s" || arg == "--server") {
        options.servers = value;
      } else if (arg == "--log-file") {
        options.log_file = value;
      } else {
        options.creds_file = value;
      }
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      return fail(options, "Unknown argument: " + arg);
    }
    positional.push_back(arg);
  }

  if (positional.size() != 2) {
    return fail(options, "Expected a command and a target");
  }

  options.command = to_lower(positional[0]);
  options.target = positional[1];
  if (options.command != "put" && options.command != "get") {
    return fail(options, "Unknown command: " + positional[0]);
  }

  options.valid = true;
  return options;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_command_line(args);
}

//==============================================
// USAGE
//==============================================

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [-s server] [--creds file] <put|get> <file|stream>\n"
      << "Options:\n"
      << "  -s <urls>          The nats server URLs, separated by comma (default " << broker::DEFAULT_NATS_URL << ")\n"
      << "  --creds <file>     User credentials file\n"
      << "  --log-file <file>  Also write log output to <file>\n"
      << "  -v, --verbose      Enable debug logging\n"
      << "  -h, --help         Show this help message\n"
      << "Commands:\n"
      << "  put <file>         Upload <file> into a new stream named after it\n"
      << "  get <stream>       Download <stream> into the current directory\n"
      << "Example: " << program_name << " -s nats://127.0.0.1:4222 put ./report.pdf\n";
}

} // namespace cli
} // namespace jsxfer
