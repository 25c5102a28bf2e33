#include "broker/jetstream.hpp"
#include "broker/nats_connection.hpp"
#include "cli/cli.hpp"
#include "cli/program_options.hpp"
#include "logger/logger.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> connection_lost{false};

int run_transfer(const jsxfer::cli::ProgramOptions& options) {
  jsxfer::broker::ConnectionOptions connection_options;
  connection_options.servers = options.servers;
  connection_options.creds_file = options.creds_file;
  connection_options.closed_handler = [](const std::string&) { connection_lost = true; };

  try {
    jsxfer::broker::NatsConnection connection(connection_options);
    connection.connect();

    jsxfer::broker::JetStream jetstream(connection);
    jsxfer::cli::CLI cli(jetstream);
    const int status = cli.run(options.command, options.target);

    connection.close();
    return connection_lost ? 1 : status;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << e.what();
    return 1;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const std::string program_name = "jsxfer";
  const auto options = jsxfer::cli::parse_command_line(argc, argv);

  if (options.show_help) {
    jsxfer::cli::print_usage(std::cerr, program_name);
    return 0;
  }
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    jsxfer::cli::print_usage(std::cerr, program_name);
    return 1;
  }

  try {
    jsxfer::logging::init_logging({options.log_level, options.log_file});
  }
  catch (const std::exception&) {
    // init_logging already reported the cause
    return 1;
  }

  const int status = run_transfer(options);
  // Releases nats.c's global threads once every connection is gone
  nats_Close();
  return status;
}
