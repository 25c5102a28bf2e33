#include "cli/cli.hpp"
#include "transfer/transfer_error.hpp"
#include "utils/format.hpp"
#include <boost/log/trivial.hpp>

namespace jsxfer {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(broker::Broker& broker, CliOptions options)
  : broker_(broker)
  , options_(std::move(options)) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const std::string& command, const std::string& target) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with target: " << target;

  try {
    if (command == "put") {
      handle_put_command(target);
    }
    else if (command == "get") {
      handle_get_command(target);
    }
    else {
      log_error("Unknown command", command);
      return 1;
    }
  }
  catch (const transfer::TransferError& e) {
    log_error("Transfer failed", e.what());
    return 1;
  }
  catch (const broker::BrokerError& e) {
    log_error("Broker error", e.what());
    return 1;
  }
  catch (const std::exception& e) {
    log_error("Unexpected error", e.what());
    return 1;
  }
  return 0;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_put_command(const std::string& file_path) {
  transfer::Uploader uploader(broker_, options_.upload);
  const transfer::TransferStats stats = uploader.upload(file_path);

  BOOST_LOG_TRIVIAL(info) << "Completed transfer of " << utils::format_bytes(stats.bytes)
                          << " in " << utils::format_duration(stats.elapsed);
}

void CLI::handle_get_command(const std::string& name) {
  transfer::Downloader downloader(broker_, options_.download);
  const transfer::TransferStats stats = downloader.download(name);

  if (stats.resubscriptions > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Recovered from " << stats.resubscriptions << " sequence gaps";
  }
  BOOST_LOG_TRIVIAL(info) << "Completed retrieval of " << utils::format_bytes(stats.bytes)
                          << " in " << utils::format_duration(stats.elapsed);
}

void CLI::log_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
}

} // namespace cli
} // namespace jsxfer
