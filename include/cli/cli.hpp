#ifndef JSXFER_CLI_HPP
#define JSXFER_CLI_HPP

#include <ostream>
#include <string>
#include "broker/broker.hpp"
#include "transfer/downloader.hpp"
#include "transfer/uploader.hpp"

namespace jsxfer {
namespace cli {

struct CliOptions {
  transfer::UploadOptions upload;
  transfer::DownloadOptions download;
};

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(broker::Broker& broker, CliOptions options = {});


    // ---- STARTUP ----
    // Runs one put/get command; returns the process exit status
    int run(const std::string& command, const std::string& target);

private:
    // ---- PARAMETERS ----
    broker::Broker& broker_;
    CliOptions options_;


    // ---- COMMAND PROCESSING ----
    void handle_put_command(const std::string& file_path);
    void handle_get_command(const std::string& name);
    void log_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace jsxfer

#endif // JSXFER_CLI_HPP
