#include "logger/logger.hpp"
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace jsxfer {
namespace logging {

namespace {

namespace expr = boost::log::expressions;

auto make_formatter() {
  return expr::stream
    << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
    << " [" << boost::log::trivial::severity << "] "
    << expr::smessage;
}

} // namespace

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const LogOptions& options) {
  try {
    auto core = boost::log::core::get();

    // Clear any existing sinks
    core->remove_all_sinks();
    boost::log::add_common_attributes();

    // Console sink writes to stderr so stdout stays free for tool output
    using console_sink_t = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    auto console_backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_backend->auto_flush(true);
    auto console_sink = boost::make_shared<console_sink_t>(console_backend);
    console_sink->set_formatter(make_formatter());
    core->add_sink(console_sink);

    if (!options.log_file.empty()) {
      using file_sink_t = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      std::filesystem::path log_path = std::filesystem::absolute(options.log_file);
      auto file_backend = boost::make_shared<boost::log::sinks::text_file_backend>(
        boost::log::keywords::file_name = log_path.string(),
        boost::log::keywords::open_mode = std::ios::out | std::ios::app,
        boost::log::keywords::rotation_size = 10 * 1024 * 1024);
      file_backend->auto_flush(true);
      auto file_sink = boost::make_shared<file_sink_t>(file_backend);
      file_sink->set_formatter(make_formatter());
      core->add_sink(file_sink);
    }

    set_log_level(options.level);
    core->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

//==============================================
// SEVERITY CONVERSION
//==============================================

std::optional<severity_level> parse_severity(const std::string& name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return boost::log::trivial::trace;
  if (lowered == "debug") return boost::log::trivial::debug;
  if (lowered == "info") return boost::log::trivial::info;
  if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
  if (lowered == "error") return boost::log::trivial::error;
  if (lowered == "fatal") return boost::log::trivial::fatal;
  return std::nullopt;
}

const char* to_string(severity_level level) {
  switch (level) {
    case boost::log::trivial::trace:   return "TRACE";
    case boost::log::trivial::debug:   return "DEBUG";
    case boost::log::trivial::info:    return "INFO";
    case boost::log::trivial::warning: return "WARNING";
    case boost::log::trivial::error:   return "ERROR";
    case boost::log::trivial::fatal:   return "FATAL";
    default:                           return "UNKNOWN";
  }
}

} // namespace logging
} // namespace jsxfer
