#ifndef JSXFER_LOGGER_HPP
#define JSXFER_LOGGER_HPP

#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

namespace jsxfer {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

struct LogOptions {
  severity_level level{boost::log::trivial::info};
  // Empty means console only
  std::string log_file;
};

// Installs the stderr console sink and, if requested, a file sink.
// Safe to call more than once; previous sinks are removed.
void init_logging(const LogOptions& options = {});

// Changes the minimum severity without touching the sinks
void set_log_level(severity_level level);

// Maps trace|debug|info|warning|error|fatal (case-insensitive)
std::optional<severity_level> parse_severity(const std::string& name);

const char* to_string(severity_level level);

} // namespace logging
} // namespace jsxfer

#endif // JSXFER_LOGGER_HPP
