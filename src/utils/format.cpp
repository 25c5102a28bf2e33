#include "utils/format.hpp"
#include <cmath>
#include <cstdio>

namespace jsxfer {
namespace utils {

namespace {

constexpr double BYTES_BASE = 1024.0;
constexpr const char* PREFIXES[] = {"K", "M", "G", "T", "P", "E"};

} // namespace

std::string format_bytes(std::uint64_t bytes) {
  const double value = static_cast<double>(bytes);
  if (value < BYTES_BASE) {
    return std::to_string(bytes) + " B";
  }

  int exponent = static_cast<int>(std::log(value) / std::log(BYTES_BASE));
  // Guard against log rounding at exact powers of 1024
  if (exponent > 1 && value < std::pow(BYTES_BASE, exponent)) {
    --exponent;
  } else if (value >= std::pow(BYTES_BASE, exponent + 1)) {
    ++exponent;
  }
  if (exponent < 1) {
    exponent = 1;
  } else if (exponent > 6) {
    exponent = 6;
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2f %sB", value / std::pow(BYTES_BASE, exponent), PREFIXES[exponent - 1]);
  return buffer;
}

std::string format_duration(std::chrono::steady_clock::duration duration) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  if (ms < 1000) {
    return std::to_string(ms) + "ms";
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3fs", std::chrono::duration<double>(duration).count());
  return buffer;
}

} // namespace utils
} // namespace jsxfer
