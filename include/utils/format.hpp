#ifndef JSXFER_UTILS_FORMAT_HPP
#define JSXFER_UTILS_FORMAT_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace jsxfer {
namespace utils {

// "512 B", "1.50 KB", "3.00 GB" (base 1024)
std::string format_bytes(std::uint64_t bytes);

// "250ms" below one second, "1.250s" otherwise
std::string format_duration(std::chrono::steady_clock::duration duration);

} // namespace utils
} // namespace jsxfer

#endif // JSXFER_UTILS_FORMAT_HPP
