#ifndef JSXFER_TRANSFER_NAMING_HPP
#define JSXFER_TRANSFER_NAMING_HPP

#include <string>

namespace jsxfer {
namespace transfer {

// Derives the stream name (and download file name) from a path:
// the cleaned base name with '.' and ' ' replaced by '_'.
// Files with the same base name map to the same identifier.
std::string canonical_name(const std::string& path);

// False when the cleaned path ends in "." or ".." (e.g. "", "a/..")
bool names_a_file(const std::string& path);

// True if the identifier is usable as a stream and file name
bool is_valid_name(const std::string& name);

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_NAMING_HPP
