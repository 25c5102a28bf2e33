#include "transfer/naming.hpp"
#include <algorithm>
#include <filesystem>

namespace jsxfer {
namespace transfer {

namespace {

// Final component of the lexically cleaned path: "a/b/../c/" -> "c", "" -> "."
std::string clean_base_name(const std::string& path) {
  std::filesystem::path cleaned = std::filesystem::path(path).lexically_normal();
  if (cleaned.empty()) {
    return ".";
  }
  if (!cleaned.has_filename()) {
    // Trailing separator: "dir/" normalizes to "dir/" with an empty filename
    cleaned = cleaned.parent_path();
    return cleaned.has_filename() ? cleaned.filename().string() : cleaned.string();
  }
  return cleaned.filename().string();
}

} // namespace

std::string canonical_name(const std::string& path) {
  std::string base = clean_base_name(path);
  std::replace(base.begin(), base.end(), '.', '_');
  std::replace(base.begin(), base.end(), ' ', '_');
  return base;
}

bool names_a_file(const std::string& path) {
  const std::string base = clean_base_name(path);
  return !base.empty() && base != "." && base != "..";
}

bool is_valid_name(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  // Stream names cannot contain subject separators or wildcards
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '*' || c == '>' || c == '\t' || c == '\r' || c == '\n') {
      return false;
    }
  }
  return true;
}

} // namespace transfer
} // namespace jsxfer
