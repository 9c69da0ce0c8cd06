#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rackwise::store {

inline void ValidateSegment(std::string_view segment) {
  if (segment.empty()) {
    throw std::invalid_argument("path segment must not be empty");
  }
  for (char c : segment) {
    if (c == '/' || c == '\0') {
      throw std::invalid_argument("path segment contains invalid character");
    }
  }
  if (segment == "." || segment == "..") {
    throw std::invalid_argument("path segment must not be a relative path component");
  }
}

// MakePath("/nodes", "active") -> "/nodes/active"
inline std::string MakePath(std::string_view parent, std::string_view child) {
  ValidateSegment(child);
  std::string path(parent);
  if (path.empty() || path.back() != '/') {
    path.push_back('/');
  }
  path.append(child);
  return path;
}

// "/nodes/active/n1" -> "/nodes/active"; "/nodes" -> "/"
inline std::string ParentPath(std::string_view path) {
  const auto slash = path.rfind('/');
  if (slash == std::string_view::npos || slash == 0) {
    return "/";
  }
  return std::string(path.substr(0, slash));
}

inline void ValidatePath(std::string_view path) {
  if (path.empty() || path.front() != '/') {
    throw std::invalid_argument("store path must be absolute: " + std::string(path));
  }
  if (path.size() > 1 && path.back() == '/') {
    throw std::invalid_argument("store path must not end with '/': " + std::string(path));
  }
  if (path.find("//") != std::string_view::npos) {
    throw std::invalid_argument("store path contains an empty segment: " + std::string(path));
  }
}

} // namespace rackwise::store
