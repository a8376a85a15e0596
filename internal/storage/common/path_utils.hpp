#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace graphflow::storage::common {

/*
  Blob keys are relative, '/'-separated and may not escape the store root.
*/
inline void ValidateBlobKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("blob key must not be empty");
  }
  if (key.front() == '/') {
    throw util::InvalidArgument("blob key must be relative: " + key);
  }
  for (char c : key) {
    if (c == '\\' || c == '\0') {
      throw util::InvalidArgument("blob key contains invalid character: " + key);
    }
  }

  std::size_t start = 0;
  while (start <= key.size()) {
    auto end     = key.find('/', start);
    auto segment = key.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      throw util::InvalidArgument("blob key has an invalid path segment: " + key);
    }
    if (end == std::string::npos) break;
    start = end + 1;
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& key) {
  ValidateBlobKey(key);
  return root / std::filesystem::path(key);
}

// Sanitizes an id for use as one key segment.
inline std::string KeySegment(const std::string& id) {
  std::string out = id.empty() ? std::string("_") : id;
  for (auto& c : out) {
    if (c == '/' || c == '\\' || c == '\0') c = '_';
  }
  if (out == "." || out == "..") out = "_";
  return out;
}

} // namespace graphflow::storage::common
