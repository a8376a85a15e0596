#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <cstring>

namespace graphflow::storage::common {

std::shared_ptr<arrow::Buffer> BufferFromString(std::string_view text) {
  auto result = arrow::AllocateBuffer(static_cast<int64_t>(text.size()));
  Unwrap(result.status());
  std::unique_ptr<arrow::Buffer> buffer = std::move(result).ValueOrDie();
  if (!text.empty()) {
    std::memcpy(buffer->mutable_data(), text.data(), text.size());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

std::string BufferToString(const std::shared_ptr<arrow::Buffer>& buffer) {
  if (!buffer) return {};
  return buffer->ToString();
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& uri_or_path) {
  std::string resolved_path;
  if (uri_or_path.find("://") == std::string::npos) {
    return std::make_pair(std::static_pointer_cast<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), uri_or_path);
  }
  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(uri_or_path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace graphflow::storage::common
