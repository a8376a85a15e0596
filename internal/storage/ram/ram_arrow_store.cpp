#include "ram_arrow_store.hpp"

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::storage {

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamArrowStore::Read(const std::string& key) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(key);
  if (it == buffers_.end()) throw util::NotFound("blob not found: " + key);

  return it->second;
}

bool RamArrowStore::Exists(const std::string& key) {
  std::shared_lock lock(mutex_);
  return buffers_.contains(key);
}

void RamArrowStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  common::ValidateBlobKey(key);
  std::unique_lock lock(mutex_);
  buffers_[key] = buffer;
}

void RamArrowStore::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);
  buffers_.erase(key);
}

} // namespace graphflow::storage
