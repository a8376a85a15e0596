#include "disk_arrow_store.hpp"

#include <arrow/io/file.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace graphflow::storage {

using namespace graphflow::storage::common;

DiskArrowStore::DiskArrowStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskArrowStore::Read(const std::string& key) {
  auto path = BlobPath(root_, key);
  if (!std::filesystem::exists(path)) throw util::NotFound("blob not found: " + key);

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

uint64_t DiskArrowStore::Size(const std::string& key) {
  auto            path = BlobPath(root_, key);
  std::error_code ec;
  auto            size = std::filesystem::file_size(path, ec);
  if (ec) throw util::NotFound("blob not found: " + key);
  return static_cast<uint64_t>(size);
}

bool DiskArrowStore::Exists(const std::string& key) {
  return std::filesystem::exists(BlobPath(root_, key));
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskArrowStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  auto final_path = BlobPath(root_, key);
  auto tmp_path   = final_path.string() + ".tmp";

  std::filesystem::create_directories(final_path.parent_path());

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));

    if (fsync) Unwrap(out->Flush());

    Unwrap(out->Close());
  }

  std::filesystem::rename(tmp_path, final_path);
}

void DiskArrowStore::Remove(const std::string& key) {
  std::filesystem::remove(BlobPath(root_, key));
}

} // namespace graphflow::storage
