#include "object_arrow_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace graphflow::storage {

using namespace graphflow::storage::common;

ObjectArrowStore::ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

/*
  Object key layout:

      <root_path>/<key>
*/
std::string ObjectArrowStore::ObjectPath(const std::string& key) const {
  ValidateBlobKey(key);
  if (root_path_.empty()) return key;
  if (root_path_.back() == '/') return root_path_ + key;
  return root_path_ + "/" + key;
}

std::shared_ptr<arrow::Buffer> ObjectArrowStore::Read(const std::string& key) {
  if (!Exists(key)) throw util::NotFound("blob not found: " + key);
  auto input = Unwrap(fs_->OpenInputFile(ObjectPath(key)));
  return ReadAll(input);
}

uint64_t ObjectArrowStore::Size(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  if (info.type() != arrow::fs::FileType::File) throw util::NotFound("blob not found: " + key);
  return static_cast<uint64_t>(info.size());
}

bool ObjectArrowStore::Exists(const std::string& key) {
  auto info = Unwrap(fs_->GetFileInfo(ObjectPath(key)));
  return info.type() == arrow::fs::FileType::File;
}

/*
  fsync flag ignored — object stores are atomic per PUT.
*/
void ObjectArrowStore::Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync*/) {
  const auto path = ObjectPath(key);
  if (auto slash = path.rfind('/'); slash != std::string::npos) {
    Unwrap(fs_->CreateDir(path.substr(0, slash), /*recursive=*/true));
  }

  auto out = Unwrap(fs_->OpenOutputStream(path));
  Unwrap(out->Write(buffer->data(), buffer->size()));
  Unwrap(out->Close());
}

void ObjectArrowStore::Remove(const std::string& key) {
  if (!Exists(key)) return;
  Unwrap(fs_->DeleteFile(ObjectPath(key)));
}

} // namespace graphflow::storage
