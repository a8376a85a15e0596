#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/storage_backend.hpp"

namespace graphflow::storage {

/*
  Object storage blob store on top of an Arrow filesystem.

  Characteristics:
    - one object per key, atomic per PUT
    - no fsync semantics
*/

class ObjectArrowStore final : public StorageBackend {
 public:
  ObjectArrowStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  graphflow::runtime::config::BlobTier TierType() const override {
    return graphflow::runtime::config::BLOB_TIER_OBJECT;
  }

 private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace graphflow::storage
