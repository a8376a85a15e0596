#pragma once

#include <arrow/buffer.h>

#include <filesystem>

#include "internal/storage/storage_backend.hpp"

namespace graphflow::storage {

/*
  Durable disk blob store using Arrow IO.

  Properties:
    - atomic replace writes (tmp file + rename)
    - optional fsync
    - key "a/b/c.json" lands at <root>/a/b/c.json
*/

class DiskArrowStore final : public StorageBackend {
 public:
  explicit DiskArrowStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  uint64_t Size(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  graphflow::runtime::config::BlobTier TierType() const override {
    return graphflow::runtime::config::BLOB_TIER_DISK;
  }

 private:
  std::filesystem::path root_;
};

} // namespace graphflow::storage
