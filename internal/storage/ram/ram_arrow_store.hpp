#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <shared_mutex>
#include <unordered_map>

#include "internal/storage/storage_backend.hpp"

namespace graphflow::storage {

/*
  RAM blob store.

  Backed by Arrow buffers kept in-process; used by the in-memory
  deployment and by tests. Contents vanish with the process.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamArrowStore final : public StorageBackend {
 public:
  RamArrowStore()           = default;
  ~RamArrowStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& key) override;

  bool Exists(const std::string& key) override;

  void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) override;

  void Remove(const std::string& key) override;

  graphflow::runtime::config::BlobTier TierType() const override {
    return graphflow::runtime::config::BLOB_TIER_RAM;
  }

 private:
  mutable std::shared_mutex                                      mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace graphflow::storage
