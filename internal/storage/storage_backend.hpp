#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

#include "config/config.pb.h"

namespace graphflow::storage {

/*
  Blob storage abstraction for state documents too large to keep inline
  in the repository.

  Every blob is an Arrow Buffer addressed by a relative key such as
  "states/<tenant>/<state_id>.json".

  Implementations:
    RAM      → in-memory Arrow buffers
    DISK     → Arrow file IO, atomic replace
    OBJECT   → any Arrow filesystem URI (s3://, gs://, file://)
*/

class StorageBackend {
 public:
  virtual ~StorageBackend() = default;

  // Throws util::NotFound when the key is absent.
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& key) = 0;

  /*
    Return blob size in bytes.

    Backends with cheap metadata lookups (disk/object) override this.
  */
  virtual uint64_t Size(const std::string& key) {
    return static_cast<uint64_t>(Read(key)->size());
  }

  virtual bool Exists(const std::string& key) = 0;

  // Replaces any previous blob under key.
  virtual void Write(const std::string& key, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // Removing a missing key is not an error.
  virtual void Remove(const std::string& key) = 0;

  virtual graphflow::runtime::config::BlobTier TierType() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;

} // namespace graphflow::storage
