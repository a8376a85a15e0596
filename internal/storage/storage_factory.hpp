#pragma once

#include "config/config.pb.h"
#include "storage_backend.hpp"

namespace graphflow::storage {

/*
  Builds the blob store selected by StorageConfig.blob_tier.

      auto blobs = StorageFactory::Build(config.storage());
      blobs->Write("states/t1/exec_v3.json", buffer, true);

  BLOB_TIER_UNSPECIFIED falls back to RAM.
*/

class StorageFactory {
 public:
  static StorageBackendPtr Build(const graphflow::runtime::config::StorageConfig& cfg);
};

} // namespace graphflow::storage
