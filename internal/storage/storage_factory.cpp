#include "storage_factory.hpp"

#include <filesystem>

#include "common/arrow_utils.hpp"
#include "disk/disk_arrow_store.hpp"
#include "object/object_arrow_store.hpp"
#include "ram/ram_arrow_store.hpp"

namespace graphflow::storage {

using graphflow::runtime::config::BlobTier;

StorageBackendPtr StorageFactory::Build(const graphflow::runtime::config::StorageConfig& cfg) {
  switch (cfg.blob_tier()) {
    case graphflow::runtime::config::BLOB_TIER_DISK: {
      std::filesystem::path disk_root =
          cfg.disk().root_path().empty() ? std::filesystem::path{"/tmp/graphflow"} : std::filesystem::path{cfg.disk().root_path()};
      return std::make_shared<DiskArrowStore>(std::move(disk_root));
    }
    case graphflow::runtime::config::BLOB_TIER_OBJECT: {
      if (cfg.object().root_path().empty()) {
        throw util::InvalidArgument("storage.object.root_path is required for BLOB_TIER_OBJECT");
      }
      auto [object_fs, object_root] = common::Unwrap(common::ResolveFileSystem(cfg.object().root_path()));
      return std::make_shared<ObjectArrowStore>(std::move(object_fs), std::move(object_root));
    }
    case graphflow::runtime::config::BLOB_TIER_RAM:
    case graphflow::runtime::config::BLOB_TIER_UNSPECIFIED:
    default:
      return std::make_shared<RamArrowStore>();
  }
}

} // namespace graphflow::storage
