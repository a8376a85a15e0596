#pragma once

#include <cstdint>
#include <string>

#include "graphflow/v1/state.pb.h"

namespace graphflow::db::model {

struct CheckpointRecord {
  std::string id;
  std::string execution_id;
  std::string workflow_id;
  std::string node_id;
  std::string state_id;
  uint64_t    state_version = 0;

  graphflow::v1::StorageLocation location = graphflow::v1::STORAGE_LOCATION_INLINE;
  graphflow::v1::CheckpointType  type     = graphflow::v1::CHECKPOINT_TYPE_AUTO;
  std::string                    description;

  uint64_t created_at_ms = 0;
};

} // namespace graphflow::db::model
