#pragma once

#include <cstdint>
#include <string>

namespace graphflow::db::model {

/*
  Persisted state version.

  Exactly one of inline_json / blob_path is populated: small states are
  stored inline, large ones point at a blob written through the storage
  backend.
*/
struct StateRecord {
  std::string state_id;
  std::string execution_id;
  std::string workflow_id;
  std::string tenant_id;
  std::string branch_id;
  uint64_t    version = 0;

  std::string inline_json;
  std::string blob_path;
  uint64_t    size_bytes = 0;

  uint64_t created_at_ms = 0;
};

} // namespace graphflow::db::model
