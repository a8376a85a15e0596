#pragma once

#include <cstdint>
#include <string>

namespace graphflow::db::model {

// json holds a serialized graphflow.v1.Breakpoint
struct BreakpointRecord {
  std::string id;
  std::string session_id;
  std::string json;
  uint64_t    updated_at_ms = 0;
};

} // namespace graphflow::db::model
