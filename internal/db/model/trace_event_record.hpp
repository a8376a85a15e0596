#pragma once

#include <cstdint>
#include <string>

namespace graphflow::db::model {

// json holds a serialized graphflow.v1.TraceEvent
struct TraceEventRecord {
  std::string id;
  std::string execution_id;
  uint64_t    sequence = 0;
  int         type     = 0;
  std::string node_id;
  std::string json;
  uint64_t    timestamp_ms = 0;
};

} // namespace graphflow::db::model
