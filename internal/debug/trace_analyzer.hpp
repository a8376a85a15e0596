#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/debug/trace_recorder.hpp"

namespace graphflow::debug {

struct Bottleneck {
  std::string node_id;
  double      average_ms = 0.0;
  uint64_t    count      = 0;
};

struct TraceAnalysis {
  std::string                            execution_id;
  std::string                            workflow_id;
  TraceStatus                            status = TraceStatus::kRunning;
  std::chrono::milliseconds              total_duration{0};
  std::size_t                            event_count = 0;
  std::vector<std::string>               critical_path;
  std::vector<Bottleneck>                bottlenecks;
  std::vector<graphflow::v1::TraceEvent> errors;
  double                                 average_node_ms = 0.0;
  std::map<std::string, uint64_t>        visit_counts;
  std::map<std::string, double>          node_average_ms;
};

/*
  Post-hoc analysis of a trace. Durations come from NODE_EXIT and
  NODE_ERROR events, so persisted traces analyze the same as live ones.
*/
class TraceAnalyzer {
 public:
  explicit TraceAnalyzer(std::chrono::milliseconds bottleneck_threshold = std::chrono::milliseconds(1000))
      : bottleneck_threshold_(bottleneck_threshold) {
  }

  TraceAnalysis Analyze(const ExecutionTrace& trace) const;

 private:
  std::chrono::milliseconds bottleneck_threshold_;
};

google::protobuf::Struct ToStruct(const TraceAnalysis& analysis);

} // namespace graphflow::debug
