#include "trace_analyzer.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/util/time.hpp"
#include "internal/util/value.hpp"

namespace graphflow::debug {

namespace v1 = graphflow::v1;

namespace {

double DurationMs(const v1::TraceEvent& event) {
  auto it = event.data().fields().find("duration_ms");
  if (it == event.data().fields().end() || it->second.kind_case() != google::protobuf::Value::kNumberValue) return 0.0;
  return it->second.number_value();
}

} // namespace

TraceAnalysis TraceAnalyzer::Analyze(const ExecutionTrace& trace) const {
  TraceAnalysis out;
  out.execution_id = trace.execution_id;
  out.workflow_id  = trace.workflow_id;
  out.status       = trace.status;
  out.event_count  = trace.events.size();

  if (!trace.events.empty()) {
    auto first         = util::FromProto(trace.events.front().timestamp());
    auto last          = util::FromProto(trace.events.back().timestamp());
    out.total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(last - first);
  }

  std::unordered_set<std::string> seen;
  std::map<std::string, std::pair<double, uint64_t>> durations;  // total ms, samples
  double                                             all_total   = 0.0;
  uint64_t                                           all_samples = 0;

  for (const auto& event : trace.events) {
    switch (event.type()) {
      case v1::TRACE_EVENT_NODE_ENTER:
        ++out.visit_counts[event.node_id()];
        if (seen.insert(event.node_id()).second) out.critical_path.push_back(event.node_id());
        break;
      case v1::TRACE_EVENT_NODE_ERROR:
        out.errors.push_back(event);
        [[fallthrough]];
      case v1::TRACE_EVENT_NODE_EXIT: {
        auto  ms = DurationMs(event);
        auto& d  = durations[event.node_id()];
        d.first += ms;
        ++d.second;
        all_total += ms;
        ++all_samples;
        break;
      }
      default:
        break;
    }
  }

  if (all_samples > 0) out.average_node_ms = all_total / static_cast<double>(all_samples);

  const auto threshold = static_cast<double>(bottleneck_threshold_.count());
  for (const auto& [node, d] : durations) {
    double avg                = d.first / static_cast<double>(d.second);
    out.node_average_ms[node] = avg;
    if (avg > threshold) out.bottlenecks.push_back(Bottleneck{node, avg, d.second});
  }
  std::sort(out.bottlenecks.begin(), out.bottlenecks.end(),
            [](const Bottleneck& a, const Bottleneck& b) { return a.average_ms > b.average_ms; });
  return out;
}

google::protobuf::Struct ToStruct(const TraceAnalysis& analysis) {
  google::protobuf::Struct s;
  auto&                    f = *s.mutable_fields();
  f["execution_id"]          = util::StringValue(analysis.execution_id);
  f["workflow_id"]           = util::StringValue(analysis.workflow_id);
  f["status"]                = util::StringValue(std::string(TraceStatusName(analysis.status)));
  f["total_duration_ms"]     = util::NumberValue(static_cast<double>(analysis.total_duration.count()));
  f["event_count"]           = util::NumberValue(static_cast<double>(analysis.event_count));
  f["average_node_ms"]       = util::NumberValue(analysis.average_node_ms);

  auto* path = f["critical_path"].mutable_list_value();
  for (const auto& node : analysis.critical_path) *path->add_values() = util::StringValue(node);

  auto* slow = f["bottlenecks"].mutable_list_value();
  for (const auto& b : analysis.bottlenecks) {
    google::protobuf::Value v;
    auto&                   bf = *v.mutable_struct_value()->mutable_fields();
    bf["node_id"]              = util::StringValue(b.node_id);
    bf["average_ms"]           = util::NumberValue(b.average_ms);
    bf["count"]                = util::NumberValue(static_cast<double>(b.count));
    *slow->add_values()        = std::move(v);
  }

  auto* errors = f["errors"].mutable_list_value();
  for (const auto& e : analysis.errors) {
    google::protobuf::Value v;
    auto&                   ef = *v.mutable_struct_value()->mutable_fields();
    ef["node_id"]              = util::StringValue(e.node_id());
    ef["sequence"]             = util::NumberValue(static_cast<double>(e.sequence()));
    auto it                    = e.data().fields().find("error");
    if (it != e.data().fields().end()) ef["error"] = it->second;
    *errors->add_values() = std::move(v);
  }

  auto* visits = f["visit_counts"].mutable_struct_value();
  for (const auto& [node, count] : analysis.visit_counts) {
    (*visits->mutable_fields())[node] = util::NumberValue(static_cast<double>(count));
  }
  return s;
}

} // namespace graphflow::debug
