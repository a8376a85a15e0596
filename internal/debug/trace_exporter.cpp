#include "trace_exporter.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <sstream>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/value.hpp"

namespace graphflow::debug {

using google::protobuf::ListValue;
using google::protobuf::Value;
namespace v1 = graphflow::v1;

namespace {

constexpr std::string_view kTypePrefix = "TRACE_EVENT_";

std::string Render(const ListValue& list) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) throw util::InvalidState("trace export failed: " + status.ToString());
  return json;
}

std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += '"';
    out += c;
  }
  return out + "\"";
}

double Number(const v1::TraceEvent& event, const std::string& key) {
  auto it = event.data().fields().find(key);
  if (it == event.data().fields().end() || it->second.kind_case() != Value::kNumberValue) return 0.0;
  return it->second.number_value();
}

} // namespace

ExportFormat ParseExportFormat(std::string_view name) {
  if (name == "json") return ExportFormat::kJson;
  if (name == "csv") return ExportFormat::kCsv;
  if (name == "chrome" || name == "chrome_trace") return ExportFormat::kChromeTrace;
  throw util::InvalidArgument("unknown export format: " + std::string(name));
}

std::string EventTypeName(v1::TraceEventType type) {
  auto name = v1::TraceEventType_Name(type);
  if (std::string_view(name).substr(0, kTypePrefix.size()) == kTypePrefix) name.erase(0, kTypePrefix.size());
  return name;
}

std::string ExportJson(const ExecutionTrace& trace) {
  ListValue list;
  for (const auto& event : trace.events) {
    Value v;
    auto& f            = *v.mutable_struct_value()->mutable_fields();
    f["eventId"]       = util::StringValue(event.id());
    f["type"]          = util::StringValue(EventTypeName(event.type()));
    f["nodeId"]        = util::StringValue(event.node_id());
    f["timestamp"]     = util::NumberValue(static_cast<double>(util::ToUnixMillis(util::FromProto(event.timestamp()))));
    f["sequenceNumber"] = util::NumberValue(static_cast<double>(event.sequence()));
    *f["data"].mutable_struct_value() = event.data();
    *list.add_values() = std::move(v);
  }
  return Render(list);
}

std::string ExportCsv(const ExecutionTrace& trace) {
  std::ostringstream out;
  out << "EventID,Type,NodeID,Timestamp,SequenceNumber\n";
  for (const auto& event : trace.events) {
    out << CsvField(event.id()) << ',' << EventTypeName(event.type()) << ',' << CsvField(event.node_id()) << ','
        << util::ToUnixMillis(util::FromProto(event.timestamp())) << ',' << event.sequence() << '\n';
  }
  return out.str();
}

std::string ExportChromeTrace(const ExecutionTrace& trace) {
  ListValue list;
  for (const auto& event : trace.events) {
    const auto ts_us = static_cast<double>(
        std::chrono::duration_cast<std::chrono::microseconds>(util::FromProto(event.timestamp()).time_since_epoch()).count());
    double dur_us = 0.0;
    if (event.type() == v1::TRACE_EVENT_NODE_EXIT || event.type() == v1::TRACE_EVENT_NODE_ERROR) {
      dur_us = Number(event, "duration_ms") * 1000.0;
    }

    Value v;
    auto& f = *v.mutable_struct_value()->mutable_fields();
    f["name"] = util::StringValue(event.node_id().empty() ? EventTypeName(event.type()) : event.node_id());
    f["cat"]  = util::StringValue(EventTypeName(event.type()));
    f["ph"]   = util::StringValue("X");
    // Node executions span from their start to the exit event.
    f["ts"]  = util::NumberValue(ts_us - dur_us);
    f["dur"] = util::NumberValue(dur_us);
    f["pid"] = util::NumberValue(1);
    f["tid"] = util::NumberValue(1);
    *f["args"].mutable_struct_value() = event.data();
    *list.add_values() = std::move(v);
  }
  return Render(list);
}

std::string Export(const ExecutionTrace& trace, ExportFormat format) {
  switch (format) {
    case ExportFormat::kJson:
      return ExportJson(trace);
    case ExportFormat::kCsv:
      return ExportCsv(trace);
    case ExportFormat::kChromeTrace:
      return ExportChromeTrace(trace);
  }
  throw util::InvalidArgument("unknown export format");
}

} // namespace graphflow::debug
