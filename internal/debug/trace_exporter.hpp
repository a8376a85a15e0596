#pragma once

#include <string>
#include <string_view>

#include "internal/debug/trace_recorder.hpp"

namespace graphflow::debug {

enum class ExportFormat {
  kJson,
  kCsv,
  kChromeTrace,
};

// "json", "csv" or "chrome"; throws util::InvalidArgument otherwise.
ExportFormat ParseExportFormat(std::string_view name);

std::string EventTypeName(graphflow::v1::TraceEventType type);

// Array of {eventId, type, nodeId, timestamp (unix ms), sequenceNumber, data}.
std::string ExportJson(const ExecutionTrace& trace);

// EventID,Type,NodeID,Timestamp,SequenceNumber
std::string ExportCsv(const ExecutionTrace& trace);

// Chrome trace-event array of complete ("X") events, microsecond timestamps.
std::string ExportChromeTrace(const ExecutionTrace& trace);

std::string Export(const ExecutionTrace& trace, ExportFormat format);

} // namespace graphflow::debug
