#pragma once

#include <google/protobuf/struct.pb.h>

#include <memory>
#include <string>

#include "graphflow/v1.hpp"

namespace graphflow::engine {

/*
  Best-effort destination for lifecycle events. Publish must not block
  the caller or throw into it.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const graphflow::v1::WorkflowEvent& event) = 0;
};

using EventSinkPtr = std::shared_ptr<EventSink>;

// Writes every event to the structured log at debug level.
class LoggingEventSink final : public EventSink {
 public:
  void Publish(const graphflow::v1::WorkflowEvent& event) override;
};

graphflow::v1::WorkflowEvent MakeEvent(graphflow::v1::WorkflowEventType type, const std::string& workflow_id,
                                       const std::string& execution_id, const std::string& node_id = {},
                                       google::protobuf::Struct data = {});

} // namespace graphflow::engine
