#include "event_sink.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/value.hpp"

namespace graphflow::engine {

using observability::StringField;

void LoggingEventSink::Publish(const graphflow::v1::WorkflowEvent& event) {
  GRAPHFLOW_LOG_DEBUG("workflow event", {StringField("type", graphflow::v1::WorkflowEventType_Name(event.type())),
                                         StringField("workflow_id", event.workflow_id()),
                                         StringField("execution_id", event.execution_id()), StringField("node", event.node_id()),
                                         StringField("data", util::StructToJson(event.data()))});
}

graphflow::v1::WorkflowEvent MakeEvent(graphflow::v1::WorkflowEventType type, const std::string& workflow_id,
                                       const std::string& execution_id, const std::string& node_id, google::protobuf::Struct data) {
  graphflow::v1::WorkflowEvent event;
  event.set_type(type);
  event.set_workflow_id(workflow_id);
  event.set_execution_id(execution_id);
  event.set_node_id(node_id);
  *event.mutable_timestamp() = util::ToProto(util::Now());
  *event.mutable_data()      = std::move(data);
  return event;
}

} // namespace graphflow::engine
