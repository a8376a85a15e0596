#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/graph/workflow_definition.hpp"

namespace graphflow::graph {

/*
  Collects nodes and edges, then validates them into a
  WorkflowDefinition.

      auto wf = WorkflowBuilder("triage")
                    .AddNode("classify", classify)
                    .AddNode("answer", answer)
                    .AddEdge("classify", "answer")
                    .AddEdge("answer", kEndNode)
                    .Build();

  Build() checks that edges reference known nodes (or "end") and that the
  graph is acyclic.
*/
class WorkflowBuilder {
 public:
  explicit WorkflowBuilder(std::string workflow_id);

  // Throws util::InvalidArgument for empty, reserved or duplicate ids.
  WorkflowBuilder& AddNode(const std::string& node_id, NodeFn fn);

  WorkflowBuilder& AddEdge(const std::string& from, const std::string& to, std::vector<Condition> conditions = {},
                           RoutingStrategy strategy = RoutingStrategy::kSimple, double priority = 1.0,
                           std::map<std::string, std::string> metadata = {});

  WorkflowBuilder& AddEdge(Edge edge);

  // Defaults to the first registered node.
  WorkflowBuilder& SetEntry(const std::string& node_id);

  WorkflowDefinitionPtr Build() const;

 private:
  void ValidateEdges() const;
  void ValidateAcyclic() const;

  std::string                             workflow_id_;
  std::string                             entry_;
  std::vector<std::string>                node_order_;
  std::unordered_map<std::string, NodeFn> nodes_;
  std::vector<Edge>                       edges_;
};

} // namespace graphflow::graph
