#include "workflow_definition.hpp"

#include "internal/util/errors.hpp"

namespace graphflow::graph {

bool WorkflowDefinition::HasNode(const std::string& node_id) const {
  return nodes_.contains(node_id);
}

const NodeFn& WorkflowDefinition::Node(const std::string& node_id) const {
  auto it = nodes_.find(node_id);
  if (it == nodes_.end()) throw util::UnknownNodeError("workflow " + id_ + " has no node '" + node_id + "'");
  return it->second;
}

const std::vector<Edge>& WorkflowDefinition::Edges(const std::string& from) const {
  static const std::vector<Edge> kNoEdges;
  auto                           it = edges_.find(from);
  return it == edges_.end() ? kNoEdges : it->second;
}

std::size_t WorkflowDefinition::EdgeCount() const {
  std::size_t count = 0;
  for (const auto& [_, edges] : edges_) count += edges.size();
  return count;
}

} // namespace graphflow::graph
