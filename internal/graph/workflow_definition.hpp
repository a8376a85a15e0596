#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/graph/edge.hpp"
#include "internal/graph/node.hpp"

namespace graphflow::graph {

class WorkflowBuilder;

/*
  Validated, immutable workflow graph. Produced only by
  WorkflowBuilder::Build(); safe to share across executions and threads.
*/
class WorkflowDefinition {
 public:
  const std::string& Id() const {
    return id_;
  }
  const std::string& EntryNode() const {
    return entry_;
  }

  bool HasNode(const std::string& node_id) const;

  // Throws util::UnknownNodeError.
  const NodeFn& Node(const std::string& node_id) const;

  // Outgoing edges in registration order; empty for unknown nodes.
  const std::vector<Edge>& Edges(const std::string& from) const;

  // Registration order.
  const std::vector<std::string>& NodeIds() const {
    return node_order_;
  }

  std::size_t EdgeCount() const;

 private:
  friend class WorkflowBuilder;
  WorkflowDefinition() = default;

  std::string                                        id_;
  std::string                                        entry_;
  std::vector<std::string>                           node_order_;
  std::unordered_map<std::string, NodeFn>            nodes_;
  std::unordered_map<std::string, std::vector<Edge>> edges_;
};

using WorkflowDefinitionPtr = std::shared_ptr<const WorkflowDefinition>;

} // namespace graphflow::graph
