#include "workflow_builder.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace graphflow::graph {

WorkflowBuilder::WorkflowBuilder(std::string workflow_id) : workflow_id_(std::move(workflow_id)) {
  if (workflow_id_.empty()) throw util::InvalidArgument("workflow id must not be empty");
}

WorkflowBuilder& WorkflowBuilder::AddNode(const std::string& node_id, NodeFn fn) {
  if (node_id.empty()) throw util::InvalidArgument("node id must not be empty");
  if (node_id == kEndNode) throw util::InvalidArgument("node id '" + node_id + "' is reserved");
  if (!fn) throw util::InvalidArgument("node '" + node_id + "' has no function");
  if (nodes_.contains(node_id)) throw util::InvalidArgument("duplicate node id '" + node_id + "'");

  node_order_.push_back(node_id);
  nodes_.emplace(node_id, std::move(fn));
  return *this;
}

WorkflowBuilder& WorkflowBuilder::AddEdge(const std::string& from, const std::string& to, std::vector<Condition> conditions,
                                          RoutingStrategy strategy, double priority, std::map<std::string, std::string> metadata) {
  return AddEdge(Edge{from, to, std::move(conditions), strategy, priority, std::move(metadata)});
}

WorkflowBuilder& WorkflowBuilder::AddEdge(Edge edge) {
  for (const auto& c : edge.conditions) {
    if (!c.predicate) throw util::InvalidArgument("condition '" + c.name + "' on edge " + edge.from + "->" + edge.to + " has no predicate");
    if (c.weight < 0.0) throw util::InvalidArgument("condition '" + c.name + "' has a negative weight");
  }
  if (edge.priority < 0.0) throw util::InvalidArgument("edge " + edge.from + "->" + edge.to + " has a negative priority");

  edges_.push_back(std::move(edge));
  return *this;
}

WorkflowBuilder& WorkflowBuilder::SetEntry(const std::string& node_id) {
  entry_ = node_id;
  return *this;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void WorkflowBuilder::ValidateEdges() const {
  for (const auto& edge : edges_) {
    if (!nodes_.contains(edge.from)) {
      throw util::UnknownNodeError("edge " + edge.from + "->" + edge.to + " starts at unknown node '" + edge.from + "'");
    }
    if (edge.to != kEndNode && !nodes_.contains(edge.to)) {
      throw util::UnknownNodeError("edge " + edge.from + "->" + edge.to + " targets unknown node '" + edge.to + "'");
    }
  }
}

/*
  Three-colour DFS over every node in registration order. Reaching a grey
  node is a back edge; the grey stack from that node onward is the cycle.
*/
void WorkflowBuilder::ValidateAcyclic() const {
  enum class Colour { kWhite, kGrey, kBlack };

  std::unordered_map<std::string, std::vector<std::string>> adjacency;
  for (const auto& edge : edges_) {
    if (edge.to == kEndNode) continue;
    adjacency[edge.from].push_back(edge.to);
  }

  std::unordered_map<std::string, Colour> colour;
  for (const auto& id : node_order_) colour[id] = Colour::kWhite;

  struct Frame {
    std::string node;
    std::size_t next_child = 0;
  };

  for (const auto& root : node_order_) {
    if (colour[root] != Colour::kWhite) continue;

    std::vector<Frame> stack{{root, 0}};
    colour[root] = Colour::kGrey;

    while (!stack.empty()) {
      auto&       frame    = stack.back();
      const auto& children = adjacency[frame.node];

      if (frame.next_child == children.size()) {
        colour[frame.node] = Colour::kBlack;
        stack.pop_back();
        continue;
      }

      const auto child = children[frame.next_child++];
      if (colour[child] == Colour::kGrey) {
        std::vector<std::string> cycle;
        auto start = std::find_if(stack.begin(), stack.end(), [&](const Frame& f) { return f.node == child; });
        for (auto it = start; it != stack.end(); ++it) cycle.push_back(it->node);
        cycle.push_back(child);
        throw util::GraphCycleError(std::move(cycle));
      }
      if (colour[child] == Colour::kWhite) {
        colour[child] = Colour::kGrey;
        stack.push_back({child, 0});
      }
    }
  }
}

WorkflowDefinitionPtr WorkflowBuilder::Build() const {
  if (node_order_.empty()) throw util::InvalidArgument("workflow " + workflow_id_ + " has no nodes");
  if (!entry_.empty() && !nodes_.contains(entry_)) throw util::UnknownNodeError("entry node '" + entry_ + "' is not registered");

  ValidateEdges();
  ValidateAcyclic();

  std::shared_ptr<WorkflowDefinition> def(new WorkflowDefinition());
  def->id_         = workflow_id_;
  def->entry_      = entry_.empty() ? node_order_.front() : entry_;
  def->node_order_ = node_order_;
  def->nodes_      = nodes_;
  for (const auto& edge : edges_) {
    def->edges_[edge.from].push_back(edge);
  }
  return def;
}

} // namespace graphflow::graph
