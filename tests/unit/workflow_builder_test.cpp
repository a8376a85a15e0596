#include "internal/graph/workflow_builder.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;

namespace {

graph::NodeFn Noop() {
  return graph::SyncNode([](state::State s) { return s; });
}

void TestAcyclicGraphBuilds() {
  auto def = graph::WorkflowBuilder("wf")
                 .AddNode("a", Noop())
                 .AddNode("b", Noop())
                 .AddNode("c", Noop())
                 .AddEdge("a", "b")
                 .AddEdge("a", "c")
                 .AddEdge("b", "c")
                 .AddEdge("c", graph::kEndNode)
                 .Build();

  assert(def->Id() == "wf");
  assert(def->EntryNode() == "a");
  assert(def->Edges("a").size() == 2);
  assert(def->Edges("c").front().to == graph::kEndNode);
  assert(def->Edges("missing").empty());
  assert(def->EdgeCount() == 4);
  assert((def->NodeIds() == std::vector<std::string>{"a", "b", "c"}));
}

void TestCycleIsRejected() {
  bool threw = false;
  try {
    graph::WorkflowBuilder("wf")
        .AddNode("a", Noop())
        .AddNode("b", Noop())
        .AddNode("c", Noop())
        .AddEdge("a", "b")
        .AddEdge("b", "c")
        .AddEdge("c", "a")
        .Build();
  } catch (const util::GraphCycleError& e) {
    threw = true;
    assert(e.Cycle().size() >= 3);
  }
  assert(threw);
}

void TestCycleUnreachableFromEntryIsRejected() {
  bool threw = false;
  try {
    graph::WorkflowBuilder("wf")
        .AddNode("start", Noop())
        .AddNode("x", Noop())
        .AddNode("y", Noop())
        .AddEdge("start", graph::kEndNode)
        .AddEdge("x", "y")
        .AddEdge("y", "x")
        .Build();
  } catch (const util::GraphCycleError&) {
    threw = true;
  }
  assert(threw);
}

void TestSelfLoopIsRejected() {
  bool threw = false;
  try {
    graph::WorkflowBuilder("wf").AddNode("a", Noop()).AddEdge("a", "a").Build();
  } catch (const util::GraphCycleError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownEdgeTargetIsRejected() {
  bool threw = false;
  try {
    graph::WorkflowBuilder("wf").AddNode("a", Noop()).AddEdge("a", "ghost").Build();
  } catch (const util::UnknownNodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidNodesAreRejected() {
  graph::WorkflowBuilder builder("wf");
  builder.AddNode("a", Noop());

  bool duplicate = false;
  try {
    builder.AddNode("a", Noop());
  } catch (const util::InvalidArgument&) {
    duplicate = true;
  }
  assert(duplicate);

  bool reserved = false;
  try {
    builder.AddNode(graph::kEndNode, Noop());
  } catch (const util::InvalidArgument&) {
    reserved = true;
  }
  assert(reserved);

  bool empty = false;
  try {
    graph::WorkflowBuilder("empty").Build();
  } catch (const util::InvalidArgument&) {
    empty = true;
  }
  assert(empty);
}

void TestExplicitEntry() {
  auto def = graph::WorkflowBuilder("wf")
                 .AddNode("a", Noop())
                 .AddNode("b", Noop())
                 .AddEdge("b", "a")
                 .SetEntry("b")
                 .Build();
  assert(def->EntryNode() == "b");
  assert(def->HasNode("a"));
  assert(!def->HasNode("end"));
}

void TestConditionHelpers() {
  auto s = state::State::Create("wf", "e1", "t1");
  s.Set("kind", util::NullValue());
  s.Set("count", util::NumberValue(5));

  const auto five = util::NumberValue(5);
  assert(graph::conditions::KeyEquals("count", five).predicate(s));
  assert(graph::conditions::KeyExists("kind").predicate(s));
  assert(!graph::conditions::KeyExists("other").predicate(s));
  assert(graph::conditions::KeyGreaterThan("count", 4).predicate(s));
  assert(!graph::conditions::KeyGreaterThan("count", 5).predicate(s));
  assert(graph::conditions::Always().predicate(s));
}

} // namespace

int main() {
  TestAcyclicGraphBuilds();
  TestCycleIsRejected();
  TestCycleUnreachableFromEntryIsRejected();
  TestSelfLoopIsRejected();
  TestUnknownEdgeTargetIsRejected();
  TestInvalidNodesAreRejected();
  TestExplicitEntry();
  TestConditionHelpers();

  std::cout << "workflow_builder_test: pass\n";
  return 0;
}
