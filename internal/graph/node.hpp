#pragma once

#include <functional>
#include <string>

#include "internal/async/cancellation.hpp"
#include "internal/async/executor.hpp"
#include "internal/async/future.hpp"
#include "internal/state/state.hpp"

namespace graphflow::graph {

// Terminal sentinel: an edge to "end" finishes the execution (or branch).
inline constexpr const char* kEndNode = "end";

/*
  What a node sees besides its input state.

  executor is the engine's worker pool; long-running nodes should watch
  cancellation and give up early once it fires.
*/
struct NodeContext {
  std::string               workflow_id;
  std::string               execution_id;
  std::string               node_id;
  std::string               tenant_id;
  async::Executor*          executor = nullptr;
  async::CancellationToken  cancellation;
};

/*
  A node receives its own copy of the state (already derived to the next
  version) and returns the state to continue with. Failing the future
  fails the node.
*/
using NodeFn = std::function<async::Future<state::State>(state::State, const NodeContext&)>;

// Adapts a blocking State(State) callable; it runs on ctx.executor.
NodeFn SyncNode(std::function<state::State(state::State)> fn);

} // namespace graphflow::graph
