#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "graphflow/v1.hpp"
#include "internal/async/cancellation.hpp"
#include "internal/async/future.hpp"
#include "internal/state/state.hpp"

namespace graphflow::engine {

struct ExecutionInfo {
  std::string              workflow_id;
  std::string              execution_id;
  std::string              tenant_id;
  async::CancellationToken cancellation;
};

/*
  What the engine should do after OnNodeEnter resolves. A replacement
  state (e.g. variables modified while paused) is used as the node input.
*/
struct EnterDirective {
  enum class Action {
    kProceed,
    kJump,
    kTerminate,
  };

  Action                      action = Action::kProceed;
  std::string                 jump_to;
  std::optional<state::State> state;
};

/*
  Hooks the engine calls around every step. Notifications run on pool
  threads and must not block; OnNodeEnter may hold the step by returning
  a pending future (the debugger does this while paused).

  Exceptions thrown from a hook are logged and otherwise ignored.
*/
class ExecutionObserver {
 public:
  virtual ~ExecutionObserver() = default;

  virtual void OnExecutionStarted(const ExecutionInfo&, const state::State&) {
  }

  virtual async::Future<EnterDirective> OnNodeEnter(const ExecutionInfo&, const std::string&, const state::State&) {
    return async::MakeReady(EnterDirective{});
  }

  virtual void OnNodeExit(const ExecutionInfo&, const std::string&, const state::State&, std::chrono::milliseconds) {
  }

  virtual void OnNodeError(const ExecutionInfo&, const std::string&, const state::State&, const std::string&,
                           std::chrono::milliseconds) {
  }

  virtual void OnEdge(const ExecutionInfo&, const std::string&, const std::string&, double, const std::string&) {
  }

  virtual void OnStateChange(const ExecutionInfo&, const std::string&, const state::State&) {
  }

  virtual void OnExecutionFinished(const ExecutionInfo&, graphflow::v1::ExecutionStatus, const state::State&, const std::string&) {
  }
};

using ExecutionObserverPtr = std::shared_ptr<ExecutionObserver>;

} // namespace graphflow::engine
