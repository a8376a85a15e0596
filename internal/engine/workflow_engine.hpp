#pragma once

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "graphflow/v1.hpp"
#include "internal/async/executor.hpp"
#include "internal/async/future.hpp"
#include "internal/async/timer_service.hpp"
#include "internal/engine/event_sink.hpp"
#include "internal/engine/execution_observer.hpp"
#include "internal/engine/quota_gate.hpp"
#include "internal/graph/workflow_definition.hpp"
#include "internal/router/conditional_router.hpp"
#include "internal/state/state_store.hpp"

namespace graphflow::engine {

struct EngineOptions {
  std::chrono::milliseconds node_timeout          = std::chrono::seconds(30);
  bool                      checkpoint_every_node = true;
  bool                      backtrack_on_failure  = false;

  static EngineOptions FromConfig(const graphflow::runtime::config::EngineConfig& cfg);
};

struct ExecuteOptions {
  std::string tenant_id = "default";
  // Generated when empty.
  std::string                              execution_id;
  std::optional<std::chrono::milliseconds> node_timeout;
};

struct ExecutionHandle {
  std::string                  execution_id;
  async::Future<state::State> result;
};

struct ExecutionStatus {
  std::string                    execution_id;
  std::string                    workflow_id;
  std::string                    tenant_id;
  graphflow::v1::ExecutionStatus status = graphflow::v1::EXECUTION_STATUS_SCHEDULED;
  std::string                    current_node;
  std::string                    failed_node;
  std::string                    error;
  std::string                    error_type;
  uint64_t                       version = 0;
  std::vector<std::string>       path;
  util::TimePoint                started_at;
  std::optional<util::TimePoint> finished_at;
};

struct EngineDependencies {
  async::Executor*                            executor = nullptr;
  async::TimerService*                        timer    = nullptr;
  std::shared_ptr<state::StateStore>          store;
  std::shared_ptr<router::ConditionalRouter>  router;
  std::shared_ptr<QuotaGate>                  gate;
  EventSinkPtr                                events;
};

/*
  Drives executions of workflow definitions.

  Each step is a chain of future continuations on the executor:
  authorize, observer enter hook, node under timeout and cancellation,
  persist, route, repeat until "end". Parallel edges fork branches that
  run concurrently and are joined (in branch order) before the shared
  continuation.

  A failing execution writes error, error_type, failed_node and
  status=failed into its state, saves it with an ERROR checkpoint at the
  failing node and then fails its future. Cancelled executions write
  nothing further; the last checkpoint stays as it was.
*/
class WorkflowEngine {
 public:
  WorkflowEngine(EngineDependencies deps, EngineOptions options = {});
  ~WorkflowEngine();

  WorkflowEngine(const WorkflowEngine&)            = delete;
  WorkflowEngine& operator=(const WorkflowEngine&) = delete;

  // Throws util::AlreadyExists when execution_id names a running execution.
  ExecutionHandle Execute(graph::WorkflowDefinitionPtr definition, const google::protobuf::Struct& initial_data = {},
                          ExecuteOptions options = {});

  // Continues a restored state's execution at state.CurrentNode().
  ExecutionHandle Resume(graph::WorkflowDefinitionPtr definition, state::State state, ExecuteOptions options = {});

  // false for unknown or already finished executions.
  bool Cancel(const std::string& execution_id, const std::string& reason = "cancelled");

  std::optional<ExecutionStatus> GetStatus(const std::string& execution_id) const;
  std::vector<ExecutionStatus>   ListExecutions() const;
  std::size_t                    ActiveExecutions() const;

  // Forgets finished executions older than max_age; returns how many.
  std::size_t PruneFinished(std::chrono::milliseconds max_age);

  void AddObserver(ExecutionObserverPtr observer);


 private:
  struct Execution;
  struct Strand;
  struct Incoming {
    std::string from;
    double      confidence = 0.0;
  };

  using ExecutionPtr = std::shared_ptr<Execution>;
  using StrandPtr    = std::shared_ptr<Strand>;

  ExecutionHandle Launch(graph::WorkflowDefinitionPtr definition, state::State initial, std::string start_node, ExecuteOptions options);

  void Step(StrandPtr strand, std::string node, state::State state, Incoming incoming);
  void Enter(StrandPtr strand, std::string node, state::State working, Incoming incoming);
  void RunNode(StrandPtr strand, std::string node, state::State working, Incoming incoming);
  void Completed(StrandPtr strand, std::string node, state::State result, std::chrono::milliseconds elapsed, Incoming incoming);
  void RouteFrom(StrandPtr strand, std::string node, state::State state);
  void Advance(StrandPtr strand, const std::string& from, state::State state, const std::string& to, double confidence,
               const std::string& reason);
  void Fork(StrandPtr strand, std::string node, state::State state, router::RoutingDecision decision);
  void Fail(StrandPtr strand, const std::string& node, state::State state, std::exception_ptr error);
  void Finish(ExecutionPtr exec, const async::Future<state::State>& outcome);
  void Complete(ExecutionPtr exec, graphflow::v1::ExecutionStatus status, const state::State& state, std::exception_ptr error);

  async::Future<EnterDirective> NotifyEnter(const ExecutionPtr& exec, const std::string& node, const state::State& state);
  template <typename Fn>
  void Notify(Fn&& fn);
  template <typename T, typename Fn>
  void When(const async::Future<T>& future, Fn fn);

  void Emit(const Execution& exec, graphflow::v1::WorkflowEventType type, const std::string& node, google::protobuf::Struct data = {});
  void Authorize(const Execution& exec, const std::string& node);

  std::vector<ExecutionObserverPtr> Observers() const;

  EngineDependencies deps_;
  EngineOptions      options_;

  mutable std::shared_mutex                      executions_mutex_;
  std::unordered_map<std::string, ExecutionPtr>  executions_;
  std::atomic<std::size_t>                       active_{0};

  mutable std::shared_mutex         observers_mutex_;
  std::vector<ExecutionObserverPtr> observers_;
};

} // namespace graphflow::engine
