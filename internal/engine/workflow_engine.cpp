#include "workflow_engine.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/value.hpp"

namespace graphflow::engine {

using graphflow::v1::ExecutionStatus_Name;
using observability::IntField;
using observability::StringField;
namespace v1 = graphflow::v1;

namespace {

/*
  How a strand reports failure to whoever waits on it: the original
  error plus the node and state it happened at.
*/
class StrandFailure : public std::runtime_error {
 public:
  StrandFailure(std::exception_ptr cause, std::string node, state::State state, const std::string& message)
      : std::runtime_error(message), cause_(std::move(cause)), node_(std::move(node)), state_(std::move(state)) {
  }

  const std::exception_ptr& Cause() const {
    return cause_;
  }
  const std::string& Node() const {
    return node_;
  }
  const state::State& FailedState() const {
    return state_;
  }

 private:
  std::exception_ptr cause_;
  std::string        node_;
  state::State       state_;
};

std::string ErrorMessage(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

std::string ErrorTypeName(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const util::NodeTimeoutError&) {
    return "NodeTimeoutError";
  } catch (const util::NodeExecutionError&) {
    return "NodeExecutionError";
  } catch (const util::NoValidRouteError&) {
    return "NoValidRouteError";
  } catch (const util::QuotaExceeded&) {
    return "QuotaExceeded";
  } catch (const util::AccessDenied&) {
    return "AccessDenied";
  } catch (const util::ExecutionCancelled&) {
    return "ExecutionCancelled";
  } catch (const util::PersistenceError&) {
    return "PersistenceError";
  } catch (const util::ReplayError&) {
    return "ReplayError";
  } catch (const util::UnknownNodeError&) {
    return "UnknownNodeError";
  } catch (const std::exception&) {
    return "Error";
  } catch (...) {
    return "Unknown";
  }
}

template <typename E>
bool Is(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const E&) {
    return true;
  } catch (...) {
    return false;
  }
}

// Anything a node throws that is not already classified becomes a NodeExecutionError.
std::exception_ptr AsNodeError(const std::string& node, const std::exception_ptr& error) {
  if (Is<util::NodeExecutionError>(error) || Is<util::ExecutionCancelled>(error)) return error;
  return std::make_exception_ptr(util::NodeExecutionError(node, "node '" + node + "' failed: " + ErrorMessage(error)));
}

template <typename T>
async::Future<T> WithCancellation(const async::Future<T>& future, const async::CancellationToken& token) {
  async::Promise<T> promise;
  auto id = token.OnCancel([promise, token]() mutable { promise.SetError(util::ExecutionCancelled(token.Reason())); });
  future.OnComplete([promise, id, token](const async::Future<T>& done) mutable {
    token.Unregister(id);
    async::detail::Forward(done, promise);
  });
  return promise.GetFuture();
}

google::protobuf::Struct Data(std::initializer_list<std::pair<const char*, google::protobuf::Value>> fields) {
  google::protobuf::Struct data;
  for (const auto& [key, value] : fields) (*data.mutable_fields())[key] = value;
  return data;
}

v1::WorkflowEventType FinishEvent(v1::ExecutionStatus status) {
  switch (status) {
    case v1::EXECUTION_STATUS_COMPLETED:
      return v1::WORKFLOW_COMPLETED;
    case v1::EXECUTION_STATUS_CANCELLED:
      return v1::WORKFLOW_CANCELLED;
    default:
      return v1::WORKFLOW_FAILED;
  }
}

} // namespace

EngineOptions EngineOptions::FromConfig(const graphflow::runtime::config::EngineConfig& cfg) {
  EngineOptions options;
  if (cfg.has_node_timeout()) options.node_timeout = util::ToMillis(cfg.node_timeout(), options.node_timeout);
  if (cfg.has_checkpoint_every_node()) options.checkpoint_every_node = cfg.checkpoint_every_node();
  options.backtrack_on_failure  = cfg.backtrack_on_failure();
  return options;
}

// ------------------------------------------------------------
// Execution bookkeeping
// ------------------------------------------------------------

struct WorkflowEngine::Execution {
  graph::WorkflowDefinitionPtr definition;
  ExecutionInfo                info;
  std::chrono::milliseconds    node_timeout{0};
  async::Promise<state::State> promise;

  mutable std::mutex mutex;
  ExecutionStatus    status;
  bool               finished = false;

  void Running(const std::string& node, const state::State& s) {
    std::lock_guard lock(mutex);
    status.status       = v1::EXECUTION_STATUS_RUNNING;
    status.current_node = node;
    status.version      = std::max(status.version, s.Version());
    if (s.BranchId().empty()) status.path = s.Path();
  }

  bool Finished() const {
    std::lock_guard lock(mutex);
    return finished;
  }
};

struct WorkflowEngine::Strand {
  ExecutionPtr                 exec;
  // Branches stop (without running it) at their join node.
  std::string                  stop_at;
  bool                         main = true;
  async::Promise<state::State> promise;
};

WorkflowEngine::WorkflowEngine(EngineDependencies deps, EngineOptions options) : deps_(std::move(deps)), options_(std::move(options)) {
  if (!deps_.executor) throw util::InvalidArgument("workflow engine requires an executor");
  if (!deps_.store) throw util::InvalidArgument("workflow engine requires a state store");
  if (!deps_.router) throw util::InvalidArgument("workflow engine requires a router");
  if (!deps_.gate) deps_.gate = std::make_shared<AllowAllGate>();
}

WorkflowEngine::~WorkflowEngine() {
  std::shared_lock lock(executions_mutex_);
  for (auto& [_, exec] : executions_) {
    if (!exec->Finished()) exec->info.cancellation.Cancel("engine shutting down");
  }
}

void WorkflowEngine::AddObserver(ExecutionObserverPtr observer) {
  if (!observer) return;
  std::unique_lock lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

std::vector<ExecutionObserverPtr> WorkflowEngine::Observers() const {
  std::shared_lock lock(observers_mutex_);
  return observers_;
}

template <typename Fn>
void WorkflowEngine::Notify(Fn&& fn) {
  for (const auto& observer : Observers()) {
    try {
      fn(*observer);
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("execution observer failed", {StringField("error", e.what())});
    }
  }
}

/*
  Continuations of engine futures always run on the executor. If the
  executor refuses the task (stopped pool) the continuation runs inline
  so the execution still reaches a terminal state.
*/
template <typename T, typename Fn>
void WorkflowEngine::When(const async::Future<T>& future, Fn fn) {
  async::Executor* executor = deps_.executor;
  future.OnComplete([executor, fn](const async::Future<T>& done) mutable {
    try {
      executor->Post([fn, done]() mutable { fn(done); });
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("executor rejected continuation; running inline", {StringField("error", e.what())});
      fn(done);
    }
  });
}

void WorkflowEngine::Emit(const Execution& exec, v1::WorkflowEventType type, const std::string& node, google::protobuf::Struct data) {
  if (!deps_.events) return;
  try {
    deps_.events->Publish(MakeEvent(type, exec.info.workflow_id, exec.info.execution_id, node, std::move(data)));
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_WARN("event sink failed", {StringField("type", v1::WorkflowEventType_Name(type)), StringField("error", e.what())});
  }
}

void WorkflowEngine::Authorize(const Execution& exec, const std::string& node) {
  auto decision = deps_.gate->Authorize(exec.info.tenant_id, "node:" + node);
  if (decision.allowed) return;

  GRAPHFLOW_LOG_WARN("node step denied", {StringField("execution_id", exec.info.execution_id), StringField("node", node),
                                          StringField("tenant", exec.info.tenant_id), StringField("reason", decision.reason)});
  if (decision.denial == DenialKind::kAccessDenied) throw util::AccessDenied(decision.reason);
  throw util::QuotaExceeded(decision.reason);
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

ExecutionHandle WorkflowEngine::Execute(graph::WorkflowDefinitionPtr definition, const google::protobuf::Struct& initial_data,
                                        ExecuteOptions options) {
  if (!definition) throw util::InvalidArgument("workflow definition must not be null");
  if (options.execution_id.empty()) options.execution_id = util::NewId("exec");

  auto initial = state::State::Create(definition->Id(), options.execution_id, options.tenant_id, initial_data);
  auto entry   = definition->EntryNode();
  return Launch(std::move(definition), std::move(initial), std::move(entry), std::move(options));
}

ExecutionHandle WorkflowEngine::Resume(graph::WorkflowDefinitionPtr definition, state::State state, ExecuteOptions options) {
  if (!definition) throw util::InvalidArgument("workflow definition must not be null");
  if (state.WorkflowId() != definition->Id()) {
    throw util::InvalidArgument("state belongs to workflow '" + state.WorkflowId() + "', not '" + definition->Id() + "'");
  }

  auto start = state.CurrentNode().empty() ? definition->EntryNode() : state.CurrentNode();
  if (start == graph::kEndNode) throw util::InvalidState("execution '" + state.ExecutionId() + "' already reached the end");
  if (!definition->HasNode(start)) throw util::UnknownNodeError("cannot resume at unknown node '" + start + "'");

  options.execution_id = state.ExecutionId();
  options.tenant_id    = state.TenantId();
  state.EraseMetadata("status");
  state.EraseMetadata("error");
  state.EraseMetadata("error_type");
  state.EraseMetadata("failed_node");
  return Launch(std::move(definition), std::move(state), std::move(start), std::move(options));
}

ExecutionHandle WorkflowEngine::Launch(graph::WorkflowDefinitionPtr definition, state::State initial, std::string start_node,
                                       ExecuteOptions options) {
  auto exec                = std::make_shared<Execution>();
  exec->definition         = std::move(definition);
  exec->info.workflow_id   = initial.WorkflowId();
  exec->info.execution_id  = initial.ExecutionId();
  exec->info.tenant_id     = initial.TenantId();
  exec->node_timeout       = options.node_timeout.value_or(options_.node_timeout);
  exec->status.execution_id = exec->info.execution_id;
  exec->status.workflow_id  = exec->info.workflow_id;
  exec->status.tenant_id    = exec->info.tenant_id;
  exec->status.version      = initial.Version();
  exec->status.path         = initial.Path();
  exec->status.started_at   = util::Now();

  {
    std::unique_lock lock(executions_mutex_);
    auto             it = executions_.find(exec->info.execution_id);
    if (it != executions_.end() && !it->second->Finished()) {
      throw util::AlreadyExists("execution '" + exec->info.execution_id + "' is already running");
    }
    executions_[exec->info.execution_id] = exec;
  }

  ++active_;
  observability::Metrics::Instance().AddActiveExecutions(1);
  GRAPHFLOW_LOG_INFO("execution started", {StringField("workflow_id", exec->info.workflow_id),
                                           StringField("execution_id", exec->info.execution_id),
                                           StringField("tenant", exec->info.tenant_id), StringField("start", start_node)});

  Emit(*exec, v1::WORKFLOW_STARTED, start_node, Data({{"tenant_id", util::StringValue(exec->info.tenant_id)}}));
  Notify([&](ExecutionObserver& o) { o.OnExecutionStarted(exec->info, initial); });

  auto main  = std::make_shared<Strand>();
  main->exec = exec;
  When(main->promise.GetFuture(), [this, exec](const async::Future<state::State>& done) { Finish(exec, done); });

  When(deps_.store->SaveStateAsync(initial), [this, main, start_node, initial](const async::Future<state::State>& done) mutable {
    if (auto error = done.Error()) {
      Fail(main, start_node, std::move(initial), error);
      return;
    }
    Step(main, start_node, done.Get(), Incoming{});
  });

  return ExecutionHandle{exec->info.execution_id, exec->promise.GetFuture()};
}

bool WorkflowEngine::Cancel(const std::string& execution_id, const std::string& reason) {
  ExecutionPtr exec;
  {
    std::shared_lock lock(executions_mutex_);
    auto             it = executions_.find(execution_id);
    if (it != executions_.end()) exec = it->second;
  }
  if (!exec || exec->Finished()) return false;

  GRAPHFLOW_LOG_INFO("cancelling execution", {StringField("execution_id", execution_id), StringField("reason", reason)});
  exec->info.cancellation.Cancel(reason);
  return true;
}

std::optional<ExecutionStatus> WorkflowEngine::GetStatus(const std::string& execution_id) const {
  ExecutionPtr exec;
  {
    std::shared_lock lock(executions_mutex_);
    auto             it = executions_.find(execution_id);
    if (it == executions_.end()) return std::nullopt;
    exec = it->second;
  }
  std::lock_guard lock(exec->mutex);
  return exec->status;
}

std::vector<ExecutionStatus> WorkflowEngine::ListExecutions() const {
  std::vector<ExecutionStatus> out;
  std::shared_lock             lock(executions_mutex_);
  out.reserve(executions_.size());
  for (const auto& [_, exec] : executions_) {
    std::lock_guard exec_lock(exec->mutex);
    out.push_back(exec->status);
  }
  return out;
}

std::size_t WorkflowEngine::ActiveExecutions() const {
  return active_.load();
}

std::size_t WorkflowEngine::PruneFinished(std::chrono::milliseconds max_age) {
  const auto       cutoff = util::Now() - max_age;
  std::size_t      pruned = 0;
  std::unique_lock lock(executions_mutex_);
  for (auto it = executions_.begin(); it != executions_.end();) {
    bool expired = false;
    {
      std::lock_guard exec_lock(it->second->mutex);
      expired = it->second->finished && it->second->status.finished_at && *it->second->status.finished_at < cutoff;
    }
    if (expired) {
      it = executions_.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }
  return pruned;
}

// ------------------------------------------------------------
// Step pipeline
// ------------------------------------------------------------

void WorkflowEngine::Step(StrandPtr strand, std::string node, state::State state, Incoming incoming) {
  auto& exec = *strand->exec;

  if (node == graph::kEndNode || (!strand->stop_at.empty() && node == strand->stop_at)) {
    strand->promise.SetValue(std::move(state));
    return;
  }

  try {
    if (exec.info.cancellation.IsCancelled()) throw util::ExecutionCancelled(exec.info.cancellation.Reason());
    if (!exec.definition->HasNode(node)) throw util::UnknownNodeError("workflow '" + exec.info.workflow_id + "' has no node '" + node + "'");
    Authorize(exec, node);
  } catch (const std::exception&) {
    Fail(strand, node, std::move(state), std::current_exception());
    return;
  }

  auto working = state.Derive();
  working.SetCurrentNode(node);
  exec.Running(node, working);
  Enter(std::move(strand), std::move(node), std::move(working), std::move(incoming));
}

async::Future<EnterDirective> WorkflowEngine::NotifyEnter(const ExecutionPtr& exec, const std::string& node, const state::State& state) {
  async::Executor* executor = deps_.executor;
  auto             info     = exec->info;
  auto             chain    = async::MakeReady(EnterDirective{});

  for (const auto& observer : Observers()) {
    chain = chain.Then(*executor, [observer, info, node, state, executor](EnterDirective prev) -> async::Future<EnterDirective> {
      if (prev.action != EnterDirective::Action::kProceed) return async::MakeReady(std::move(prev));

      const auto&                   input = prev.state ? *prev.state : state;
      async::Future<EnterDirective> next;
      try {
        next = observer->OnNodeEnter(info, node, input);
      } catch (const std::exception& e) {
        GRAPHFLOW_LOG_WARN("execution observer failed", {StringField("node", node), StringField("error", e.what())});
        return async::MakeReady(std::move(prev));
      }
      return next.Then(*executor, [prev](EnterDirective directive) {
        if (!directive.state) directive.state = prev.state;
        return directive;
      });
    });
  }
  return chain;
}

void WorkflowEngine::Enter(StrandPtr strand, std::string node, state::State working, Incoming incoming) {
  if (Observers().empty()) {
    RunNode(std::move(strand), std::move(node), std::move(working), std::move(incoming));
    return;
  }

  auto directive = WithCancellation(NotifyEnter(strand->exec, node, working), strand->exec->info.cancellation);
  When(directive, [this, strand, node, working, incoming](const async::Future<EnterDirective>& done) mutable {
    EnterDirective d;
    if (auto error = done.Error()) {
      if (Is<util::ExecutionCancelled>(error)) {
        Fail(strand, node, std::move(working), error);
        return;
      }
      GRAPHFLOW_LOG_WARN("node enter hook failed; proceeding", {StringField("node", node), StringField("error", ErrorMessage(error))});
    } else {
      d = done.Get();
    }

    if (d.state) {
      working = *d.state;
      working.SetCurrentNode(node);
      working.MarkDirty();
    }

    switch (d.action) {
      case EnterDirective::Action::kTerminate: {
        const std::string reason = "terminated by debugger";
        strand->exec->info.cancellation.Cancel(reason);
        Fail(strand, node, std::move(working), std::make_exception_ptr(util::ExecutionCancelled(reason)));
        return;
      }
      case EnterDirective::Action::kJump:
        GRAPHFLOW_LOG_INFO("jumping to node", {StringField("execution_id", strand->exec->info.execution_id), StringField("from", node),
                                               StringField("to", d.jump_to)});
        working.AddTransition(node, d.jump_to, "jump");
        Step(strand, d.jump_to, std::move(working), Incoming{});
        return;
      case EnterDirective::Action::kProceed:
        break;
    }
    RunNode(strand, node, std::move(working), incoming);
  });
}

void WorkflowEngine::RunNode(StrandPtr strand, std::string node, state::State working, Incoming incoming) {
  auto& exec = *strand->exec;
  Emit(exec, v1::NODE_STARTED, node, Data({{"version", util::NumberValue(static_cast<double>(working.Version()))}}));

  graph::NodeContext ctx;
  ctx.workflow_id  = exec.info.workflow_id;
  ctx.execution_id = exec.info.execution_id;
  ctx.node_id      = node;
  ctx.tenant_id    = exec.info.tenant_id;
  ctx.executor     = deps_.executor;
  ctx.cancellation = exec.info.cancellation;

  const auto started = std::chrono::steady_clock::now();

  // ends when the completion callback releases it
  auto span = std::make_shared<observability::SpanScope>("graphflow.node");
  span->SetAttribute("graphflow.execution_id", exec.info.execution_id);
  span->SetAttribute("graphflow.node_id", node);
  span->SetAttribute("graphflow.state_version", static_cast<std::int64_t>(working.Version()));

  async::Future<state::State> out;
  try {
    // lines logged by the node body carry the execution it belongs to
    observability::ScopedLogFields log_scope({StringField("execution_id", exec.info.execution_id), StringField("node", node)});
    out = exec.definition->Node(node)(working, ctx);
  } catch (const std::exception&) {
    out = async::MakeFailed<state::State>(std::current_exception());
  }
  if (!out.Valid()) {
    out = async::MakeFailed<state::State>(std::make_exception_ptr(util::NodeExecutionError(node, "node '" + node + "' returned no result")));
  }
  // the node may complete on another worker
  span->Detach();

  if (deps_.timer && exec.node_timeout.count() > 0) {
    auto timeout = exec.node_timeout;
    out          = async::WithTimeout(out, timeout, *deps_.timer, [node, timeout]() {
      return std::make_exception_ptr(
          util::NodeTimeoutError(node, "node '" + node + "' exceeded its timeout of " + std::to_string(timeout.count()) + "ms"));
    });
  }
  out = WithCancellation(out, exec.info.cancellation);

  When(out, [this, strand, node, working, incoming, started, span](const async::Future<state::State>& done) mutable {
    auto  elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    auto& metrics = observability::Metrics::Instance();
    metrics.ObserveNodeLatencyMs(node, static_cast<double>(elapsed.count()));
    span->SetAttribute("graphflow.elapsed_ms", static_cast<std::int64_t>(elapsed.count()));

    if (auto error = done.Error()) {
      error              = AsNodeError(node, error);
      const auto message = ErrorMessage(error);
      metrics.RecordNodeExecution(node, false);
      span->RecordException(message);
      if (!incoming.from.empty() && !Is<util::ExecutionCancelled>(error)) {
        deps_.router->RecordOutcome(incoming.from, node, false, incoming.confidence);
      }

      GRAPHFLOW_LOG_WARN("node failed", {StringField("execution_id", strand->exec->info.execution_id), StringField("node", node),
                                         StringField("error", message), IntField("elapsed_ms", elapsed.count())});
      Notify([&](ExecutionObserver& o) { o.OnNodeError(strand->exec->info, node, working, message, elapsed); });
      Emit(*strand->exec, v1::NODE_FAILED, node,
           Data({{"error", util::StringValue(message)}, {"error_type", util::StringValue(ErrorTypeName(error))},
                 {"duration_ms", util::NumberValue(static_cast<double>(elapsed.count()))}}));
      Fail(strand, node, std::move(working), error);
      return;
    }

    metrics.RecordNodeExecution(node, true);
    Completed(strand, node, done.Get(), elapsed, incoming);
  });
}

void WorkflowEngine::Completed(StrandPtr strand, std::string node, state::State result, std::chrono::milliseconds elapsed, Incoming incoming) {
  auto& exec = *strand->exec;

  result.SetCurrentNode(node);
  result.AppendPath(node);
  if (!incoming.from.empty()) deps_.router->RecordOutcome(incoming.from, node, true, incoming.confidence);

  GRAPHFLOW_LOG_DEBUG("node completed", {StringField("execution_id", exec.info.execution_id), StringField("node", node),
                                         IntField("version", static_cast<int64_t>(result.Version())), IntField("elapsed_ms", elapsed.count())});
  Notify([&](ExecutionObserver& o) {
    o.OnNodeExit(exec.info, node, result, elapsed);
    o.OnStateChange(exec.info, node, result);
  });
  Emit(exec, v1::NODE_COMPLETED, node, Data({{"duration_ms", util::NumberValue(static_cast<double>(elapsed.count()))}}));
  Emit(exec, v1::STATE_UPDATED, node, Data({{"version", util::NumberValue(static_cast<double>(result.Version()))}}));
  exec.Running(node, result);

  if (!options_.checkpoint_every_node) {
    When(deps_.store->SaveStateAsync(result), [this, strand, node, result](const async::Future<state::State>& done) mutable {
      if (auto error = done.Error()) {
        Fail(strand, node, std::move(result), error);
        return;
      }
      RouteFrom(strand, node, done.Get());
    });
    return;
  }

  auto checkpoint = deps_.store->CreateCheckpointAsync(result, node, v1::CHECKPOINT_TYPE_AUTO);
  When(checkpoint, [this, strand, node, result](const async::Future<v1::Checkpoint>& done) mutable {
    if (auto error = done.Error()) {
      Fail(strand, node, std::move(result), error);
      return;
    }
    result.MarkClean();
    auto cp = done.Get();
    Emit(*strand->exec, v1::CHECKPOINT_SAVED, node,
         Data({{"checkpoint_id", util::StringValue(cp.id())}, {"type", util::StringValue(v1::CheckpointType_Name(cp.type()))}}));
    RouteFrom(strand, node, std::move(result));
  });
}

void WorkflowEngine::RouteFrom(StrandPtr strand, std::string node, state::State state) {
  const auto& edges = strand->exec->definition->Edges(node);
  // A node without outgoing edges ends its strand like an edge to "end".
  if (edges.empty()) {
    strand->promise.SetValue(std::move(state));
    return;
  }

  When(deps_.router->Route(node, edges, state), [this, strand, node, state](const async::Future<router::RoutingDecision>& done) mutable {
    if (auto error = done.Error()) {
      Fail(strand, node, std::move(state), error);
      return;
    }

    auto decision = done.Get();
    if (decision.requires_backtrack_point && strand->main) deps_.router->SaveBacktrackPoint(state, node, decision);

    if (!decision.parallel_nodes.empty()) {
      Fork(strand, node, std::move(state), std::move(decision));
      return;
    }
    Advance(strand, node, std::move(state), decision.next_node, decision.confidence, decision.explanation);
  });
}

void WorkflowEngine::Advance(StrandPtr strand, const std::string& from, state::State state, const std::string& to, double confidence,
                             const std::string& reason) {
  auto& exec = *strand->exec;
  state.AddTransition(from, to, reason);

  Notify([&](ExecutionObserver& o) { o.OnEdge(exec.info, from, to, confidence, reason); });
  Emit(exec, v1::EDGE_TRAVERSED, from,
       Data({{"from", util::StringValue(from)}, {"to", util::StringValue(to)}, {"confidence", util::NumberValue(confidence)},
             {"reason", util::StringValue(reason)}}));
  if (to == graph::kEndNode) deps_.router->RecordOutcome(from, to, true, confidence);

  Step(std::move(strand), to, std::move(state), Incoming{from, confidence});
}

/*
  Parallel fan-out. A BRANCH checkpoint of the fork state is written
  first; every branch then runs on its own forked state until "end" or
  the join node (the router's non-parallel winner, if any). Branch
  states are merged in branch order once all of them finished.
*/
void WorkflowEngine::Fork(StrandPtr strand, std::string node, state::State state, router::RoutingDecision decision) {
  auto checkpoint = deps_.store->CreateCheckpointAsync(state, node, v1::CHECKPOINT_TYPE_BRANCH, "before parallel fan-out");
  When(checkpoint, [this, strand, node, state, decision](const async::Future<v1::Checkpoint>& done) mutable {
    auto& exec = *strand->exec;
    if (auto error = done.Error()) {
      Fail(strand, node, std::move(state), error);
      return;
    }
    state.MarkClean();
    Emit(exec, v1::CHECKPOINT_SAVED, node,
         Data({{"checkpoint_id", util::StringValue(done.Get().id())}, {"type", util::StringValue("CHECKPOINT_TYPE_BRANCH")}}));

    const auto&                               join    = decision.next_node;
    const auto                                stop_at = join.empty() ? strand->stop_at : join;
    std::vector<async::Future<state::State>> branches;
    std::vector<std::string>                  branch_ids;

    for (const auto& target : decision.parallel_nodes) {
      auto branch_id    = (state.BranchId().empty() ? std::string() : state.BranchId() + ".") + node + "-" + target;
      auto branch_state = state.Fork(branch_id);
      branch_state.AddTransition(node, target, "parallel branch");

      auto child     = std::make_shared<Strand>();
      child->exec    = strand->exec;
      child->stop_at = stop_at;
      child->main    = false;
      branches.push_back(child->promise.GetFuture());
      branch_ids.push_back(branch_id);

      Notify([&](ExecutionObserver& o) { o.OnEdge(exec.info, node, target, 1.0, "parallel branch"); });
      Emit(exec, v1::PARALLEL_BRANCH_STARTED, target,
           Data({{"from", util::StringValue(node)}, {"branch_id", util::StringValue(branch_id)}}));

      auto run = [this, child, target, branch_state, node]() mutable { Step(child, target, std::move(branch_state), Incoming{node, 1.0}); };
      try {
        deps_.executor->Post(run);
      } catch (const std::exception& e) {
        GRAPHFLOW_LOG_WARN("executor rejected branch; running inline", {StringField("branch_id", branch_id), StringField("error", e.what())});
        run();
      }
    }

    When(async::WhenAll(branches), [this, strand, node, state, decision, branch_ids](
                                       const async::Future<std::vector<async::Future<state::State>>>& all) mutable {
      auto&              exec    = *strand->exec;
      auto               results = all.Get();
      state::State       merged  = state;
      std::exception_ptr failure;

      for (std::size_t i = 0; i < results.size(); ++i) {
        if (auto error = results[i].Error()) {
          if (!failure) failure = error;
          continue;
        }
        auto branch = results[i].Get();
        merged.Merge(branch, state);
        Emit(exec, v1::PARALLEL_BRANCH_COMPLETED, decision.parallel_nodes[i],
             Data({{"branch_id", util::StringValue(branch_ids[i])},
                   {"version", util::NumberValue(static_cast<double>(branch.Version()))}}));
      }

      if (failure) {
        try {
          std::rethrow_exception(failure);
        } catch (const StrandFailure& f) {
          merged.Merge(f.FailedState(), state);
          merged.SetCurrentNode(f.Node());
          Fail(strand, f.Node(), std::move(merged), f.Cause());
        }
        return;
      }

      merged.SetCurrentNode(node);
      if (decision.next_node.empty()) {
        strand->promise.SetValue(std::move(merged));
        return;
      }
      Advance(strand, node, std::move(merged), decision.next_node, decision.confidence, decision.explanation);
    });
  });
}

// ------------------------------------------------------------
// Failure / completion
// ------------------------------------------------------------

void WorkflowEngine::Fail(StrandPtr strand, const std::string& node, state::State state, std::exception_ptr error) {
  auto& exec = *strand->exec;

  if (strand->main && options_.backtrack_on_failure && Is<util::NodeExecutionError>(error) && !exec.info.cancellation.IsCancelled()) {
    auto result = deps_.router->Backtrack(exec.info.execution_id, node);
    if (result.success && result.state) {
      Emit(exec, v1::BACKTRACK_INITIATED, node,
           Data({{"from", util::StringValue(result.from_node)}, {"to", util::StringValue(result.next_node)},
                 {"failed_node", util::StringValue(node)}, {"error", util::StringValue(ErrorMessage(error))}}));
      auto resumed = std::move(*result.state);
      resumed.SetMetadata("backtracked_from", node);
      resumed.AddTransition(result.from_node, result.next_node, result.message);
      Step(strand, result.next_node, std::move(resumed), Incoming{result.from_node, 0.0});
      return;
    }
  }

  strand->promise.SetException(std::make_exception_ptr(StrandFailure(error, node, std::move(state), ErrorMessage(error))));
}

void WorkflowEngine::Finish(ExecutionPtr exec, const async::Future<state::State>& outcome) {
  auto error = outcome.Error();
  if (!error) {
    auto final_state = outcome.Get();
    final_state.SetMetadata("status", "completed");
    When(deps_.store->SaveStateAsync(final_state), [this, exec, final_state](const async::Future<state::State>& done) {
      if (auto save_error = done.Error()) {
        GRAPHFLOW_LOG_ERROR("failed to persist final state",
                            {StringField("execution_id", exec->info.execution_id), StringField("error", ErrorMessage(save_error))});
        Complete(exec, v1::EXECUTION_STATUS_FAILED, final_state, save_error);
        return;
      }
      Complete(exec, v1::EXECUTION_STATUS_COMPLETED, done.Get(), nullptr);
    });
    return;
  }

  std::exception_ptr cause;
  std::string        node;
  state::State       failed;
  try {
    std::rethrow_exception(error);
  } catch (const StrandFailure& f) {
    cause  = f.Cause();
    node   = f.Node();
    failed = f.FailedState();
  }

  if (Is<util::ExecutionCancelled>(cause)) {
    Complete(exec, v1::EXECUTION_STATUS_CANCELLED, failed, cause);
    return;
  }

  // A clean state is already stored under its version; the error record gets the next one.
  if (!failed.IsDirty()) failed = failed.Derive();

  const auto message = ErrorMessage(cause);
  failed.SetMetadata("error", message);
  failed.SetMetadata("error_type", ErrorTypeName(cause));
  failed.SetMetadata("failed_node", node);
  failed.SetMetadata("status", "failed");

  auto checkpoint = deps_.store->CreateCheckpointAsync(failed, node, v1::CHECKPOINT_TYPE_ERROR, message);
  When(checkpoint, [this, exec, failed, node, cause](const async::Future<v1::Checkpoint>& done) {
    if (auto cp_error = done.Error()) {
      GRAPHFLOW_LOG_ERROR("failed to persist error checkpoint", {StringField("execution_id", exec->info.execution_id),
                                                                 StringField("node", node), StringField("error", ErrorMessage(cp_error))});
    } else {
      Emit(*exec, v1::CHECKPOINT_SAVED, node,
           Data({{"checkpoint_id", util::StringValue(done.Get().id())}, {"type", util::StringValue("CHECKPOINT_TYPE_ERROR")}}));
    }
    Complete(exec, v1::EXECUTION_STATUS_FAILED, failed, cause);
  });
}

void WorkflowEngine::Complete(ExecutionPtr exec, v1::ExecutionStatus status, const state::State& state, std::exception_ptr error) {
  const auto  message = error ? ErrorMessage(error) : std::string();
  std::string last_node;
  {
    std::lock_guard lock(exec->mutex);
    exec->status.status      = status;
    exec->status.version     = std::max(exec->status.version, state.Version());
    exec->status.finished_at = util::Now();
    if (!state.CurrentNode().empty()) exec->status.current_node = state.CurrentNode();
    if (state.BranchId().empty()) exec->status.path = state.Path();
    if (error) {
      exec->status.error       = message;
      exec->status.error_type  = ErrorTypeName(error);
      exec->status.failed_node = state.Metadata("failed_node").value_or(exec->status.current_node);
    }
    exec->finished = true;
    last_node      = exec->status.current_node;
  }

  Emit(*exec, FinishEvent(status), last_node, Data({{"status", util::StringValue(ExecutionStatus_Name(status))}}));
  Notify([&](ExecutionObserver& o) { o.OnExecutionFinished(exec->info, status, state, message); });
  deps_.router->ClearExecution(exec->info.execution_id);

  --active_;
  auto& metrics = observability::Metrics::Instance();
  metrics.AddActiveExecutions(-1);
  metrics.RecordExecutionFinished(exec->info.workflow_id, ExecutionStatus_Name(status));

  if (error) {
    GRAPHFLOW_LOG_WARN("execution finished", {StringField("execution_id", exec->info.execution_id),
                                              StringField("status", ExecutionStatus_Name(status)), StringField("error", message)});
    exec->promise.SetException(error);
  } else {
    GRAPHFLOW_LOG_INFO("execution finished", {StringField("execution_id", exec->info.execution_id),
                                              StringField("status", ExecutionStatus_Name(status)),
                                              IntField("version", static_cast<int64_t>(state.Version())),
                                              IntField("steps", static_cast<int64_t>(state.PathLength()))});
    exec->promise.SetValue(state);
  }
}

} // namespace graphflow::engine
