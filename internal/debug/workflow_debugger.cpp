#include "workflow_debugger.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace graphflow::debug {

using observability::StringField;

WorkflowDebugger::WorkflowDebugger(std::shared_ptr<TraceRecorder> recorder, std::shared_ptr<db::Repository> repository)
    : recorder_(std::move(recorder)), repository_(std::move(repository)) {
}

std::shared_ptr<DebugSession> WorkflowDebugger::StartSession(const std::string& execution_id, DebugMode mode, std::string session_id) {
  if (execution_id.empty()) throw util::InvalidArgument("debug session requires an execution id");
  if (session_id.empty()) session_id = util::NewId("dbg");

  std::lock_guard lock(mutex_);
  if (by_execution_.count(execution_id)) throw util::AlreadyExists("execution already has a debug session: " + execution_id);
  if (sessions_.count(session_id)) throw util::AlreadyExists("debug session exists: " + session_id);

  auto session = std::make_shared<DebugSession>(session_id, execution_id, mode, recorder_, repository_);
  sessions_[session_id]       = session;
  by_execution_[execution_id] = session_id;

  GRAPHFLOW_LOG_INFO("debug session started", {StringField("session_id", session_id), StringField("execution_id", execution_id),
                                               StringField("mode", std::string(DebugModeName(mode)))});
  return session;
}

std::shared_ptr<DebugSession> WorkflowDebugger::Session(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = sessions_.find(session_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<DebugSession> WorkflowDebugger::SessionForExecution(const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto it = by_execution_.find(execution_id);
  if (it == by_execution_.end()) return nullptr;
  auto s = sessions_.find(it->second);
  return s == sessions_.end() ? nullptr : s->second;
}

std::vector<std::string> WorkflowDebugger::SessionIds() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  out.reserve(sessions_.size());
  for (const auto& [id, _] : sessions_) out.push_back(id);
  return out;
}

CommandResult WorkflowDebugger::Execute(const std::string& session_id, const DebugCommand& command) {
  auto session = Session(session_id);
  if (!session) return CommandResult{false, "unknown debug session: " + session_id, {}};
  return session->Execute(command);
}

bool WorkflowDebugger::EndSession(const std::string& session_id) {
  std::shared_ptr<DebugSession> session;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    session = it->second;
    by_execution_.erase(session->ExecutionId());
    sessions_.erase(it);
  }
  session->Detach();
  GRAPHFLOW_LOG_INFO("debug session ended", {StringField("session_id", session_id), StringField("state", SessionStateName(session->State()))});
  return true;
}

std::unique_ptr<ReplayController> WorkflowDebugger::CreateReplay(const std::string& execution_id) {
  if (!recorder_) throw util::ReplayError("no trace recorder configured");
  return std::make_unique<ReplayController>(recorder_->LoadTrace(execution_id));
}

std::optional<StateSnapshot> WorkflowDebugger::StateAt(const std::string& execution_id, uint64_t sequence) {
  if (!recorder_) throw util::ReplayError("no trace recorder configured");
  auto trace = recorder_->LoadTrace(execution_id);

  std::optional<StateSnapshot> best;
  for (const auto& snapshot : trace.snapshots) {
    if (snapshot.sequence > sequence) continue;
    if (!best || snapshot.sequence > best->sequence) best = snapshot;
  }
  return best;
}

// ------------------------------------------------------------
// Hooks
// ------------------------------------------------------------

async::Future<engine::EnterDirective> WorkflowDebugger::OnNodeEnter(const engine::ExecutionInfo& info, const std::string& node,
                                                                    const state::State& state) {
  auto session = SessionForExecution(info.execution_id);
  if (!session) return async::MakeReady(engine::EnterDirective{});
  return session->BeforeNode(node, state);
}

void WorkflowDebugger::OnNodeExit(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                                  std::chrono::milliseconds duration) {
  if (auto session = SessionForExecution(info.execution_id)) session->AfterNode(node, state, duration);
}

void WorkflowDebugger::OnNodeError(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                                   const std::string& error, std::chrono::milliseconds) {
  if (auto session = SessionForExecution(info.execution_id)) session->OnError(node, state, error);
}

void WorkflowDebugger::OnEdge(const engine::ExecutionInfo& info, const std::string& from, const std::string& to, double,
                              const std::string&) {
  if (auto session = SessionForExecution(info.execution_id)) session->OnEdge(from, to);
}

void WorkflowDebugger::OnExecutionFinished(const engine::ExecutionInfo& info, graphflow::v1::ExecutionStatus status, const state::State&,
                                           const std::string&) {
  if (auto session = SessionForExecution(info.execution_id)) session->OnFinished(status);
}

} // namespace graphflow::debug
