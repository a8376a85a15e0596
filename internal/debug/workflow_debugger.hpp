#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/debug/debug_session.hpp"
#include "internal/debug/replay_controller.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/engine/execution_observer.hpp"

namespace graphflow::debug {

/*
  Execution observer owning the debug sessions.

  Sessions are keyed by execution id; an execution without a session is
  never held. A session can be opened before the execution starts (pass
  ExecuteOptions::execution_id) so the first node can already pause.
*/
class WorkflowDebugger final : public engine::ExecutionObserver {
 public:
  explicit WorkflowDebugger(std::shared_ptr<TraceRecorder> recorder, std::shared_ptr<db::Repository> repository = nullptr);

  // Throws util::AlreadyExists when the execution already has a session.
  std::shared_ptr<DebugSession> StartSession(const std::string& execution_id, DebugMode mode = DebugMode::kBreakpoint,
                                             std::string session_id = {});

  std::shared_ptr<DebugSession> Session(const std::string& session_id) const;
  std::shared_ptr<DebugSession> SessionForExecution(const std::string& execution_id) const;
  std::vector<std::string>      SessionIds() const;

  CommandResult Execute(const std::string& session_id, const DebugCommand& command);

  // Detaches the session (releasing a pause) and forgets it.
  bool EndSession(const std::string& session_id);

  // Replay over the recorded trace. Throws util::ReplayError.
  std::unique_ptr<ReplayController> CreateReplay(const std::string& execution_id);

  // Time travel: the latest recorded snapshot at or before sequence.
  std::optional<StateSnapshot> StateAt(const std::string& execution_id, uint64_t sequence);

  // ------------------------------------------------------------
  // Observer hooks
  // ------------------------------------------------------------
  async::Future<engine::EnterDirective> OnNodeEnter(const engine::ExecutionInfo& info, const std::string& node,
                                                    const state::State& state) override;
  void OnNodeExit(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                  std::chrono::milliseconds duration) override;
  void OnNodeError(const engine::ExecutionInfo& info, const std::string& node, const state::State& state, const std::string& error,
                   std::chrono::milliseconds duration) override;
  void OnEdge(const engine::ExecutionInfo& info, const std::string& from, const std::string& to, double confidence,
              const std::string& reason) override;
  void OnExecutionFinished(const engine::ExecutionInfo& info, graphflow::v1::ExecutionStatus status, const state::State& state,
                           const std::string& error) override;

 private:
  std::shared_ptr<TraceRecorder>   recorder_;
  std::shared_ptr<db::Repository>  repository_;

  mutable std::mutex                                             mutex_;
  std::unordered_map<std::string, std::shared_ptr<DebugSession>> sessions_;      // session id
  std::unordered_map<std::string, std::string>                   by_execution_;  // execution id -> session id
};

} // namespace graphflow::debug
