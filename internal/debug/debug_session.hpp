#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/async/future.hpp"
#include "internal/debug/breakpoint_manager.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/engine/execution_observer.hpp"

namespace graphflow::debug {

enum class DebugMode {
  kStepByStep,
  kBreakpoint,
  kWatch,
  kReplay,
  kTimeTravel,
};

enum class SessionState {
  kInitialized,
  kRunning,
  kPaused,
  kStepping,
  kFinished,
  kError,
};

enum class CommandType {
  kContinue,
  kStepOver,
  kStepInto,
  kStepOut,
  kPause,
  kSetBreakpoint,
  kRemoveBreakpoint,
  kInspectVariable,
  kModifyVariable,
  kJumpToNode,
  kRestart,
  kTerminate,
};

std::string_view DebugModeName(DebugMode mode);
std::string_view SessionStateName(SessionState state);
std::string_view CommandName(CommandType type);

struct DebugCommand {
  CommandType              type = CommandType::kContinue;
  google::protobuf::Struct params;

  static DebugCommand Simple(CommandType type);
  static DebugCommand SetBreakpoint(const graphflow::v1::Breakpoint& breakpoint);
  static DebugCommand RemoveBreakpoint(const std::string& breakpoint_id);
  static DebugCommand InspectVariable(const std::string& name);
  static DebugCommand ModifyVariable(const std::string& name, google::protobuf::Value value);
  static DebugCommand JumpToNode(const std::string& node_id);
};

struct CommandResult {
  bool                     success = false;
  std::string              message;
  google::protobuf::Struct data;
};

struct PauseInfo {
  std::string                                    node_id;
  std::string                                    reason;
  std::vector<std::string>                       breakpoint_ids;
  state::State                                   state;
  std::map<std::string, google::protobuf::Value> watches;
  util::TimePoint                                paused_at;
};

/*
  Debug session bound to one execution.

  BeforeNode is called by the debugger before every node of the
  execution. When a breakpoint hits, a step completes or a pause was
  requested, the session moves to PAUSED and hands the engine a pending
  future; the execution continues once a command resolves it. No thread
  blocks while paused.

  STEP_INTO pauses at the next node anywhere (including parallel
  branches), STEP_OVER at the next node of the paused branch or an
  enclosing one, STEP_OUT once execution is back in an enclosing branch.
*/
class DebugSession {
 public:
  using PauseListener = std::function<void(const PauseInfo&)>;

  DebugSession(std::string session_id, std::string execution_id, DebugMode mode, std::shared_ptr<TraceRecorder> recorder = nullptr,
               std::shared_ptr<db::Repository> repository = nullptr);

  const std::string& Id() const {
    return session_id_;
  }
  const std::string& ExecutionId() const {
    return execution_id_;
  }
  DebugMode Mode() const {
    return mode_;
  }

  SessionState             State() const;
  std::optional<PauseInfo> CurrentPause() const;
  std::optional<std::string> LastError() const;

  BreakpointManager& Breakpoints() {
    return breakpoints_;
  }

  void                                           AddWatch(const std::string& key);
  void                                           RemoveWatch(const std::string& key);
  std::map<std::string, google::protobuf::Value> WatchValues() const;

  // Called on the pausing thread after the session entered PAUSED.
  void SetPauseListener(PauseListener listener);

  CommandResult Execute(const DebugCommand& command);

  // ------------------------------------------------------------
  // Execution hooks (routed by WorkflowDebugger)
  // ------------------------------------------------------------
  async::Future<engine::EnterDirective> BeforeNode(const std::string& node_id, const state::State& state);
  void AfterNode(const std::string& node_id, const state::State& state, std::chrono::milliseconds duration);
  void OnEdge(const std::string& from, const std::string& to);
  void OnError(const std::string& node_id, const state::State& state, const std::string& error);
  void OnFinished(graphflow::v1::ExecutionStatus status);

  // Releases a pending pause and stops pausing; the execution runs on.
  void Detach();

  bool WaitForPause(std::chrono::milliseconds timeout) const;
  bool WaitUntilFinished(std::chrono::milliseconds timeout) const;

 private:
  std::map<std::string, google::protobuf::Value> WatchValuesLocked(const state::State& state) const;
  bool                                           IsPaused() const;
  void Resume(std::unique_lock<std::mutex>& lock, engine::EnterDirective directive, SessionState next);
  void RecordEvent(graphflow::v1::TraceEventType type, const std::string& node_id, google::protobuf::Struct data,
                   const state::State* snapshot = nullptr);

  std::string                    session_id_;
  std::string                    execution_id_;
  DebugMode                      mode_;
  std::shared_ptr<TraceRecorder> recorder_;
  BreakpointManager              breakpoints_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  SessionState                    state_ = SessionState::kInitialized;

  bool                       step_into_           = false;
  std::optional<std::string> step_over_branch_;
  std::optional<std::size_t> step_out_depth_;
  bool                       pause_requested_     = false;
  bool                       terminate_requested_ = false;
  bool                       detached_            = false;

  std::optional<PauseInfo>                              pause_;
  std::optional<async::Promise<engine::EnterDirective>> pending_;
  std::optional<state::State>                           modified_state_;
  std::map<std::string, std::vector<graphflow::v1::Breakpoint>> edge_hits_;

  std::string                                    first_node_;
  std::string                                    last_node_;
  std::optional<std::chrono::milliseconds>       last_duration_;
  std::optional<state::State>                    last_state_;
  std::optional<std::string>                     last_error_;
  std::vector<std::string>                       watches_;
  std::map<std::string, google::protobuf::Value> last_watch_values_;
  PauseListener                                  pause_listener_;
};

} // namespace graphflow::debug
