#include "debug_session.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/value.hpp"

namespace graphflow::debug {

using engine::EnterDirective;
using google::protobuf::Struct;
using google::protobuf::Value;
using observability::BoolField;
using observability::StringField;
namespace v1 = graphflow::v1;

namespace {

std::size_t Depth(const std::string& branch_id) {
  if (branch_id.empty()) return 0;
  return 1 + static_cast<std::size_t>(std::count(branch_id.begin(), branch_id.end(), '.'));
}

std::string Param(const Struct& params, const std::string& key) {
  auto it = params.fields().find(key);
  if (it == params.fields().end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

Struct Fields(std::initializer_list<std::pair<const char*, Value>> fields) {
  Struct s;
  for (const auto& [k, v] : fields) (*s.mutable_fields())[k] = v;
  return s;
}

} // namespace

std::string_view DebugModeName(DebugMode mode) {
  switch (mode) {
    case DebugMode::kStepByStep:
      return "STEP_BY_STEP";
    case DebugMode::kBreakpoint:
      return "BREAKPOINT";
    case DebugMode::kWatch:
      return "WATCH";
    case DebugMode::kReplay:
      return "REPLAY";
    case DebugMode::kTimeTravel:
      return "TIME_TRAVEL";
  }
  return "UNKNOWN";
}

std::string_view SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kInitialized:
      return "INITIALIZED";
    case SessionState::kRunning:
      return "RUNNING";
    case SessionState::kPaused:
      return "PAUSED";
    case SessionState::kStepping:
      return "STEPPING";
    case SessionState::kFinished:
      return "FINISHED";
    case SessionState::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::string_view CommandName(CommandType type) {
  switch (type) {
    case CommandType::kContinue:
      return "CONTINUE";
    case CommandType::kStepOver:
      return "STEP_OVER";
    case CommandType::kStepInto:
      return "STEP_INTO";
    case CommandType::kStepOut:
      return "STEP_OUT";
    case CommandType::kPause:
      return "PAUSE";
    case CommandType::kSetBreakpoint:
      return "SET_BREAKPOINT";
    case CommandType::kRemoveBreakpoint:
      return "REMOVE_BREAKPOINT";
    case CommandType::kInspectVariable:
      return "INSPECT_VARIABLE";
    case CommandType::kModifyVariable:
      return "MODIFY_VARIABLE";
    case CommandType::kJumpToNode:
      return "JUMP_TO_NODE";
    case CommandType::kRestart:
      return "RESTART";
    case CommandType::kTerminate:
      return "TERMINATE";
  }
  return "UNKNOWN";
}

// ------------------------------------------------------------
// DebugCommand
// ------------------------------------------------------------

DebugCommand DebugCommand::Simple(CommandType type) {
  DebugCommand cmd;
  cmd.type = type;
  return cmd;
}

DebugCommand DebugCommand::SetBreakpoint(const v1::Breakpoint& breakpoint) {
  auto cmd = Simple(CommandType::kSetBreakpoint);
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(breakpoint, &json);
  if (!status.ok()) throw util::InvalidArgument("breakpoint encode failed: " + status.ToString());
  status = google::protobuf::util::JsonStringToMessage(json, &cmd.params);
  if (!status.ok()) throw util::InvalidArgument("breakpoint encode failed: " + status.ToString());
  return cmd;
}

DebugCommand DebugCommand::RemoveBreakpoint(const std::string& breakpoint_id) {
  auto cmd   = Simple(CommandType::kRemoveBreakpoint);
  cmd.params = Fields({{"breakpoint_id", util::StringValue(breakpoint_id)}});
  return cmd;
}

DebugCommand DebugCommand::InspectVariable(const std::string& name) {
  auto cmd   = Simple(CommandType::kInspectVariable);
  cmd.params = Fields({{"name", util::StringValue(name)}});
  return cmd;
}

DebugCommand DebugCommand::ModifyVariable(const std::string& name, Value value) {
  auto cmd   = Simple(CommandType::kModifyVariable);
  cmd.params = Fields({{"name", util::StringValue(name)}, {"value", std::move(value)}});
  return cmd;
}

DebugCommand DebugCommand::JumpToNode(const std::string& node_id) {
  auto cmd   = Simple(CommandType::kJumpToNode);
  cmd.params = Fields({{"node_id", util::StringValue(node_id)}});
  return cmd;
}

// ------------------------------------------------------------
// DebugSession
// ------------------------------------------------------------

DebugSession::DebugSession(std::string session_id, std::string execution_id, DebugMode mode, std::shared_ptr<TraceRecorder> recorder,
                           std::shared_ptr<db::Repository> repository)
    : session_id_(std::move(session_id)),
      execution_id_(std::move(execution_id)),
      mode_(mode),
      recorder_(std::move(recorder)),
      breakpoints_(session_id_, std::move(repository)),
      step_into_(mode == DebugMode::kStepByStep) {
}

SessionState DebugSession::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::optional<PauseInfo> DebugSession::CurrentPause() const {
  std::lock_guard lock(mutex_);
  return pause_;
}

std::optional<std::string> DebugSession::LastError() const {
  std::lock_guard lock(mutex_);
  return last_error_;
}

void DebugSession::AddWatch(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (std::find(watches_.begin(), watches_.end(), key) == watches_.end()) watches_.push_back(key);
}

void DebugSession::RemoveWatch(const std::string& key) {
  std::lock_guard lock(mutex_);
  watches_.erase(std::remove(watches_.begin(), watches_.end(), key), watches_.end());
  last_watch_values_.erase(key);
}

std::map<std::string, Value> DebugSession::WatchValues() const {
  std::lock_guard lock(mutex_);
  if (!last_state_) return {};
  return WatchValuesLocked(*last_state_);
}

std::map<std::string, Value> DebugSession::WatchValuesLocked(const state::State& state) const {
  std::map<std::string, Value> out;
  for (const auto& key : watches_) {
    auto v   = state.Get(key);
    out[key] = v ? *v : util::NullValue();
  }
  return out;
}

void DebugSession::SetPauseListener(PauseListener listener) {
  std::lock_guard lock(mutex_);
  pause_listener_ = std::move(listener);
}

bool DebugSession::IsPaused() const {
  return state_ == SessionState::kPaused && pending_.has_value();
}

void DebugSession::RecordEvent(v1::TraceEventType type, const std::string& node_id, Struct data, const state::State* snapshot) {
  if (!recorder_) return;
  recorder_->Record(execution_id_, type, node_id, std::move(data), snapshot);
}

void DebugSession::Resume(std::unique_lock<std::mutex>& lock, EnterDirective directive, SessionState next) {
  auto promise = std::move(*pending_);
  pending_.reset();
  pause_.reset();
  if (modified_state_ && directive.action != EnterDirective::Action::kTerminate) directive.state = std::move(modified_state_);
  modified_state_.reset();
  state_ = next;
  lock.unlock();
  cv_.notify_all();
  promise.SetValue(std::move(directive));
  lock.lock();
}

// ------------------------------------------------------------
// Hooks
// ------------------------------------------------------------

async::Future<EnterDirective> DebugSession::BeforeNode(const std::string& node_id, const state::State& state) {
  std::unique_lock lock(mutex_);
  if (terminate_requested_) {
    EnterDirective stop;
    stop.action = EnterDirective::Action::kTerminate;
    return async::MakeReady(std::move(stop));
  }
  if (detached_ || mode_ == DebugMode::kReplay || mode_ == DebugMode::kTimeTravel) return async::MakeReady(EnterDirective{});

  if (first_node_.empty()) first_node_ = node_id;
  last_state_ = state;

  auto watches = WatchValuesLocked(state);
  if (mode_ == DebugMode::kWatch) {
    for (const auto& [key, value] : watches) {
      auto prev = last_watch_values_.find(key);
      if (prev != last_watch_values_.end() && util::ValueEquals(prev->second, value)) continue;
      if (prev != last_watch_values_.end() || value.kind_case() != Value::kNullValue) {
        RecordEvent(v1::TRACE_EVENT_VARIABLE_SET, node_id, Fields({{"name", util::StringValue(key)}, {"value", value}, {"source", util::StringValue("watch")}}));
      }
    }
  }
  last_watch_values_ = watches;

  auto hits = breakpoints_.EvaluateEnter(node_id, state, last_node_, last_duration_);
  if (auto it = edge_hits_.find(node_id); it != edge_hits_.end()) {
    hits.insert(hits.end(), it->second.begin(), it->second.end());
    edge_hits_.erase(it);
  }

  const auto& branch = state.BranchId();
  std::string reason;
  if (!hits.empty()) {
    reason = "breakpoint";
  } else if (pause_requested_) {
    reason = "pause requested";
  } else if (step_into_) {
    reason = "step";
  } else if (step_over_branch_ && (branch == *step_over_branch_ || Depth(branch) < Depth(*step_over_branch_))) {
    reason = "step";
  } else if (step_out_depth_ && Depth(branch) < *step_out_depth_) {
    reason = "step out";
  }

  if (reason.empty() || pending_) {
    // A second strand reaching a stop while another is paused runs on.
    if (state_ == SessionState::kInitialized) state_ = SessionState::kRunning;
    return async::MakeReady(EnterDirective{});
  }

  step_into_       = false;
  pause_requested_ = false;
  step_over_branch_.reset();
  step_out_depth_.reset();

  PauseInfo info;
  info.node_id   = node_id;
  info.reason    = reason;
  info.state     = state;
  info.watches   = std::move(watches);
  info.paused_at = util::Now();
  for (const auto& bp : hits) info.breakpoint_ids.push_back(bp.id());

  Struct data;
  (*data.mutable_fields())["reason"] = util::StringValue(reason);
  auto* ids = (*data.mutable_fields())["breakpoint_ids"].mutable_list_value();
  for (const auto& id : info.breakpoint_ids) *ids->add_values() = util::StringValue(id);
  auto* watched = (*data.mutable_fields())["watches"].mutable_struct_value();
  for (const auto& [k, v] : info.watches) (*watched->mutable_fields())[k] = v;
  RecordEvent(v1::TRACE_EVENT_BREAKPOINT_HIT, node_id, std::move(data), &state);

  pending_ = async::Promise<EnterDirective>{};
  auto future = pending_->GetFuture();
  pause_      = info;
  state_      = SessionState::kPaused;
  auto listener = pause_listener_;
  lock.unlock();

  GRAPHFLOW_LOG_INFO("debug session paused", {StringField("session_id", session_id_), StringField("execution_id", execution_id_),
                                              StringField("node", node_id), StringField("reason", reason)});
  cv_.notify_all();
  if (listener) listener(info);
  return future;
}

void DebugSession::AfterNode(const std::string& node_id, const state::State& state, std::chrono::milliseconds duration) {
  std::lock_guard lock(mutex_);
  last_node_     = node_id;
  last_duration_ = duration;
  last_state_    = state;
}

void DebugSession::OnEdge(const std::string& from, const std::string& to) {
  auto hits = breakpoints_.EvaluateEdge(from, to);
  if (hits.empty()) return;
  std::lock_guard lock(mutex_);
  auto& pending = edge_hits_[to];
  pending.insert(pending.end(), hits.begin(), hits.end());
}

void DebugSession::OnError(const std::string& node_id, const state::State& state, const std::string& error) {
  auto hits = breakpoints_.EvaluateError(node_id);
  std::lock_guard lock(mutex_);
  last_error_ = error;
  last_state_ = state;
  if (hits.empty()) return;

  Struct data = Fields({{"reason", util::StringValue("exception")}, {"error", util::StringValue(error)}});
  auto*  ids  = (*data.mutable_fields())["breakpoint_ids"].mutable_list_value();
  for (const auto& bp : hits) *ids->add_values() = util::StringValue(bp.id());
  RecordEvent(v1::TRACE_EVENT_BREAKPOINT_HIT, node_id, std::move(data), &state);
}

void DebugSession::OnFinished(v1::ExecutionStatus status) {
  std::unique_lock lock(mutex_);
  auto next = status == v1::EXECUTION_STATUS_FAILED ? SessionState::kError : SessionState::kFinished;
  if (pending_) {
    Resume(lock, EnterDirective{}, next);
  }
  state_ = next;
  lock.unlock();
  cv_.notify_all();
}

void DebugSession::Detach() {
  std::unique_lock lock(mutex_);
  detached_ = true;
  if (pending_) Resume(lock, EnterDirective{}, SessionState::kRunning);
  lock.unlock();
  cv_.notify_all();
}

bool DebugSession::WaitForPause(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return IsPaused(); });
}

bool DebugSession::WaitUntilFinished(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return state_ == SessionState::kFinished || state_ == SessionState::kError; });
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

CommandResult DebugSession::Execute(const DebugCommand& command) {
  CommandResult result;
  std::unique_lock lock(mutex_);

  auto fail = [&](std::string message) {
    result.success = false;
    result.message = std::move(message);
  };
  auto ok = [&](std::string message) {
    result.success = true;
    result.message = std::move(message);
  };
  const bool finished = state_ == SessionState::kFinished || state_ == SessionState::kError;

  switch (command.type) {
    case CommandType::kContinue:
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      Resume(lock, EnterDirective{}, SessionState::kRunning);
      ok("continuing");
      break;

    case CommandType::kStepInto:
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      step_into_ = true;
      Resume(lock, EnterDirective{}, SessionState::kStepping);
      ok("stepping into next node");
      break;

    case CommandType::kStepOver:
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      step_over_branch_ = pause_->state.BranchId();
      Resume(lock, EnterDirective{}, SessionState::kStepping);
      ok("stepping over");
      break;

    case CommandType::kStepOut: {
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      auto depth = Depth(pause_->state.BranchId());
      if (depth == 0) {
        Resume(lock, EnterDirective{}, SessionState::kRunning);
        ok("already at top level; continuing");
        break;
      }
      step_out_depth_ = depth;
      Resume(lock, EnterDirective{}, SessionState::kStepping);
      ok("stepping out of branch");
      break;
    }

    case CommandType::kPause:
      if (finished) {
        fail("execution has finished");
        break;
      }
      if (IsPaused()) {
        fail("session is already paused");
        break;
      }
      pause_requested_ = true;
      ok("pause requested");
      break;

    case CommandType::kSetBreakpoint: {
      std::string      json;
      v1::Breakpoint   bp;
      auto             status = google::protobuf::util::MessageToJsonString(command.params, &json);
      if (status.ok()) status = google::protobuf::util::JsonStringToMessage(json, &bp);
      if (!status.ok()) {
        fail("invalid breakpoint: " + status.ToString());
        break;
      }
      if (command.params.fields().find("enabled") == command.params.fields().end()) bp.set_enabled(true);
      try {
        auto stored = breakpoints_.Add(std::move(bp));
        ok("breakpoint set");
        (*result.data.mutable_fields())["breakpoint_id"] = util::StringValue(stored.id());
      } catch (const util::InvalidArgument& e) {
        fail(e.what());
      }
      break;
    }

    case CommandType::kRemoveBreakpoint: {
      auto id = Param(command.params, "breakpoint_id");
      if (breakpoints_.Remove(id)) {
        ok("breakpoint removed");
      } else {
        fail("unknown breakpoint: " + id);
      }
      break;
    }

    case CommandType::kInspectVariable: {
      auto                      name = Param(command.params, "name");
      const state::State*       source = nullptr;
      if (modified_state_) {
        source = &*modified_state_;
      } else if (pause_) {
        source = &pause_->state;
      } else if (last_state_) {
        source = &*last_state_;
      }
      if (!source) {
        fail("no state available yet");
        break;
      }
      auto value = source->Get(name);
      (*result.data.mutable_fields())["name"]  = util::StringValue(name);
      (*result.data.mutable_fields())["found"] = util::BoolValue(value.has_value());
      (*result.data.mutable_fields())["value"] = value ? *value : util::NullValue();
      ok(value ? "variable found" : "variable not set");
      break;
    }

    case CommandType::kModifyVariable: {
      if (!IsPaused()) {
        fail("variables can only be modified while paused");
        break;
      }
      auto name = Param(command.params, "name");
      auto it   = command.params.fields().find("value");
      if (name.empty() || it == command.params.fields().end()) {
        fail("name and value are required");
        break;
      }
      if (!modified_state_) modified_state_ = pause_->state;
      modified_state_->Set(name, it->second);
      pause_->state = *modified_state_;
      RecordEvent(v1::TRACE_EVENT_VARIABLE_SET, pause_->node_id,
                  Fields({{"name", util::StringValue(name)}, {"value", it->second}, {"source", util::StringValue("debugger")}}));
      (*result.data.mutable_fields())["name"]  = util::StringValue(name);
      (*result.data.mutable_fields())["value"] = it->second;
      ok("variable modified");
      break;
    }

    case CommandType::kJumpToNode: {
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      auto node = Param(command.params, "node_id");
      if (node.empty()) {
        fail("node_id is required");
        break;
      }
      EnterDirective jump;
      jump.action  = EnterDirective::Action::kJump;
      jump.jump_to = node;
      Resume(lock, std::move(jump), SessionState::kRunning);
      ok("jumping to " + node);
      break;
    }

    case CommandType::kRestart: {
      if (!IsPaused()) {
        fail("session is not paused");
        break;
      }
      EnterDirective restart;
      restart.action  = EnterDirective::Action::kJump;
      restart.jump_to = first_node_;
      breakpoints_.ResetHitCounts();
      last_node_.clear();
      last_duration_.reset();
      Resume(lock, std::move(restart), SessionState::kRunning);
      ok("restarting from " + first_node_);
      break;
    }

    case CommandType::kTerminate:
      if (finished) {
        fail("execution has finished");
        break;
      }
      terminate_requested_ = true;
      if (IsPaused()) {
        EnterDirective stop;
        stop.action = EnterDirective::Action::kTerminate;
        Resume(lock, std::move(stop), SessionState::kFinished);
      }
      ok("terminating execution");
      break;
  }

  RecordEvent(v1::TRACE_EVENT_USER_ACTION, pause_ ? pause_->node_id : last_node_,
              Fields({{"command", util::StringValue(std::string(CommandName(command.type)))},
                      {"success", util::BoolValue(result.success)},
                      {"message", util::StringValue(result.message)}}));
  lock.unlock();

  GRAPHFLOW_LOG_DEBUG("debug command", {StringField("session_id", session_id_), StringField("command", std::string(CommandName(command.type))),
                                        BoolField("success", result.success), StringField("message", result.message)});
  return result;
}

} // namespace graphflow::debug
