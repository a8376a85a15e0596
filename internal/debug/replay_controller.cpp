#include "replay_controller.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphflow::debug {

using graphflow::v1::TraceEvent;
using observability::DoubleField;
using observability::StringField;
namespace v1 = graphflow::v1;

std::string_view ReplayStateName(ReplayState state) {
  switch (state) {
    case ReplayState::kReady:
      return "READY";
    case ReplayState::kPlaying:
      return "PLAYING";
    case ReplayState::kPaused:
      return "PAUSED";
    case ReplayState::kFinished:
      return "FINISHED";
  }
  return "UNKNOWN";
}

ReplayController::ReplayController(ExecutionTrace trace, std::chrono::milliseconds max_gap)
    : execution_id_(std::move(trace.execution_id)),
      workflow_id_(std::move(trace.workflow_id)),
      events_(std::make_move_iterator(trace.events.begin()), std::make_move_iterator(trace.events.end())),
      max_gap_(max_gap) {
  std::stable_sort(events_.begin(), events_.end(), [](const TraceEvent& a, const TraceEvent& b) { return a.sequence() < b.sequence(); });
}

ReplayController::~ReplayController() {
  StopPlayback();
}

void ReplayController::OnEvent(v1::TraceEventType type, Handler handler) {
  std::lock_guard lock(mutex_);
  handlers_[type] = std::move(handler);
}

void ReplayController::OnAnyEvent(Handler handler) {
  std::lock_guard lock(mutex_);
  any_handler_ = std::move(handler);
}

std::optional<TraceEvent> ReplayController::Advance(std::unique_lock<std::mutex>& lock) {
  if (position_ >= events_.size()) {
    state_ = ReplayState::kFinished;
    return std::nullopt;
  }
  TraceEvent event = events_[position_++];
  if (position_ == events_.size()) state_ = ReplayState::kFinished;

  Handler typed;
  if (auto it = handlers_.find(event.type()); it != handlers_.end()) typed = it->second;
  Handler any = any_handler_;

  lock.unlock();
  cv_.notify_all();
  try {
    if (typed) typed(event);
    if (any) any(event);
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_WARN("replay handler failed", {StringField("execution_id", execution_id_), StringField("error", e.what())});
  }
  lock.lock();
  return event;
}

std::optional<TraceEvent> ReplayController::StepForward() {
  std::unique_lock lock(mutex_);
  if (state_ == ReplayState::kPlaying) throw util::InvalidState("replay is playing");
  auto event = Advance(lock);
  if (event && state_ != ReplayState::kFinished) state_ = ReplayState::kPaused;
  return event;
}

std::optional<TraceEvent> ReplayController::StepBackward() {
  std::lock_guard lock(mutex_);
  if (state_ == ReplayState::kPlaying) throw util::InvalidState("replay is playing");
  if (position_ == 0) return std::nullopt;
  --position_;
  state_ = position_ == 0 ? ReplayState::kReady : ReplayState::kPaused;
  if (position_ == 0) return std::nullopt;
  return events_[position_ - 1];
}

void ReplayController::JumpToEvent(uint64_t sequence) {
  StopPlayback();
  std::lock_guard lock(mutex_);
  auto it = std::find_if(events_.begin(), events_.end(), [&](const TraceEvent& e) { return e.sequence() == sequence; });
  if (it == events_.end()) throw util::ReplayError("no event with sequence " + std::to_string(sequence) + " in " + execution_id_);
  position_ = static_cast<std::size_t>(it - events_.begin()) + 1;
  state_    = position_ == events_.size() ? ReplayState::kFinished : ReplayState::kPaused;
}

void ReplayController::Reset() {
  StopPlayback();
  std::lock_guard lock(mutex_);
  position_ = 0;
  state_    = ReplayState::kReady;
}

void ReplayController::Play(double speed) {
  StopPlayback();
  std::lock_guard lock(mutex_);
  speed_ = std::clamp(speed, 0.1, 10.0);
  if (position_ >= events_.size()) {
    state_ = ReplayState::kFinished;
    return;
  }
  state_  = ReplayState::kPlaying;
  stop_   = false;
  player_ = std::thread([this] { PlayLoop(); });
  GRAPHFLOW_LOG_DEBUG("replay started", {StringField("execution_id", execution_id_), DoubleField("speed", speed_)});
}

void ReplayController::Pause() {
  std::unique_lock lock(mutex_);
  if (state_ != ReplayState::kPlaying) return;
  state_ = ReplayState::kPaused;
  lock.unlock();
  StopPlayback();
}

void ReplayController::StopPlayback() {
  std::unique_lock lock(mutex_);
  stop_ = true;
  lock.unlock();
  cv_.notify_all();
  if (player_.joinable() && player_.get_id() != std::this_thread::get_id()) player_.join();
  lock.lock();
  stop_ = false;
  if (state_ == ReplayState::kPlaying) state_ = ReplayState::kPaused;
}

void ReplayController::PlayLoop() {
  std::unique_lock lock(mutex_);
  while (!stop_ && state_ == ReplayState::kPlaying) {
    auto event = Advance(lock);
    if (!event || state_ == ReplayState::kFinished || stop_) break;

    const auto& next = events_[position_];
    auto        gap  = util::FromProto(next.timestamp()) - util::FromProto(event->timestamp());
    auto        wait = std::chrono::duration_cast<std::chrono::milliseconds>(gap / speed_);
    wait             = std::clamp(wait, std::chrono::milliseconds(0), max_gap_);
    cv_.wait_for(lock, wait, [&] { return stop_; });
  }
  lock.unlock();
  cv_.notify_all();
}

bool ReplayController::WaitUntilFinished(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return state_ == ReplayState::kFinished; });
}

ReplayState ReplayController::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

double ReplayController::Speed() const {
  std::lock_guard lock(mutex_);
  return speed_;
}

std::size_t ReplayController::Position() const {
  std::lock_guard lock(mutex_);
  return position_;
}

std::optional<TraceEvent> ReplayController::CurrentEvent() const {
  std::lock_guard lock(mutex_);
  if (position_ == 0) return std::nullopt;
  return events_[position_ - 1];
}

std::vector<std::string> ReplayController::VisitedNodes() const {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> out;
  for (std::size_t i = 0; i < position_; ++i) {
    if (events_[i].type() == v1::TRACE_EVENT_NODE_ENTER) out.push_back(events_[i].node_id());
  }
  return out;
}

google::protobuf::Struct ReplayController::VariablesAtPosition() const {
  std::lock_guard          lock(mutex_);
  google::protobuf::Struct vars;
  for (std::size_t i = 0; i < position_; ++i) {
    const auto& fields = events_[i].data().fields();
    if (events_[i].type() == v1::TRACE_EVENT_STATE_CHANGE) {
      auto it = fields.find("data");
      if (it != fields.end() && it->second.has_struct_value()) vars = it->second.struct_value();
    } else if (events_[i].type() == v1::TRACE_EVENT_VARIABLE_SET) {
      auto name  = fields.find("name");
      auto value = fields.find("value");
      if (name != fields.end() && value != fields.end()) (*vars.mutable_fields())[name->second.string_value()] = value->second;
    }
  }
  return vars;
}

} // namespace graphflow::debug
