#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "graphflow/v1.hpp"
#include "internal/debug/trace_recorder.hpp"

namespace graphflow::debug {

enum class ReplayState {
  kReady,
  kPlaying,
  kPaused,
  kFinished,
};

std::string_view ReplayStateName(ReplayState state);

/*
  Replay over a recorded trace.

  The position counts processed events: 0 is before the first event,
  Size() is after the last. Stepping forward hands the event to the
  handler registered for its type; stepping backward and jumping move
  the cursor without calling handlers. Recorded outcomes are replayed as
  data only, nothing is executed.

  Play runs on its own thread, sleeping the recorded gap between two
  events divided by the speed (capped at max_gap). Handlers run on the
  playing thread and must not call Play.
*/
class ReplayController {
 public:
  using Handler = std::function<void(const graphflow::v1::TraceEvent&)>;

  explicit ReplayController(ExecutionTrace trace, std::chrono::milliseconds max_gap = std::chrono::seconds(1));
  ~ReplayController();

  ReplayController(const ReplayController&)            = delete;
  ReplayController& operator=(const ReplayController&) = delete;

  void OnEvent(graphflow::v1::TraceEventType type, Handler handler);
  void OnAnyEvent(Handler handler);

  std::optional<graphflow::v1::TraceEvent> StepForward();
  std::optional<graphflow::v1::TraceEvent> StepBackward();
  // Moves to just after the event with this sequence. Throws util::ReplayError.
  void JumpToEvent(uint64_t sequence);
  void Reset();

  // speed is clamped to [0.1, 10].
  void Play(double speed = 1.0);
  void Pause();
  bool WaitUntilFinished(std::chrono::milliseconds timeout) const;

  ReplayState State() const;
  double      Speed() const;
  std::size_t Position() const;
  std::size_t Size() const {
    return events_.size();
  }
  std::optional<graphflow::v1::TraceEvent> CurrentEvent() const;

  // NODE_ENTER node ids up to the current position, in order.
  std::vector<std::string> VisitedNodes() const;
  // State data as recorded up to the current position.
  google::protobuf::Struct VariablesAtPosition() const;

  const std::string& ExecutionId() const {
    return execution_id_;
  }
  const std::string& WorkflowId() const {
    return workflow_id_;
  }

 private:
  std::optional<graphflow::v1::TraceEvent> Advance(std::unique_lock<std::mutex>& lock);
  void                                     PlayLoop();
  void                                     StopPlayback();

  std::string                            execution_id_;
  std::string                            workflow_id_;
  std::vector<graphflow::v1::TraceEvent> events_;
  std::chrono::milliseconds              max_gap_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  std::size_t                     position_ = 0;
  ReplayState                     state_    = ReplayState::kReady;
  double                          speed_    = 1.0;
  bool                            stop_     = false;
  std::thread                     player_;

  std::map<graphflow::v1::TraceEventType, Handler> handlers_;
  Handler                                          any_handler_;
};

} // namespace graphflow::debug
