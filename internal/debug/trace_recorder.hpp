#pragma once

#include <google/protobuf/struct.pb.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "graphflow/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/execution_observer.hpp"
#include "internal/state/state.hpp"
#include "internal/util/time.hpp"

namespace graphflow::debug {

enum class TraceStatus {
  kRunning,
  kCompleted,
  kFailed,
  kTerminated,
};

std::string_view TraceStatusName(TraceStatus status);

struct NodeMetrics {
  uint64_t                  count = 0;
  std::chrono::milliseconds total{0};
  std::chrono::milliseconds min{0};
  std::chrono::milliseconds max{0};
  uint64_t                  errors = 0;

  double AverageMs() const {
    return count == 0 ? 0.0 : static_cast<double>(total.count()) / static_cast<double>(count);
  }
};

struct StateSnapshot {
  uint64_t        sequence = 0;
  std::string     node_id;
  state::State    state;
  util::TimePoint taken_at;
};

struct ExecutionTrace {
  std::string                        execution_id;
  std::string                        workflow_id;
  TraceStatus                        status = TraceStatus::kRunning;
  util::TimePoint                    started_at;
  std::optional<util::TimePoint>     finished_at;
  std::deque<graphflow::v1::TraceEvent> events;
  std::vector<StateSnapshot>         snapshots;
  std::map<std::string, NodeMetrics> node_metrics;
  uint64_t                           next_sequence  = 1;
  uint64_t                           dropped_events = 0;
};

struct TraceRecorderOptions {
  std::size_t               max_trace_events  = 10000;
  std::size_t               snapshot_interval = 10;
  std::chrono::milliseconds trace_retention   = std::chrono::hours(24 * 7);
  bool                      persist           = true;
  std::size_t               batch_size        = 100;
  std::chrono::milliseconds flush_interval    = std::chrono::milliseconds(200);

  static TraceRecorderOptions FromConfig(const graphflow::runtime::config::DebuggerConfig& cfg);
};

/*
  Records every lifecycle hook of an execution into a bounded, ordered
  per-execution event log. Sequence numbers increase by one per event.

  State snapshots are taken every snapshot_interval events and at each
  node exit. When a repository is given, events are also handed to a
  background writer that appends them in batches.
*/
class TraceRecorder final : public engine::ExecutionObserver {
 public:
  explicit TraceRecorder(std::shared_ptr<db::Repository> repository = nullptr, TraceRecorderOptions options = {});
  ~TraceRecorder() override;

  TraceRecorder(const TraceRecorder&)            = delete;
  TraceRecorder& operator=(const TraceRecorder&) = delete;

  void Start();
  // Persists what is pending, then joins the writer.
  void Stop();
  // Blocks until every recorded event has been handed to the repository.
  void Flush();

  // ------------------------------------------------------------
  // Observer hooks
  // ------------------------------------------------------------
  void OnExecutionStarted(const engine::ExecutionInfo& info, const state::State& state) override;
  async::Future<engine::EnterDirective> OnNodeEnter(const engine::ExecutionInfo& info, const std::string& node,
                                                    const state::State& state) override;
  void OnNodeExit(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                  std::chrono::milliseconds duration) override;
  void OnNodeError(const engine::ExecutionInfo& info, const std::string& node, const state::State& state, const std::string& error,
                   std::chrono::milliseconds duration) override;
  void OnEdge(const engine::ExecutionInfo& info, const std::string& from, const std::string& to, double confidence,
              const std::string& reason) override;
  void OnStateChange(const engine::ExecutionInfo& info, const std::string& node, const state::State& state) override;
  void OnExecutionFinished(const engine::ExecutionInfo& info, graphflow::v1::ExecutionStatus status, const state::State& state,
                           const std::string& error) override;

  // Appends an event (breakpoint hits, user actions); returns it with its sequence.
  graphflow::v1::TraceEvent Record(const std::string& execution_id, graphflow::v1::TraceEventType type, const std::string& node_id,
                                   google::protobuf::Struct data = {}, const state::State* snapshot = nullptr);

  std::optional<ExecutionTrace> GetTrace(const std::string& execution_id) const;

  // In-memory trace if present, otherwise the newest max_trace_events persisted events.
  // Throws util::ReplayError.
  ExecutionTrace LoadTrace(const std::string& execution_id);

  // Drops finished traces (and persisted events) older than retention.
  std::size_t CleanupTraces(std::chrono::milliseconds retention);

  const TraceRecorderOptions& Options() const {
    return options_;
  }

 private:
  ExecutionTrace& TraceFor(const std::string& execution_id, const std::string& workflow_id);
  graphflow::v1::TraceEvent AppendLocked(ExecutionTrace& trace, graphflow::v1::TraceEventType type, const std::string& node_id,
                                         google::protobuf::Struct data, const state::State* snapshot);
  void Enqueue(const graphflow::v1::TraceEvent& event);
  void WriterLoop();
  void WriteBatch(std::vector<db::model::TraceEventRecord> batch);

  std::shared_ptr<db::Repository> repository_;
  TraceRecorderOptions            options_;

  mutable std::mutex                              mutex_;
  std::unordered_map<std::string, ExecutionTrace> traces_;

  std::mutex                              pending_mutex_;
  std::condition_variable                 pending_cv_;
  std::condition_variable                 flushed_cv_;
  std::vector<db::model::TraceEventRecord> pending_;
  std::size_t                             in_flight_ = 0;
  bool                                    stopping_  = false;
  std::thread                             writer_;
};

// Struct view of a state for trace payloads: version, node and data.
google::protobuf::Struct StatePayload(const state::State& state);

db::model::TraceEventRecord ToRecord(const graphflow::v1::TraceEvent& event);
graphflow::v1::TraceEvent   FromRecord(const db::model::TraceEventRecord& record);

} // namespace graphflow::debug
