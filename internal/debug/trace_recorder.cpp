#include "trace_recorder.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>

#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/value.hpp"

namespace graphflow::debug {

using graphflow::v1::TraceEvent;
using graphflow::v1::TraceEventType;
using observability::IntField;
using observability::StringField;
namespace v1 = graphflow::v1;

namespace {

void Put(google::protobuf::Struct& data, const std::string& key, google::protobuf::Value value) {
  (*data.mutable_fields())[key] = std::move(value);
}

google::protobuf::Value Number(double v) {
  return util::NumberValue(v);
}

TraceStatus StatusFrom(v1::ExecutionStatus status) {
  switch (status) {
    case v1::EXECUTION_STATUS_COMPLETED:
      return TraceStatus::kCompleted;
    case v1::EXECUTION_STATUS_CANCELLED:
      return TraceStatus::kTerminated;
    case v1::EXECUTION_STATUS_FAILED:
      return TraceStatus::kFailed;
    default:
      return TraceStatus::kRunning;
  }
}

void AccumulateMetrics(NodeMetrics& m, std::chrono::milliseconds duration, bool error) {
  if (m.count == 0) {
    m.min = duration;
    m.max = duration;
  } else {
    m.min = std::min(m.min, duration);
    m.max = std::max(m.max, duration);
  }
  ++m.count;
  m.total += duration;
  if (error) ++m.errors;
}

std::chrono::milliseconds DurationOf(const TraceEvent& event) {
  auto it = event.data().fields().find("duration_ms");
  if (it == event.data().fields().end()) return std::chrono::milliseconds(0);
  return std::chrono::milliseconds(static_cast<int64_t>(it->second.number_value()));
}

} // namespace

std::string_view TraceStatusName(TraceStatus status) {
  switch (status) {
    case TraceStatus::kRunning:
      return "RUNNING";
    case TraceStatus::kCompleted:
      return "COMPLETED";
    case TraceStatus::kFailed:
      return "FAILED";
    case TraceStatus::kTerminated:
      return "TERMINATED";
  }
  return "UNKNOWN";
}

TraceRecorderOptions TraceRecorderOptions::FromConfig(const graphflow::runtime::config::DebuggerConfig& cfg) {
  TraceRecorderOptions options;
  if (cfg.max_trace_events() > 0) options.max_trace_events = cfg.max_trace_events();
  if (cfg.snapshot_interval() > 0) options.snapshot_interval = cfg.snapshot_interval();
  if (cfg.has_trace_retention()) options.trace_retention = util::ToMillis(cfg.trace_retention(), options.trace_retention);
  if (cfg.has_persist_traces()) options.persist = cfg.persist_traces();
  if (cfg.persist_batch_size() > 0) options.batch_size = cfg.persist_batch_size();
  return options;
}

google::protobuf::Struct StatePayload(const state::State& state) {
  google::protobuf::Struct payload;
  Put(payload, "version", Number(static_cast<double>(state.Version())));
  Put(payload, "node", util::StringValue(state.CurrentNode()));
  google::protobuf::Value data;
  *data.mutable_struct_value() = state.Data();
  Put(payload, "data", std::move(data));
  return payload;
}

db::model::TraceEventRecord ToRecord(const TraceEvent& event) {
  db::model::TraceEventRecord record;
  record.id           = event.id();
  record.execution_id = event.execution_id();
  record.sequence     = event.sequence();
  record.type         = static_cast<int>(event.type());
  record.node_id      = event.node_id();
  record.timestamp_ms = util::ToUnixMillis(util::FromProto(event.timestamp()));
  auto status         = google::protobuf::util::MessageToJsonString(event, &record.json);
  if (!status.ok()) throw util::PersistenceError("failed to serialize trace event: " + std::string(status.message()));
  return record;
}

TraceEvent FromRecord(const db::model::TraceEventRecord& record) {
  TraceEvent event;
  auto       status = google::protobuf::util::JsonStringToMessage(record.json, &event);
  if (!status.ok()) {
    throw util::ReplayError("corrupt trace event " + std::to_string(record.sequence) + " of execution '" + record.execution_id +
                            "': " + std::string(status.message()));
  }
  return event;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

TraceRecorder::TraceRecorder(std::shared_ptr<db::Repository> repository, TraceRecorderOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
  if (options_.max_trace_events == 0) options_.max_trace_events = 1;
  if (options_.batch_size == 0) options_.batch_size = 1;
}

TraceRecorder::~TraceRecorder() {
  Stop();
}

void TraceRecorder::Start() {
  if (!repository_ || !options_.persist) return;
  std::lock_guard lock(pending_mutex_);
  if (writer_.joinable()) return;
  stopping_ = false;
  writer_   = std::thread(&TraceRecorder::WriterLoop, this);
}

void TraceRecorder::Stop() {
  {
    std::lock_guard lock(pending_mutex_);
    stopping_ = true;
  }
  pending_cv_.notify_all();
  if (writer_.joinable()) writer_.join();

  // Anything recorded after the writer exited.
  std::vector<db::model::TraceEventRecord> rest;
  {
    std::lock_guard lock(pending_mutex_);
    rest.swap(pending_);
  }
  if (!rest.empty()) WriteBatch(std::move(rest));
}

void TraceRecorder::Flush() {
  std::unique_lock lock(pending_mutex_);
  if (!writer_.joinable()) {
    std::vector<db::model::TraceEventRecord> batch;
    batch.swap(pending_);
    lock.unlock();
    if (!batch.empty()) WriteBatch(std::move(batch));
    return;
  }
  pending_cv_.notify_all();
  flushed_cv_.wait(lock, [this] { return pending_.empty() && in_flight_ == 0; });
}

void TraceRecorder::Enqueue(const TraceEvent& event) {
  if (!repository_ || !options_.persist) return;
  auto record = ToRecord(event);

  bool full = false;
  {
    std::lock_guard lock(pending_mutex_);
    pending_.push_back(std::move(record));
    full = pending_.size() >= options_.batch_size;
  }
  if (full) pending_cv_.notify_one();
}

void TraceRecorder::WriterLoop() {
  std::unique_lock lock(pending_mutex_);
  for (;;) {
    pending_cv_.wait_for(lock, options_.flush_interval, [this] { return stopping_ || pending_.size() >= options_.batch_size; });

    while (!pending_.empty()) {
      auto                                     take = std::min(pending_.size(), options_.batch_size);
      std::vector<db::model::TraceEventRecord> batch(std::make_move_iterator(pending_.begin()),
                                                     std::make_move_iterator(pending_.begin() + static_cast<std::ptrdiff_t>(take)));
      pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(take));
      ++in_flight_;
      lock.unlock();
      WriteBatch(std::move(batch));
      lock.lock();
      --in_flight_;
    }
    flushed_cv_.notify_all();

    if (stopping_) break;
  }
}

void TraceRecorder::WriteBatch(std::vector<db::model::TraceEventRecord> batch) {
  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) { db::ThrowIfDbError(repository_->AppendTraceEvents(tx, batch), "append trace events"); });
    GRAPHFLOW_LOG_DEBUG("trace batch persisted", {IntField("events", static_cast<int64_t>(batch.size()))});
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_ERROR("failed to persist trace batch", {IntField("events", static_cast<int64_t>(batch.size())),
                                                          StringField("execution_id", batch.front().execution_id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Recording
// ------------------------------------------------------------

ExecutionTrace& TraceRecorder::TraceFor(const std::string& execution_id, const std::string& workflow_id) {
  auto [it, inserted] = traces_.try_emplace(execution_id);
  if (inserted) {
    it->second.execution_id = execution_id;
    it->second.started_at   = util::Now();
  }
  if (it->second.workflow_id.empty()) it->second.workflow_id = workflow_id;
  return it->second;
}

TraceEvent TraceRecorder::AppendLocked(ExecutionTrace& trace, TraceEventType type, const std::string& node_id,
                                       google::protobuf::Struct data, const state::State* snapshot) {
  TraceEvent event;
  event.set_id(util::NewId("ev"));
  event.set_execution_id(trace.execution_id);
  event.set_type(type);
  event.set_node_id(node_id);
  *event.mutable_data()      = std::move(data);
  *event.mutable_timestamp() = util::ToProto(util::Now());
  event.set_sequence(trace.next_sequence++);

  trace.events.push_back(event);
  while (trace.events.size() > options_.max_trace_events) {
    trace.events.pop_front();
    ++trace.dropped_events;
  }

  bool interval_hit = options_.snapshot_interval > 0 && event.sequence() % options_.snapshot_interval == 0;
  if (snapshot && (type == v1::TRACE_EVENT_NODE_EXIT || interval_hit)) {
    trace.snapshots.push_back(StateSnapshot{event.sequence(), node_id, *snapshot, util::Now()});
    const auto oldest = trace.events.front().sequence();
    auto       stale  = std::find_if(trace.snapshots.begin(), trace.snapshots.end(), [&](const StateSnapshot& s) { return s.sequence >= oldest; });
    trace.snapshots.erase(trace.snapshots.begin(), stale);
  }
  return event;
}

TraceEvent TraceRecorder::Record(const std::string& execution_id, TraceEventType type, const std::string& node_id,
                                 google::protobuf::Struct data, const state::State* snapshot) {
  TraceEvent event;
  {
    std::lock_guard lock(mutex_);
    auto&           trace = TraceFor(execution_id, snapshot ? snapshot->WorkflowId() : std::string());
    event                 = AppendLocked(trace, type, node_id, std::move(data), snapshot);
  }
  Enqueue(event);
  return event;
}

void TraceRecorder::OnExecutionStarted(const engine::ExecutionInfo& info, const state::State& state) {
  {
    std::lock_guard lock(mutex_);
    auto&           trace = TraceFor(info.execution_id, info.workflow_id);
    trace.status          = TraceStatus::kRunning;
    trace.finished_at.reset();
  }
  google::protobuf::Struct data;
  Put(data, "event", util::StringValue("execution_started"));
  Put(data, "workflow_id", util::StringValue(info.workflow_id));
  Put(data, "tenant_id", util::StringValue(info.tenant_id));
  Record(info.execution_id, v1::TRACE_EVENT_SYSTEM_EVENT, state.CurrentNode(), std::move(data), &state);
}

async::Future<engine::EnterDirective> TraceRecorder::OnNodeEnter(const engine::ExecutionInfo& info, const std::string& node,
                                                                 const state::State& state) {
  google::protobuf::Struct data;
  Put(data, "version", Number(static_cast<double>(state.Version())));
  if (!state.BranchId().empty()) Put(data, "branch_id", util::StringValue(state.BranchId()));
  Record(info.execution_id, v1::TRACE_EVENT_NODE_ENTER, node, std::move(data), &state);
  return async::MakeReady(engine::EnterDirective{});
}

void TraceRecorder::OnNodeExit(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                               std::chrono::milliseconds duration) {
  {
    std::lock_guard lock(mutex_);
    AccumulateMetrics(TraceFor(info.execution_id, info.workflow_id).node_metrics[node], duration, false);
  }
  google::protobuf::Struct data;
  Put(data, "duration_ms", Number(static_cast<double>(duration.count())));
  Put(data, "version", Number(static_cast<double>(state.Version())));
  Record(info.execution_id, v1::TRACE_EVENT_NODE_EXIT, node, std::move(data), &state);
}

void TraceRecorder::OnNodeError(const engine::ExecutionInfo& info, const std::string& node, const state::State& state,
                                const std::string& error, std::chrono::milliseconds duration) {
  {
    std::lock_guard lock(mutex_);
    AccumulateMetrics(TraceFor(info.execution_id, info.workflow_id).node_metrics[node], duration, true);
  }
  google::protobuf::Struct data;
  Put(data, "error", util::StringValue(error));
  Put(data, "duration_ms", Number(static_cast<double>(duration.count())));
  Record(info.execution_id, v1::TRACE_EVENT_NODE_ERROR, node, std::move(data), &state);
}

void TraceRecorder::OnEdge(const engine::ExecutionInfo& info, const std::string& from, const std::string& to, double confidence,
                           const std::string& reason) {
  google::protobuf::Struct data;
  Put(data, "from", util::StringValue(from));
  Put(data, "to", util::StringValue(to));
  Put(data, "confidence", Number(confidence));
  Put(data, "reason", util::StringValue(reason));
  Record(info.execution_id, v1::TRACE_EVENT_EDGE_TRAVERSE, from, std::move(data));
}

void TraceRecorder::OnStateChange(const engine::ExecutionInfo& info, const std::string& node, const state::State& state) {
  Record(info.execution_id, v1::TRACE_EVENT_STATE_CHANGE, node, StatePayload(state), &state);
}

void TraceRecorder::OnExecutionFinished(const engine::ExecutionInfo& info, v1::ExecutionStatus status, const state::State& state,
                                        const std::string& error) {
  google::protobuf::Struct data;
  Put(data, "event", util::StringValue("execution_finished"));
  Put(data, "status", util::StringValue(v1::ExecutionStatus_Name(status)));
  if (!error.empty()) Put(data, "error", util::StringValue(error));
  Record(info.execution_id, v1::TRACE_EVENT_SYSTEM_EVENT, state.CurrentNode(), std::move(data), &state);

  std::lock_guard lock(mutex_);
  auto&           trace = TraceFor(info.execution_id, info.workflow_id);
  trace.status          = StatusFrom(status);
  trace.finished_at     = util::Now();
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::optional<ExecutionTrace> TraceRecorder::GetTrace(const std::string& execution_id) const {
  std::lock_guard lock(mutex_);
  auto            it = traces_.find(execution_id);
  if (it == traces_.end()) return std::nullopt;
  return it->second;
}

ExecutionTrace TraceRecorder::LoadTrace(const std::string& execution_id) {
  if (auto trace = GetTrace(execution_id)) return *trace;
  if (!repository_) throw util::ReplayError("no trace recorded for execution '" + execution_id + "'");

  std::vector<db::model::TraceEventRecord> records;
  try {
    auto tx = repository_->Begin();
    records = repository_->ReadTraceEvents(*tx, execution_id);
  } catch (const util::PersistenceError& e) {
    throw util::ReplayError("failed to load trace of execution '" + execution_id + "': " + e.what());
  }
  if (records.empty()) throw util::ReplayError("no trace recorded for execution '" + execution_id + "'");

  ExecutionTrace trace;
  trace.execution_id = execution_id;
  for (const auto& record : records) {
    auto event = FromRecord(record);
    if (event.type() == v1::TRACE_EVENT_NODE_EXIT || event.type() == v1::TRACE_EVENT_NODE_ERROR) {
      AccumulateMetrics(trace.node_metrics[event.node_id()], DurationOf(event), event.type() == v1::TRACE_EVENT_NODE_ERROR);
    }
    if (event.type() == v1::TRACE_EVENT_SYSTEM_EVENT) {
      const auto& fields = event.data().fields();
      auto        kind   = fields.find("event");
      if (kind != fields.end() && kind->second.string_value() == "execution_started") {
        trace.started_at = util::FromProto(event.timestamp());
        if (auto wf = fields.find("workflow_id"); wf != fields.end()) trace.workflow_id = wf->second.string_value();
      }
      if (kind != fields.end() && kind->second.string_value() == "execution_finished") {
        v1::ExecutionStatus status = v1::EXECUTION_STATUS_UNSPECIFIED;
        if (auto s = fields.find("status"); s != fields.end()) v1::ExecutionStatus_Parse(s->second.string_value(), &status);
        trace.status      = StatusFrom(status);
        trace.finished_at = util::FromProto(event.timestamp());
      }
    }
    trace.next_sequence = std::max(trace.next_sequence, event.sequence() + 1);
    trace.events.push_back(std::move(event));
    if (trace.events.size() > options_.max_trace_events) {
      trace.events.pop_front();
      ++trace.dropped_events;
    }
  }
  return trace;
}

std::size_t TraceRecorder::CleanupTraces(std::chrono::milliseconds retention) {
  const auto  cutoff  = util::Now() - retention;
  std::size_t removed = 0;
  {
    std::lock_guard lock(mutex_);
    for (auto it = traces_.begin(); it != traces_.end();) {
      if (it->second.finished_at && *it->second.finished_at < cutoff) {
        it = traces_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }

  if (repository_) {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repository_->DeleteTraceEventsOlderThan(tx, util::ToUnixMillis(cutoff)), "delete trace events");
    });
  }

  GRAPHFLOW_LOG_DEBUG("trace cleanup", {IntField("removed", static_cast<int64_t>(removed))});
  return removed;
}

} // namespace graphflow::debug
