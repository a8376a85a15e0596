#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/async/timer_service.hpp"
#include "internal/async/worker_pool.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/debug/replay_controller.hpp"
#include "internal/debug/trace_analyzer.hpp"
#include "internal/debug/trace_exporter.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;
namespace v1 = graphflow::v1;

namespace {

engine::ExecutionInfo Info(const std::string& execution_id = "exec") {
  engine::ExecutionInfo info;
  info.workflow_id  = "wf";
  info.execution_id = execution_id;
  info.tenant_id    = "tenant";
  return info;
}

state::State At(const std::string& node, const std::string& key = {}) {
  auto s = state::State::Create("wf", "exec", "tenant", {});
  if (!key.empty()) s.Set(key, util::StringValue(node));
  s.SetCurrentNode(node);
  return s;
}

// started, A (slow), A->B, B fails, finished
void RecordFailedRun(debug::TraceRecorder& recorder, const std::string& execution_id = "exec") {
  auto info = Info(execution_id);
  recorder.OnExecutionStarted(info, At(""));
  recorder.OnNodeEnter(info, "A", At("A"));
  recorder.OnNodeExit(info, "A", At("A", "y"), 1500ms);
  recorder.OnStateChange(info, "A", At("A", "y"));
  recorder.OnEdge(info, "A", "B", 0.8, "selected B");
  recorder.OnNodeEnter(info, "B", At("B", "y"));
  recorder.OnNodeError(info, "B", At("B", "y"), "bad input", 20ms);
  recorder.OnExecutionFinished(info, v1::EXECUTION_STATUS_FAILED, At("B", "y"), "bad input");
}

debug::TraceRecorderOptions InMemory() {
  debug::TraceRecorderOptions options;
  options.persist = false;
  return options;
}

void TestSequencesAndMetrics() {
  debug::TraceRecorder recorder(nullptr, InMemory());
  RecordFailedRun(recorder);

  auto trace = recorder.GetTrace("exec");
  assert(trace);
  assert(trace->workflow_id == "wf");
  assert(trace->status == debug::TraceStatus::kFailed);
  assert(trace->finished_at.has_value());
  assert(trace->events.size() == 8);

  uint64_t expected = 1;
  for (const auto& event : trace->events) assert(event.sequence() == expected++);

  assert(trace->node_metrics.at("A").count == 1);
  assert(trace->node_metrics.at("A").total == 1500ms);
  assert(trace->node_metrics.at("A").AverageMs() == 1500.0);
  assert(trace->node_metrics.at("B").errors == 1);
  assert(!trace->snapshots.empty());

  assert(!recorder.GetTrace("other"));
  bool threw = false;
  try {
    recorder.LoadTrace("other");
  } catch (const util::ReplayError&) {
    threw = true;
  }
  assert(threw);
}

void TestBoundedEventLog() {
  auto options             = InMemory();
  options.max_trace_events = 5;
  debug::TraceRecorder recorder(nullptr, options);

  for (int i = 0; i < 10; ++i) recorder.Record("exec", v1::TRACE_EVENT_SYSTEM_EVENT, "n" + std::to_string(i));
  auto trace = recorder.GetTrace("exec");
  assert(trace->events.size() == 5);
  assert(trace->dropped_events == 5);
  assert(trace->events.front().sequence() == 6);
  assert(trace->next_sequence == 11);
}

void TestReplay() {
  debug::TraceRecorder recorder(nullptr, InMemory());
  RecordFailedRun(recorder);

  debug::ReplayController  replay(recorder.LoadTrace("exec"));
  std::vector<std::string> entered;
  std::size_t              seen = 0;
  replay.OnEvent(v1::TRACE_EVENT_NODE_ENTER, [&](const v1::TraceEvent& e) { entered.push_back(e.node_id()); });
  replay.OnAnyEvent([&](const v1::TraceEvent&) { ++seen; });

  assert(replay.State() == debug::ReplayState::kReady);
  assert(replay.Size() == 8);
  assert(!replay.CurrentEvent());

  while (replay.StepForward()) {
  }
  assert((entered == std::vector<std::string>{"A", "B"}));
  assert(seen == 8);
  assert(replay.Position() == replay.Size());
  assert(replay.State() == debug::ReplayState::kFinished);
  assert((replay.VisitedNodes() == std::vector<std::string>{"A", "B"}));
  assert(replay.VariablesAtPosition().fields().at("y").string_value() == "A");

  // moving backward never calls handlers
  auto back = replay.StepBackward();
  assert(back && back->sequence() == 7);
  assert(replay.Position() == 7);
  assert(seen == 8);

  replay.JumpToEvent(2);
  assert(replay.Position() == 2);
  assert((replay.VisitedNodes() == std::vector<std::string>{"A"}));
  assert(replay.CurrentEvent()->type() == v1::TRACE_EVENT_NODE_ENTER);

  bool threw = false;
  try {
    replay.JumpToEvent(999);
  } catch (const util::ReplayError&) {
    threw = true;
  }
  assert(threw);

  replay.Reset();
  assert(replay.Position() == 0);
  entered.clear();
  replay.Play(100.0);
  assert(replay.Speed() == 10.0);
  assert(replay.WaitUntilFinished(5s));
  assert(replay.State() == debug::ReplayState::kFinished);
  assert((entered == std::vector<std::string>{"A", "B"}));

  // pausing a finished replay changes nothing
  replay.Pause();
  assert(replay.State() == debug::ReplayState::kFinished);
  assert(debug::ReplayStateName(replay.State()) == "FINISHED");
}

void TestAnalyzer() {
  debug::TraceRecorder recorder(nullptr, InMemory());
  RecordFailedRun(recorder);

  auto analysis = debug::TraceAnalyzer().Analyze(*recorder.GetTrace("exec"));
  assert(analysis.execution_id == "exec");
  assert(analysis.status == debug::TraceStatus::kFailed);
  assert(analysis.event_count == 8);
  assert((analysis.critical_path == std::vector<std::string>{"A", "B"}));
  assert(analysis.bottlenecks.size() == 1);
  assert(analysis.bottlenecks[0].node_id == "A");
  assert(analysis.bottlenecks[0].average_ms == 1500.0);
  assert(analysis.errors.size() == 1);
  assert(analysis.errors[0].node_id() == "B");
  assert(analysis.visit_counts.at("A") == 1);
  assert(analysis.average_node_ms == 760.0);

  auto strict = debug::TraceAnalyzer(10ms).Analyze(*recorder.GetTrace("exec"));
  assert(strict.bottlenecks.size() == 2);
  assert(strict.bottlenecks[0].node_id == "A");

  auto summary = debug::ToStruct(analysis);
  assert(summary.fields().count("critical_path") == 1);
}

void TestExports() {
  debug::TraceRecorder recorder(nullptr, InMemory());
  RecordFailedRun(recorder);
  auto trace = *recorder.GetTrace("exec");

  assert(debug::EventTypeName(v1::TRACE_EVENT_NODE_ENTER) == "NODE_ENTER");
  assert(debug::ParseExportFormat("chrome_trace") == debug::ExportFormat::kChromeTrace);
  bool threw = false;
  try {
    debug::ParseExportFormat("xml");
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  auto csv = debug::Export(trace, debug::ExportFormat::kCsv);
  std::istringstream       lines(csv);
  std::vector<std::string> rows;
  for (std::string line; std::getline(lines, line);) rows.push_back(line);
  assert(rows.size() == 9);
  assert(rows[0] == "EventID,Type,NodeID,Timestamp,SequenceNumber");
  assert(rows[2].find(",NODE_ENTER,A,") != std::string::npos);

  google::protobuf::ListValue json;
  assert(google::protobuf::util::JsonStringToMessage(debug::ExportJson(trace), &json).ok());
  assert(json.values_size() == 8);
  assert(json.values(1).struct_value().fields().at("type").string_value() == "NODE_ENTER");
  assert(json.values(1).struct_value().fields().at("nodeId").string_value() == "A");

  google::protobuf::ListValue chrome;
  assert(google::protobuf::util::JsonStringToMessage(debug::ExportChromeTrace(trace), &chrome).ok());
  assert(chrome.values_size() == 8);
  const auto& exit = chrome.values(2).struct_value().fields();
  assert(exit.at("ph").string_value() == "X");
  assert(exit.at("name").string_value() == "A");
  assert(exit.at("dur").number_value() == 1500000.0);
}

void TestPersistedTraceReloads() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();

  debug::TraceRecorderOptions options;
  options.batch_size = 3;
  {
    debug::TraceRecorder recorder(repository, options);
    recorder.Start();
    RecordFailedRun(recorder, "persisted");
    recorder.Flush();
    recorder.Stop();
  }

  debug::TraceRecorder fresh(repository, options);
  auto                 trace = fresh.LoadTrace("persisted");
  assert(trace.workflow_id == "wf");
  assert(trace.events.size() == 8);
  assert(trace.status == debug::TraceStatus::kFailed);
  assert(trace.node_metrics.at("A").total == 1500ms);

  std::this_thread::sleep_for(5ms);
  fresh.CleanupTraces(0ms);
  bool threw = false;
  try {
    debug::TraceRecorder(repository, options).LoadTrace("persisted");
  } catch (const util::ReplayError&) {
    threw = true;
  }
  assert(threw);
}

void TestPersistedTraceIsBounded() {
  auto repository = std::make_shared<db::memory::MemoryRepository>();

  debug::TraceRecorderOptions options;
  {
    debug::TraceRecorder recorder(repository, options);
    recorder.Start();
    RecordFailedRun(recorder, "long");
    recorder.Flush();
    recorder.Stop();
  }

  options.max_trace_events = 5;
  debug::TraceRecorder fresh(repository, options);
  auto                 trace = fresh.LoadTrace("long");
  assert(trace.events.size() == 5);
  assert(trace.dropped_events == 3);
  assert(trace.events.front().sequence() == 4);
  assert(trace.next_sequence == 9);
  assert(trace.workflow_id == "wf");
  assert(trace.status == debug::TraceStatus::kFailed);
  assert(trace.node_metrics.at("A").total == 1500ms);
}

void TestReplayReproducesExecution() {
  auto                  repository = std::make_shared<db::memory::MemoryRepository>();
  async::WorkerPool     pool(4, "trace-test");
  async::TimerService   timer;
  pool.Start();
  timer.Start();

  auto recorder = std::make_shared<debug::TraceRecorder>(nullptr, InMemory());

  engine::EngineDependencies deps;
  deps.executor = &pool;
  deps.timer    = &timer;
  deps.store    = std::make_shared<state::StateStore>(repository, std::make_shared<storage::RamArrowStore>(), pool);
  deps.router   = std::make_shared<router::ConditionalRouter>(nullptr, nullptr, pool, &timer);
  engine::WorkflowEngine engine(std::move(deps));
  engine.AddObserver(recorder);

  auto step = [](const std::string& key) {
    return graph::SyncNode([key](state::State s) {
      s.Set(key, util::BoolValue(true));
      return s;
    });
  };
  auto wf = graph::WorkflowBuilder("replayable")
                .AddNode("intake", step("intake"))
                .AddNode("check", step("check"))
                .AddNode("approve", step("approve"))
                .AddNode("reject", step("reject"))
                .AddEdge("intake", "check")
                .AddEdge("check", "approve", {graph::conditions::KeyExists("check")}, graph::RoutingStrategy::kWeighted, 0.9)
                .AddEdge("check", "reject", {graph::conditions::KeyExists("missing")}, graph::RoutingStrategy::kWeighted, 0.9)
                .AddEdge("approve", graph::kEndNode)
                .AddEdge("reject", graph::kEndNode)
                .Build();

  auto handle = engine.Execute(wf);
  auto result = handle.result.Get();

  auto trace = recorder->LoadTrace(handle.execution_id);
  assert(trace.status == debug::TraceStatus::kCompleted);

  debug::ReplayController replay(trace);
  replay.JumpToEvent(trace.events.back().sequence());
  assert((result.Path() == std::vector<std::string>{"intake", "check", "approve"}));
  assert(replay.VisitedNodes() == result.Path());

  timer.Stop();
  pool.Stop();
}

} // namespace

int main() {
  TestSequencesAndMetrics();
  TestBoundedEventLog();
  TestReplay();
  TestAnalyzer();
  TestExports();
  TestPersistedTraceReloads();
  TestPersistedTraceIsBounded();
  TestReplayReproducesExecution();

  std::cout << "trace_test: pass\n";
  return 0;
}
