#include "internal/debug/workflow_debugger.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/async/timer_service.hpp"
#include "internal/async/worker_pool.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/storage/ram/ram_arrow_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;
namespace v1 = graphflow::v1;
using debug::CommandType;
using debug::DebugCommand;
using engine::EnterDirective;

namespace {

std::shared_ptr<debug::TraceRecorder> MakeRecorder() {
  debug::TraceRecorderOptions options;
  options.persist = false;
  return std::make_shared<debug::TraceRecorder>(nullptr, options);
}

state::State StateWith(const std::string& key, google::protobuf::Value value, const std::string& branch = {}) {
  google::protobuf::Struct data;
  (*data.mutable_fields())[key] = std::move(value);
  auto s                        = state::State::Create("wf", "exec", "tenant", data);
  return branch.empty() ? s : s.Fork(branch);
}

state::State Plain(const std::string& branch = {}) {
  return StateWith("x", util::NumberValue(1), branch);
}

std::size_t CountEvents(debug::TraceRecorder& recorder, v1::TraceEventType type) {
  auto        trace = recorder.GetTrace("exec");
  std::size_t n     = 0;
  if (!trace) return 0;
  for (const auto& e : trace->events) {
    if (e.type() == type) ++n;
  }
  return n;
}

void TestNodeBreakpointPausesAndContinues() {
  auto                recorder = MakeRecorder();
  debug::DebugSession session("s1", "exec", debug::DebugMode::kBreakpoint, recorder);
  auto                bp = session.Breakpoints().Add(debug::breakpoints::Node("B"));

  std::string paused_at;
  session.SetPauseListener([&](const debug::PauseInfo& info) { paused_at = info.node_id; });

  assert(session.BeforeNode("A", Plain()).IsReady());
  assert(session.State() == debug::SessionState::kRunning);

  auto held = session.BeforeNode("B", Plain());
  assert(!held.IsReady());
  assert(session.State() == debug::SessionState::kPaused);
  assert(paused_at == "B");

  auto pause = session.CurrentPause();
  assert(pause && pause->reason == "breakpoint");
  assert(pause->breakpoint_ids.size() == 1 && pause->breakpoint_ids[0] == bp.id());
  assert(session.Breakpoints().Get(bp.id())->hit_count() == 1);
  assert(CountEvents(*recorder, v1::TRACE_EVENT_BREAKPOINT_HIT) == 1);

  auto result = session.Execute(DebugCommand::Simple(CommandType::kContinue));
  assert(result.success);
  assert(held.IsReady());
  assert(held.Get().action == EnterDirective::Action::kProceed);
  assert(!held.Get().state);
  assert(session.State() == debug::SessionState::kRunning);
  assert(CountEvents(*recorder, v1::TRACE_EVENT_USER_ACTION) == 1);

  assert(!session.Execute(DebugCommand::Simple(CommandType::kContinue)).success);
}

void TestConditionAndVariableChangeBreakpoints() {
  debug::DebugSession session("s2", "exec", debug::DebugMode::kBreakpoint);
  session.Breakpoints().Add(debug::breakpoints::Condition("score == 5"));

  assert(session.BeforeNode("A", StateWith("score", util::NumberValue(4))).IsReady());
  auto held = session.BeforeNode("B", StateWith("score", util::NumberValue(5)));
  assert(!held.IsReady());
  session.Execute(DebugCommand::Simple(CommandType::kContinue));

  debug::DebugSession changes("s2b", "exec", debug::DebugMode::kBreakpoint);
  changes.Breakpoints().Add(debug::breakpoints::VariableChange("phase"));

  // the first evaluation only records the value
  assert(changes.BeforeNode("C", StateWith("phase", util::StringValue("draft"))).IsReady());
  assert(changes.BeforeNode("D", StateWith("phase", util::StringValue("draft"))).IsReady());
  held = changes.BeforeNode("E", StateWith("phase", util::StringValue("final")));
  assert(!held.IsReady());
  changes.Execute(DebugCommand::Simple(CommandType::kContinue));

  assert(debug::EvaluateCondition("score != 3", StateWith("score", util::NumberValue(5))));
  bool threw = false;
  try {
    debug::EvaluateCondition("score > 3", Plain());
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPerformanceAndEdgeBreakpoints() {
  debug::DebugSession session("s3", "exec", debug::DebugMode::kBreakpoint);
  session.Breakpoints().Add(debug::breakpoints::Performance(100, "slow"));
  session.Breakpoints().Add(debug::breakpoints::Edge("A", "B"));

  session.AfterNode("fast", Plain(), 500ms);
  assert(session.BeforeNode("next", Plain()).IsReady());

  session.AfterNode("slow", Plain(), 50ms);
  assert(session.BeforeNode("next", Plain()).IsReady());

  session.AfterNode("slow", Plain(), 250ms);
  auto held = session.BeforeNode("next", Plain());
  assert(!held.IsReady());
  session.Execute(DebugCommand::Simple(CommandType::kContinue));

  session.AfterNode("A", Plain(), 1ms);
  session.OnEdge("A", "C");
  assert(session.BeforeNode("C", Plain()).IsReady());
  session.OnEdge("A", "B");
  held = session.BeforeNode("B", Plain());
  assert(!held.IsReady());
  assert(session.CurrentPause()->node_id == "B");
  session.Execute(DebugCommand::Simple(CommandType::kContinue));
}

void TestExceptionBreakpointRecordsHit() {
  auto                recorder = MakeRecorder();
  debug::DebugSession session("s4", "exec", debug::DebugMode::kBreakpoint, recorder);
  session.Breakpoints().Add(debug::breakpoints::Exception());

  session.OnError("B", Plain(), "boom");
  assert(session.LastError() == std::optional<std::string>("boom"));
  assert(CountEvents(*recorder, v1::TRACE_EVENT_BREAKPOINT_HIT) == 1);

  session.OnFinished(v1::EXECUTION_STATUS_FAILED);
  assert(session.State() == debug::SessionState::kError);
  assert(session.WaitUntilFinished(10ms));
  assert(!session.Execute(DebugCommand::Simple(CommandType::kPause)).success);
}

void TestSteppingAcrossBranches() {
  debug::DebugSession session("s5", "exec", debug::DebugMode::kStepByStep);

  // step-by-step pauses at the very first node
  auto held = session.BeforeNode("A", Plain());
  assert(!held.IsReady());
  assert(session.CurrentPause()->reason == "step");

  session.Execute(DebugCommand::Simple(CommandType::kStepInto));
  held = session.BeforeNode("B", Plain("A-B"));
  assert(!held.IsReady());

  // step over stays on branch A-B; sibling A-C runs on
  session.Execute(DebugCommand::Simple(CommandType::kStepOver));
  assert(session.State() == debug::SessionState::kStepping);
  assert(session.BeforeNode("C", Plain("A-C")).IsReady());
  assert(session.BeforeNode("B2", Plain("A-B.B2-X")).IsReady());
  held = session.BeforeNode("B3", Plain("A-B"));
  assert(!held.IsReady());

  // step out waits for the main line
  session.Execute(DebugCommand::Simple(CommandType::kStepOut));
  assert(session.BeforeNode("B4", Plain("A-B")).IsReady());
  held = session.BeforeNode("J", Plain());
  assert(!held.IsReady());
  assert(session.CurrentPause()->reason == "step out");

  auto top = session.Execute(DebugCommand::Simple(CommandType::kStepOut));
  assert(top.success);
  assert(session.BeforeNode("K", Plain()).IsReady());
}

void TestModifyJumpRestartAndInspect() {
  debug::DebugSession session("s6", "exec", debug::DebugMode::kBreakpoint);
  session.Breakpoints().Add(debug::breakpoints::Node("B"));

  assert(!session.Execute(DebugCommand::ModifyVariable("x", util::NumberValue(9))).success);
  assert(!session.Execute(DebugCommand::InspectVariable("x")).success);

  session.BeforeNode("A", Plain());
  auto held = session.BeforeNode("B", Plain());
  auto mod  = session.Execute(DebugCommand::ModifyVariable("x", util::NumberValue(9)));
  assert(mod.success);

  auto inspect = session.Execute(DebugCommand::InspectVariable("x"));
  assert(inspect.success);
  assert(inspect.data.fields().at("found").bool_value());
  assert(inspect.data.fields().at("value").number_value() == 9);
  assert(!session.Execute(DebugCommand::InspectVariable("missing")).data.fields().at("found").bool_value());

  session.Execute(DebugCommand::Simple(CommandType::kContinue));
  auto directive = held.Get();
  assert(directive.state && directive.state->Get("x")->number_value() == 9);

  held = session.BeforeNode("B", Plain());
  assert(!session.Execute(DebugCommand::JumpToNode("")).success);
  assert(session.Execute(DebugCommand::JumpToNode("Z")).success);
  assert(held.Get().action == EnterDirective::Action::kJump);
  assert(held.Get().jump_to == "Z");

  held = session.BeforeNode("B", Plain());
  auto restart = session.Execute(DebugCommand::Simple(CommandType::kRestart));
  assert(restart.success);
  assert(held.Get().action == EnterDirective::Action::kJump);
  assert(held.Get().jump_to == "A");
  assert(session.Breakpoints().List().front().hit_count() == 0);
}

void TestPauseAndTerminate() {
  debug::DebugSession session("s7", "exec", debug::DebugMode::kBreakpoint);
  assert(session.BeforeNode("A", Plain()).IsReady());

  assert(session.Execute(DebugCommand::Simple(CommandType::kPause)).success);
  auto held = session.BeforeNode("B", Plain());
  assert(!held.IsReady());
  assert(session.CurrentPause()->reason == "pause requested");
  assert(!session.Execute(DebugCommand::Simple(CommandType::kPause)).success);

  assert(session.Execute(DebugCommand::Simple(CommandType::kTerminate)).success);
  assert(held.Get().action == EnterDirective::Action::kTerminate);
  assert(session.BeforeNode("C", Plain()).Get().action == EnterDirective::Action::kTerminate);
}

void TestBreakpointManagement() {
  auto                repository = std::make_shared<db::memory::MemoryRepository>();
  debug::DebugSession session("s8", "exec", debug::DebugMode::kBreakpoint, nullptr, repository);

  auto set = session.Execute(DebugCommand::SetBreakpoint(debug::breakpoints::Node("B")));
  assert(set.success);
  const auto id = set.data.fields().at("breakpoint_id").string_value();
  assert(session.Breakpoints().Get(id)->enabled());

  v1::Breakpoint invalid;
  invalid.set_type(v1::BREAKPOINT_TYPE_NODE);
  assert(!session.Execute(DebugCommand::SetBreakpoint(invalid)).success);

  // persisted breakpoints come back in a fresh manager for the same session
  debug::BreakpointManager reloaded("s8", repository);
  assert(reloaded.Load() == 1);
  assert(reloaded.Get(id)->node_id() == "B");

  assert(session.Breakpoints().SetEnabled(id, false));
  assert(session.BeforeNode("B", Plain()).IsReady());

  assert(session.Execute(DebugCommand::RemoveBreakpoint(id)).success);
  assert(!session.Execute(DebugCommand::RemoveBreakpoint(id)).success);
  assert(session.Breakpoints().List().empty());
}

void TestWatchAndReplayModes() {
  auto                recorder = MakeRecorder();
  debug::DebugSession watch("s9", "exec", debug::DebugMode::kWatch, recorder);
  watch.AddWatch("x");

  assert(watch.BeforeNode("A", StateWith("x", util::NumberValue(1))).IsReady());
  assert(watch.BeforeNode("B", StateWith("x", util::NumberValue(1))).IsReady());
  assert(watch.BeforeNode("C", StateWith("x", util::NumberValue(2))).IsReady());
  assert(CountEvents(*recorder, v1::TRACE_EVENT_VARIABLE_SET) == 2);
  assert(watch.WatchValues().at("x").number_value() == 2);
  assert(watch.Mode() == debug::DebugMode::kWatch);

  watch.RemoveWatch("x");
  assert(watch.WatchValues().empty());

  debug::DebugSession replay("s10", "exec", debug::DebugMode::kReplay);
  replay.Breakpoints().Add(debug::breakpoints::Node("A"));
  assert(replay.BeforeNode("A", Plain()).IsReady());
}

// ------------------------------------------------------------
// Through the engine
// ------------------------------------------------------------

struct Runtime {
  std::shared_ptr<db::Repository>          repository = std::make_shared<db::memory::MemoryRepository>();
  async::WorkerPool                        pool{4, "debug-test"};
  async::TimerService                      timer;
  std::shared_ptr<state::StateStore>       store;
  std::shared_ptr<debug::TraceRecorder>    recorder = MakeRecorder();
  std::shared_ptr<debug::WorkflowDebugger> debugger;
  std::unique_ptr<engine::WorkflowEngine>  engine;

  Runtime() {
    pool.Start();
    timer.Start();
    store    = std::make_shared<state::StateStore>(repository, std::make_shared<storage::RamArrowStore>(), pool);
    debugger = std::make_shared<debug::WorkflowDebugger>(recorder, repository);

    engine::EngineDependencies deps;
    deps.executor = &pool;
    deps.timer    = &timer;
    deps.store    = store;
    deps.router   = std::make_shared<router::ConditionalRouter>(nullptr, nullptr, pool, &timer);
    engine        = std::make_unique<engine::WorkflowEngine>(std::move(deps));
    engine->AddObserver(recorder);
    engine->AddObserver(debugger);
  }

  ~Runtime() {
    timer.Stop();
    pool.Stop();
  }
};

graph::WorkflowDefinitionPtr Linear() {
  auto copy_x = [](const std::string& key) {
    return graph::SyncNode([key](state::State s) {
      s.Set(key, *s.Get("x"));
      return s;
    });
  };
  return graph::WorkflowBuilder("debuggable")
      .AddNode("A", copy_x("a"))
      .AddNode("B", copy_x("b"))
      .AddNode("C", copy_x("c"))
      .AddEdge("A", "B")
      .AddEdge("B", "C")
      .AddEdge("C", graph::kEndNode)
      .Build();
}

google::protobuf::Struct InitialX() {
  google::protobuf::Struct data;
  (*data.mutable_fields())["x"] = util::NumberValue(1);
  return data;
}

void TestDebuggingLiveExecution() {
  Runtime rt;
  auto    session = rt.debugger->StartSession("live-1");
  session->Breakpoints().Add(debug::breakpoints::Node("B"));

  bool duplicate = false;
  try {
    rt.debugger->StartSession("live-1");
  } catch (const util::AlreadyExists&) {
    duplicate = true;
  }
  assert(duplicate);

  engine::ExecuteOptions options;
  options.execution_id = "live-1";
  auto handle          = rt.engine->Execute(Linear(), InitialX(), options);

  assert(session->WaitForPause(2s));
  assert(session->CurrentPause()->node_id == "B");
  assert(rt.engine->GetStatus("live-1")->status == v1::EXECUTION_STATUS_RUNNING);

  assert(rt.debugger->Execute(session->Id(), DebugCommand::ModifyVariable("x", util::NumberValue(42))).success);
  assert(rt.debugger->Execute(session->Id(), DebugCommand::Simple(CommandType::kContinue)).success);

  auto result = handle.result.Get();
  assert(result.Get("a")->number_value() == 1);
  assert(result.Get("b")->number_value() == 42);
  assert(result.Get("c")->number_value() == 42);
  assert(session->WaitUntilFinished(2s));
  assert(session->State() == debug::SessionState::kFinished);

  assert(!rt.debugger->Execute("nope", DebugCommand::Simple(CommandType::kContinue)).success);

  // no snapshot exists before the first node exit
  assert(!rt.debugger->StateAt("live-1", 1));
  auto snapshot = rt.debugger->StateAt("live-1", 1000);
  assert(snapshot && snapshot->state.Has("c"));
  assert(rt.debugger->EndSession(session->Id()));
  assert(!rt.debugger->SessionForExecution("live-1"));
}

void TestTerminateAndJumpThroughEngine() {
  Runtime rt;
  auto    session = rt.debugger->StartSession("live-2", debug::DebugMode::kStepByStep);
  session->Breakpoints().Add(debug::breakpoints::Node("C"));

  engine::ExecuteOptions options;
  options.execution_id = "live-2";
  auto handle          = rt.engine->Execute(Linear(), InitialX(), options);

  assert(session->WaitForPause(2s));
  assert(session->CurrentPause()->node_id == "A");
  session->Execute(DebugCommand::JumpToNode("C"));

  assert(session->WaitForPause(2s));
  assert(session->CurrentPause()->node_id == "C");
  session->Execute(DebugCommand::Simple(CommandType::kTerminate));

  bool cancelled = false;
  try {
    handle.result.Get();
  } catch (const util::ExecutionCancelled&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(rt.engine->GetStatus("live-2")->status == v1::EXECUTION_STATUS_CANCELLED);
  assert(session->WaitUntilFinished(2s));
}

void TestDetachReleasesPause() {
  Runtime rt;
  auto    session = rt.debugger->StartSession("live-3", debug::DebugMode::kStepByStep);

  engine::ExecuteOptions options;
  options.execution_id = "live-3";
  auto handle          = rt.engine->Execute(Linear(), InitialX(), options);

  assert(session->WaitForPause(2s));
  assert(rt.debugger->EndSession(session->Id()));
  assert(handle.result.Get().PathLength() == 3);
  assert(!rt.debugger->EndSession(session->Id()));
}

} // namespace

int main() {
  TestNodeBreakpointPausesAndContinues();
  TestConditionAndVariableChangeBreakpoints();
  TestPerformanceAndEdgeBreakpoints();
  TestExceptionBreakpointRecordsHit();
  TestSteppingAcrossBranches();
  TestModifyJumpRestartAndInspect();
  TestPauseAndTerminate();
  TestBreakpointManagement();
  TestWatchAndReplayModes();
  TestDebuggingLiveExecution();
  TestTerminateAndJumpThroughEngine();
  TestDetachReleasesPause();

  std::cout << "debugger_test: pass\n";
  return 0;
}
