#include <chrono>
#include <iostream>
#include <string>

#include "internal/debug/breakpoint_manager.hpp"
#include "internal/debug/trace_analyzer.hpp"
#include "internal/debug/trace_exporter.hpp"
#include "internal/factory.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;

int main() {
  graphflow::runtime::config::RuntimeConfig config;
  auto                                      rt = factory::BuildRuntime(config);

  auto definition = graph::WorkflowBuilder("pricing")
                        .AddNode("fetch", graph::SyncNode([](state::State s) {
                                   s.Set("price", util::NumberValue(100));
                                   return s;
                                 }))
                        .AddNode("discount", graph::SyncNode([](state::State s) {
                                   s.Set("price", util::NumberValue(s.Get("price")->number_value() * 0.9));
                                   return s;
                                 }))
                        .AddNode("publish", graph::SyncNode([](state::State s) {
                                   s.Set("published", util::BoolValue(true));
                                   return s;
                                 }))
                        .AddEdge("fetch", "discount")
                        .AddEdge("discount", "publish")
                        .AddEdge("publish", graph::kEndNode)
                        .Build();

  // Open the session first so the execution can pause at its first breakpoint.
  const auto execution_id = util::NewId("exec");
  auto       session      = rt.debugger->StartSession(execution_id, debug::DebugMode::kBreakpoint);
  session->Breakpoints().Add(debug::breakpoints::Node("discount"));
  session->AddWatch("price");

  engine::ExecuteOptions options;
  options.execution_id = execution_id;
  auto handle          = rt.engine->Execute(definition, {}, options);

  if (!session->WaitForPause(5s)) {
    std::cerr << "execution never paused\n";
    return 1;
  }
  auto pause = session->CurrentPause();
  std::cout << "paused at " << pause->node_id << " (" << pause->reason << "), price="
            << util::ValueToString(pause->watches["price"]) << "\n";

  // Override the input of the paused node, then let it run.
  session->Execute(debug::DebugCommand::ModifyVariable("price", util::NumberValue(200)));
  session->Execute(debug::DebugCommand::Simple(debug::CommandType::kContinue));

  auto result = handle.result.Get();
  std::cout << "final price: " << result.Get("price")->number_value() << "\n";
  rt.debugger->EndSession(session->Id());

  // Replay the recorded trace without running any node.
  auto replay = rt.debugger->CreateReplay(execution_id);
  replay->OnEvent(graphflow::v1::TRACE_EVENT_NODE_ENTER,
                  [](const graphflow::v1::TraceEvent& e) { std::cout << "  replay enter " << e.node_id() << "\n"; });
  replay->Play(10.0);
  replay->WaitUntilFinished(10s);

  auto analysis = debug::TraceAnalyzer().Analyze(rt.recorder->LoadTrace(execution_id));
  std::cout << "critical path length " << analysis.critical_path.size() << ", average node time " << analysis.average_node_ms << " ms\n";
  std::cout << debug::ExportCsv(rt.recorder->LoadTrace(execution_id));
  return 0;
}
