#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;
namespace v1 = graphflow::v1;

namespace {

graphflow::runtime::config::RuntimeConfig ShortRetentionConfig() {
  return config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: warn
database:
  memory: {}
engine:
  worker_threads: 2
debugger:
  persist_batch_size: 1
  trace_retention: "0.001s"
maintenance:
  interval: "0.01s"
  state_retention: "0.001s"
  backtrack_max_age: "0.001s"
)");
}

graph::WorkflowDefinitionPtr TwoStep() {
  return graph::WorkflowBuilder("two-step")
      .AddNode("A", graph::SyncNode([](state::State s) {
                 s.Set("a", util::NumberValue(1));
                 return s;
               }))
      .AddNode("B", graph::SyncNode([](state::State s) {
                 s.Set("b", util::NumberValue(2));
                 return s;
               }))
      .AddEdge("A", "B")
      .AddEdge("B", graph::kEndNode)
      .Build();
}

void TestRuntimeRunsWorkflow() {
  auto rt = factory::BuildRuntime(ShortRetentionConfig());
  assert(rt.engine && rt.store && rt.recorder && rt.debugger && rt.maintenance);

  auto handle = rt.engine->Execute(TwoStep());
  auto result = handle.result.Get();
  assert((result.Path() == std::vector<std::string>{"A", "B"}));
  assert(result.Get("b")->number_value() == 2);

  // AUTO checkpoint after every node
  assert(rt.store->ListCheckpoints(handle.execution_id).size() == 2);

  auto trace = rt.recorder->GetTrace(handle.execution_id);
  assert(trace && trace->status == debug::TraceStatus::kCompleted);

  rt.recorder->Flush();
  auto reloaded = rt.recorder->LoadTrace(handle.execution_id);
  assert(reloaded.events.size() == trace->events.size());
}

void TestMaintenancePassEnforcesRetention() {
  auto rt = factory::BuildRuntime(ShortRetentionConfig());

  auto handle = rt.engine->Execute(TwoStep());
  handle.result.Get();
  rt.recorder->Flush();

  std::this_thread::sleep_for(20ms);
  auto report = rt.maintenance->RunOnce();
  assert(report.states_removed >= 4); // two checkpoints plus their state versions
  assert(report.traces_removed == 1);
  assert(report.executions_pruned == 1);

  assert(rt.store->ListCheckpoints(handle.execution_id).empty());
  assert(!rt.engine->GetStatus(handle.execution_id));
  assert(!rt.recorder->GetTrace(handle.execution_id));

  // a second pass has nothing left to do
  auto again = rt.maintenance->RunOnce();
  assert(again.states_removed == 0 && again.traces_removed == 0 && again.executions_pruned == 0);
}

void TestBackgroundWorkerAndShutdown() {
  auto rt = factory::BuildRuntime(ShortRetentionConfig());
  rt.maintenance->Start();
  rt.maintenance->Start(); // idempotent

  auto handle = rt.engine->Execute(TwoStep());
  handle.result.Get();

  // the background pass eventually forgets the finished execution
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (rt.engine->GetStatus(handle.execution_id) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  assert(!rt.engine->GetStatus(handle.execution_id));

  rt.Shutdown();
  assert(!rt.engine && !rt.maintenance && !rt.repository);
  rt.Shutdown(); // safe to repeat
}

void TestBuildRepositoryRejectsDisabledBackend() {
#if !GRAPHFLOW_DB_POSTGRES
  graphflow::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri("postgresql://localhost/graphflow");

  bool threw = false;
  try {
    (void)factory::BuildRepository(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
#endif
}

} // namespace

int main() {
  TestRuntimeRunsWorkflow();
  TestMaintenancePassEnforcesRetention();
  TestBackgroundWorkerAndShutdown();
  TestBuildRepositoryRejectsDisabledBackend();

  std::cout << "runtime_test: pass\n";
  return 0;
}
