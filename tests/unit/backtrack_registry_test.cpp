#include "internal/router/backtrack_registry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/router/routing_history.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;

namespace {

router::BacktrackPoint MakePoint(const std::string& node, std::vector<std::pair<std::string, double>> alternatives) {
  auto state = state::State::Create("wf", "exec", "tenant", {});
  state.Set("at", util::StringValue(node));

  router::BacktrackPoint point;
  point.execution_id = "exec";
  point.node_id      = node;
  point.state        = state;
  point.alternatives = std::move(alternatives);
  return point;
}

void TestAlternativesInScoreOrder() {
  router::BacktrackRegistry registry;
  registry.Save(MakePoint("A", {{"B", 0.78}, {"C", 0.71}, {"D", 0.64}}));

  auto first = registry.Backtrack("exec", "B");
  assert(first.success);
  assert(first.from_node == "A");
  assert(first.next_node == "C");
  assert(first.state && first.state->Get("at")->string_value() == "A");
  assert(first.state->Version() == 2);

  auto second = registry.Backtrack("exec", "C");
  assert(second.success && second.next_node == "D");

  auto exhausted = registry.Backtrack("exec", "D");
  assert(!exhausted.success);
  assert(exhausted.message == "All alternative paths have been tried");
  assert(registry.PointCount("exec") == 0);

  auto none = registry.Backtrack("exec", "D");
  assert(!none.success);
  assert(none.message == "No backtrack points available");
}

void TestFailureBelowTheDecision() {
  router::BacktrackRegistry registry;
  auto                      point = MakePoint("A", {{"B", 0.9}, {"C", 0.8}, {"E", 0.7}});
  point.chosen                    = "B";
  registry.Save(point);
  assert(registry.Latest("exec")->tried.count("B") == 1);

  // A -> B -> D, D fails: the taken branch B must not be offered again
  auto first = registry.Backtrack("exec", "D");
  assert(first.success && first.next_node == "C");

  // A -> C -> D fails again
  auto second = registry.Backtrack("exec", "D");
  assert(second.success && second.next_node == "E");

  auto exhausted = registry.Backtrack("exec", "D");
  assert(!exhausted.success);
  assert(exhausted.message == "All alternative paths have been tried");
  assert(registry.PointCount("exec") == 0);
}

void TestExhaustedPointFallsThrough() {
  router::BacktrackRegistry registry;
  registry.Save(MakePoint("A", {{"B", 0.8}, {"C", 0.6}}));
  registry.Save(MakePoint("B", {{"X", 0.9}}));
  assert(registry.PointCount("exec") == 2);
  assert(registry.Latest("exec")->node_id == "B");

  // newest point has nothing left besides the node that failed
  assert(!registry.Backtrack("exec", "X").success);
  assert(registry.PointCount("exec") == 1);

  auto older = registry.Backtrack("exec", "B");
  assert(older.success);
  assert(older.from_node == "A");
  assert(older.next_node == "C");
}

void TestCleanupAndClear() {
  router::BacktrackRegistry registry;
  auto                      old = MakePoint("A", {{"B", 0.5}});
  old.created_at                = util::Now() - std::chrono::hours(2);
  registry.Save(old);
  registry.Save(MakePoint("C", {{"D", 0.5}}));

  auto other         = MakePoint("E", {{"F", 0.5}});
  other.execution_id = "other";
  registry.Save(other);
  assert(registry.TotalPoints() == 3);

  assert(registry.CleanupOlderThan(std::chrono::hours(1)) == 1);
  assert(registry.PointCount("exec") == 1);

  registry.ClearExecution("exec");
  assert(registry.PointCount("exec") == 0);
  assert(registry.TotalPoints() == 1);
}

void TestRoutingHistory() {
  router::RoutingHistory history;
  assert(!history.SuccessRate("a", "b"));
  assert(history.SuccessRateOr("a", "b", 0.5) == 0.5);

  history.RecordOutcome("a", "b", true, 0.9);
  history.RecordOutcome("a", "b", false, 0.5);
  history.RecordOutcome("a", "b", true, 0.7);

  assert(*history.SuccessRate("a", "b") > 0.66 && *history.SuccessRate("a", "b") < 0.67);
  assert(*history.AverageConfidence("a", "b") > 0.69 && *history.AverageConfidence("a", "b") < 0.71);
  assert(history.Get("a", "b")->attempts == 3);
  assert(!history.Get("b", "a"));
  assert(history.Size() == 1);

  history.Clear();
  assert(history.Size() == 0);
}

void TestConcurrentOutcomes() {
  router::RoutingHistory   history;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&history, t] {
      for (int i = 0; i < 250; ++i) history.RecordOutcome("a", "b", (i + t) % 2 == 0, 1.0);
    });
  }
  for (auto& thread : threads) thread.join();
  assert(history.Get("a", "b")->attempts == 1000);
  assert(*history.SuccessRate("a", "b") == 0.5);
}

} // namespace

int main() {
  TestAlternativesInScoreOrder();
  TestFailureBelowTheDecision();
  TestExhaustedPointFallsThrough();
  TestCleanupAndClear();
  TestRoutingHistory();
  TestConcurrentOutcomes();

  std::cout << "backtrack_registry_test: pass\n";
  return 0;
}
