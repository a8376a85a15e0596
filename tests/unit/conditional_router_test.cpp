#include "internal/router/conditional_router.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/async/executor.hpp"
#include "internal/async/timer_service.hpp"
#include "internal/graph/edge.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;
using namespace std::chrono_literals;
using graph::Edge;
using graph::RoutingStrategy;

namespace {

state::State MakeState() {
  google::protobuf::Struct data;
  (*data.mutable_fields())["ready"] = util::BoolValue(true);
  (*data.mutable_fields())["score"] = util::NumberValue(10);
  return state::State::Create("wf", "exec", "tenant", data);
}

Edge MakeEdge(const std::string& to, std::vector<graph::Condition> conditions, RoutingStrategy strategy = RoutingStrategy::kSimple,
              double priority = 1.0) {
  Edge edge;
  edge.from       = "A";
  edge.to         = to;
  edge.conditions = std::move(conditions);
  edge.strategy   = strategy;
  edge.priority   = priority;
  return edge;
}

graph::Condition Satisfied() {
  return graph::conditions::KeyEquals("ready", util::BoolValue(true));
}

graph::Condition Unsatisfied() {
  return graph::conditions::KeyExists("missing");
}

class FixedAdvisor final : public router::RoutingAdvisor {
 public:
  explicit FixedAdvisor(std::string target) : target_(std::move(target)) {
  }

  async::Future<router::Recommendation> Recommend(const router::RoutingContext& context) override {
    last_context = context;
    ++calls;
    return async::MakeReady(router::Recommendation{target_, 0.9, "looks right"});
  }

  router::RoutingContext last_context;
  int                    calls = 0;

 private:
  std::string target_;
};

// Never answers; the promise is kept so the future stays pending.
class SilentAdvisor final : public router::RoutingAdvisor {
 public:
  async::Future<router::Recommendation> Recommend(const router::RoutingContext&) override {
    return pending_.GetFuture();
  }

 private:
  async::Promise<router::Recommendation> pending_;
};

class FailingAdvisor final : public router::RoutingAdvisor {
 public:
  async::Future<router::Recommendation> Recommend(const router::RoutingContext&) override {
    return async::MakeFailed<router::Recommendation>(std::make_exception_ptr(util::InvalidState("model offline")));
  }
};

router::ConditionalRouter MakeRouter(async::Executor& executor, router::RoutingAdvisorPtr advisor = nullptr,
                                     async::TimerService* timer = nullptr, router::RouterOptions options = {}) {
  return router::ConditionalRouter(nullptr, nullptr, executor, timer, std::move(advisor), options);
}

void TestSatisfiedHighPriorityWins() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);
  auto                  state  = MakeState();

  std::vector<Edge> edges{MakeEdge("B", {Satisfied()}, RoutingStrategy::kSimple, 0.9),
                          MakeEdge("C", {Unsatisfied()}, RoutingStrategy::kSimple, 0.3)};

  auto decision = router.RouteSync("A", edges, state);
  assert(decision.next_node == "B");
  assert(decision.confidence >= 0.5);
  assert(decision.alternatives.size() == 2);
  for (const auto& [target, score] : decision.alternatives) {
    assert(score >= 0.0 && score <= 1.0);
  }
  assert(!decision.ai_consulted);
  assert(decision.explanation.find("selected B") != std::string::npos);
}

void TestRoutingIsDeterministic() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);
  auto                  state  = MakeState();

  std::vector<Edge> edges{MakeEdge("B", {Satisfied(), Unsatisfied()}), MakeEdge("C", {Satisfied()}, RoutingStrategy::kWeighted, 0.5),
                          MakeEdge("D", {}, RoutingStrategy::kSimple, 0.4)};

  auto first  = router.RouteSync("A", edges, state);
  auto second = router.RouteSync("A", edges, state);
  assert(first.next_node == second.next_node);
  assert(first.confidence == second.confidence);
  assert(first.alternatives == second.alternatives);
}

void TestEarlierEdgeWinsTies() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  std::vector<Edge> edges{MakeEdge("first", {}), MakeEdge("second", {})};
  assert(router.RouteSync("A", edges, MakeState()).next_node == "first");
}

void TestParallelEdgesAreBranchTargets() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  std::vector<Edge> edges{MakeEdge("p1", {Satisfied()}, RoutingStrategy::kParallel),
                          MakeEdge("p2", {}, RoutingStrategy::kParallel),
                          MakeEdge("skipped", {Unsatisfied()}, RoutingStrategy::kParallel),
                          MakeEdge("join", {})};

  auto decision = router.RouteSync("A", edges, MakeState());
  assert(decision.next_node == "join");
  assert((decision.parallel_nodes == std::vector<std::string>{"p1", "p2"}));
  assert(decision.alternatives.size() == 1);

  std::vector<Edge> only_parallel{MakeEdge("p1", {}, RoutingStrategy::kParallel), MakeEdge("p2", {}, RoutingStrategy::kParallel)};
  auto              fan_out = router.RouteSync("A", only_parallel, MakeState());
  assert(fan_out.next_node.empty());
  assert(fan_out.parallel_nodes.size() == 2);
  assert(fan_out.strategy == RoutingStrategy::kParallel);
}

void TestExclusiveBoost() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  std::vector<Edge> edges{MakeEdge("plain", {}, RoutingStrategy::kSimple, 0.6), MakeEdge("exclusive", {}, RoutingStrategy::kExclusive, 0.6)};
  auto              decision = router.RouteSync("A", edges, MakeState());
  assert(decision.next_node == "exclusive");
  assert(decision.strategy == RoutingStrategy::kExclusive);
  assert(decision.confidence <= 1.0);
}

void TestProbabilisticIsSeeded() {
  async::InlineExecutor executor;
  router::RouterOptions options;
  options.random_seed = 42;

  std::vector<Edge> edges{MakeEdge("x", {}, RoutingStrategy::kProbabilistic, 0.5), MakeEdge("y", {}, RoutingStrategy::kProbabilistic, 0.5)};

  auto r1 = MakeRouter(executor, nullptr, nullptr, options);
  auto r2 = MakeRouter(executor, nullptr, nullptr, options);
  for (int i = 0; i < 5; ++i) {
    auto a = r1.RouteSync("A", edges, MakeState());
    auto b = r2.RouteSync("A", edges, MakeState());
    assert(a.next_node == b.next_node);
    assert(a.confidence == b.confidence);
    assert(a.confidence >= 0.0 && a.confidence <= 1.0);
  }
}

void TestNoValidRoute() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  bool threw = false;
  try {
    router.RouteSync("A", {}, MakeState());
  } catch (const util::NoValidRouteError&) {
    threw = true;
  }
  assert(threw);

  router::RouterOptions options;
  options.history_weight = 0.0;
  auto strict            = MakeRouter(executor, nullptr, nullptr, options);

  threw = false;
  try {
    strict.RouteSync("A", {MakeEdge("B", {Unsatisfied()}), MakeEdge("C", {Unsatisfied()})}, MakeState());
  } catch (const util::NoValidRouteError&) {
    threw = true;
  }
  assert(threw);

  // default blend: an unsatisfied edge with no history keeps 0.3 * 0.5
  auto floor = router.RouteSync("A", {MakeEdge("B", {Unsatisfied()})}, MakeState());
  assert(floor.next_node == "B");
  assert(std::abs(floor.confidence - 0.15) < 1e-9);

  // once the edge has only failed, nothing is left to blend in
  router.RecordOutcome("A", "B", false, 0.15);
  threw = false;
  try {
    router.RouteSync("A", {MakeEdge("B", {Unsatisfied()})}, MakeState());
  } catch (const util::NoValidRouteError&) {
    threw = true;
  }
  assert(threw);
}

void TestHistoryShiftsScores() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  std::vector<Edge> edges{MakeEdge("B", {}, RoutingStrategy::kSimple, 0.5), MakeEdge("C", {}, RoutingStrategy::kSimple, 0.5)};
  for (int i = 0; i < 4; ++i) {
    router.RecordOutcome("A", "B", false, 0.5);
    router.RecordOutcome("A", "C", true, 0.5);
  }
  assert(router.RouteSync("A", edges, MakeState()).next_node == "C");
}

void TestBacktrackFlag() {
  async::InlineExecutor executor;
  auto                  router = MakeRouter(executor);

  std::vector<Edge> close{MakeEdge("B", {}, RoutingStrategy::kSimple, 0.9), MakeEdge("C", {}, RoutingStrategy::kSimple, 0.8),
                          MakeEdge("D", {}, RoutingStrategy::kSimple, 0.7)};
  assert(router.RouteSync("A", close, MakeState()).requires_backtrack_point);

  std::vector<Edge> pair{MakeEdge("B", {}, RoutingStrategy::kSimple, 0.9), MakeEdge("C", {}, RoutingStrategy::kSimple, 0.8)};
  assert(!router.RouteSync("A", pair, MakeState()).requires_backtrack_point);
}

void TestAdvisorNudge() {
  async::InlineExecutor executor;
  auto                  advisor = std::make_shared<FixedAdvisor>("C");
  auto                  router  = MakeRouter(executor, advisor);

  auto state = MakeState();
  state.AppendPath("start");
  state.AppendPath("A");

  std::vector<Edge> edges{MakeEdge("B", {}, RoutingStrategy::kAiAssisted, 0.6), MakeEdge("C", {}, RoutingStrategy::kAiAssisted, 0.55)};
  auto              decision = router.Route("A", edges, state).Get();
  assert(advisor->calls == 1);
  assert(decision.ai_consulted);
  assert(decision.next_node == "C");
  assert(decision.explanation.find("advisor recommended C") != std::string::npos);

  const auto& ctx = advisor->last_context;
  assert(ctx.current_node == "A");
  assert(ctx.candidates.size() == 2);
  assert((ctx.recent_path == std::vector<std::string>{"start", "A"}));
  assert(ctx.Prompt().find("Candidates:") != std::string::npos);

  // a nudge is not an override
  std::vector<Edge> lopsided{MakeEdge("B", {}, RoutingStrategy::kAiAssisted, 1.0), MakeEdge("C", {}, RoutingStrategy::kAiAssisted, 0.1)};
  assert(router.Route("A", lopsided, state).Get().next_node == "B");
}

void TestAdvisorNotConsultedWithoutAiEdges() {
  async::InlineExecutor executor;
  auto                  advisor = std::make_shared<FixedAdvisor>("C");
  auto                  router  = MakeRouter(executor, advisor);

  router.RouteSync("A", {MakeEdge("B", {}), MakeEdge("C", {})}, MakeState());
  assert(advisor->calls == 0);
}

void TestAdvisorFallbacks() {
  async::InlineExecutor executor;
  std::vector<Edge>     edges{MakeEdge("B", {}, RoutingStrategy::kAiAssisted, 0.6), MakeEdge("C", {}, RoutingStrategy::kAiAssisted, 0.55)};

  auto unknown  = MakeRouter(executor, std::make_shared<FixedAdvisor>("Z"));
  auto decision = unknown.Route("A", edges, MakeState()).Get();
  assert(decision.next_node == "B");
  assert(decision.ai_consulted);
  assert(decision.explanation.find("advisor unavailable") != std::string::npos);

  auto failing = MakeRouter(executor, std::make_shared<FailingAdvisor>());
  decision     = failing.Route("A", edges, MakeState()).Get();
  assert(decision.next_node == "B");
  assert(decision.explanation.find("model offline") != std::string::npos);
}

void TestAdvisorTimeout() {
  async::InlineExecutor executor;
  async::TimerService   timer;
  timer.Start();

  router::RouterOptions options;
  options.ai_timeout = 50ms;
  auto router        = MakeRouter(executor, std::make_shared<SilentAdvisor>(), &timer, options);

  std::vector<Edge> edges{MakeEdge("B", {}, RoutingStrategy::kAiAssisted, 0.6), MakeEdge("C", {}, RoutingStrategy::kAiAssisted, 0.55)};

  auto start    = std::chrono::steady_clock::now();
  auto decision = router.Route("A", edges, MakeState()).Get();
  assert(decision.next_node == "B");
  assert(decision.explanation.find("timed out") != std::string::npos);
  assert(std::chrono::steady_clock::now() - start < 2s);

  timer.Stop();
}

void TestParseRecommendation() {
  std::vector<std::string> candidates{"review", "publish"};

  auto bare = router::ParseRecommendation("publish\nThe draft is complete.", candidates);
  assert(bare && bare->target == "publish");
  assert(bare->reasoning == "The draft is complete.");

  auto marked = router::ParseRecommendation("I think so.\nI recommend review.", candidates);
  assert(marked && marked->target == "review");

  assert(!router::ParseRecommendation("no idea", candidates));
}

} // namespace

int main() {
  TestSatisfiedHighPriorityWins();
  TestRoutingIsDeterministic();
  TestEarlierEdgeWinsTies();
  TestParallelEdgesAreBranchTargets();
  TestExclusiveBoost();
  TestProbabilisticIsSeeded();
  TestNoValidRoute();
  TestHistoryShiftsScores();
  TestBacktrackFlag();
  TestAdvisorNudge();
  TestAdvisorNotConsultedWithoutAiEdges();
  TestAdvisorFallbacks();
  TestAdvisorTimeout();
  TestParseRecommendation();

  std::cout << "conditional_router_test: pass\n";
  return 0;
}
