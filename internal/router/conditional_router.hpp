#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/async/executor.hpp"
#include "internal/async/future.hpp"
#include "internal/async/timer_service.hpp"
#include "internal/graph/edge.hpp"
#include "internal/router/backtrack_registry.hpp"
#include "internal/router/routing_advisor.hpp"
#include "internal/router/routing_history.hpp"
#include "internal/state/state.hpp"

namespace graphflow::router {

struct RouterOptions {
  double                    history_weight            = 0.3;
  double                    default_success_rate      = 0.5;
  double                    probabilistic_jitter      = 0.2;
  double                    exclusive_boost           = 1.2;
  double                    ai_nudge                  = 1.2;
  double                    close_contender_threshold = 0.3;
  std::chrono::milliseconds ai_timeout                = std::chrono::seconds(2);
  std::optional<uint64_t>   random_seed;

  static RouterOptions FromConfig(const graphflow::runtime::config::RouterConfig& cfg);
};

struct RoutingDecision {
  // Empty when only parallel targets qualified.
  std::string            next_node;
  double                 confidence = 0.0;
  graph::RoutingStrategy strategy   = graph::RoutingStrategy::kSimple;
  std::string            explanation;
  std::vector<std::string> parallel_nodes;
  // Every non-parallel candidate with its final score, in candidate order.
  std::vector<std::pair<std::string, double>> alternatives;
  bool                   requires_backtrack_point = false;
  bool                   ai_consulted             = false;
};

/*
  Scores the outgoing edges of a node and picks where execution goes next.

  Parallel edges are not competitors: every one that scores above zero
  becomes a branch target. The rest are blended with the edge's success
  history, adjusted for their strategy and clamped to [0,1]; the highest
  score wins, earlier edges winning ties.

  An edge without recorded outcomes blends in default_success_rate, so
  with the default weights even an unsatisfied edge keeps a floor of
  0.15 and still wins when nothing better exists. Route() therefore only
  finds no route when there are no edges, history_weight is 0, or every
  unsatisfied candidate has a recorded success rate of 0.

  When a candidate is AI-assisted and an advisor is configured the
  advisor is consulted under ai_timeout; its pick is nudged, never forced.
*/
class ConditionalRouter {
 public:
  ConditionalRouter(std::shared_ptr<RoutingHistory> history, std::shared_ptr<BacktrackRegistry> backtracks, async::Executor& executor,
                    async::TimerService* timer = nullptr, RoutingAdvisorPtr advisor = nullptr, RouterOptions options = {});

  // Fails with util::NoValidRouteError when no candidate scores above 0.
  async::Future<RoutingDecision> Route(const std::string& current_node, const std::vector<graph::Edge>& edges,
                                       const state::State& state);

  // Blocks; not for use on the executor's own threads.
  RoutingDecision RouteSync(const std::string& current_node, const std::vector<graph::Edge>& edges, const state::State& state);

  void            SaveBacktrackPoint(const state::State& state, const std::string& node_id, const RoutingDecision& decision);
  BacktrackResult Backtrack(const std::string& execution_id, const std::string& current_node);

  void        RecordOutcome(const std::string& from, const std::string& to, bool success, double confidence);
  std::size_t CleanupBacktrackPoints(std::chrono::milliseconds max_age);
  void        ClearExecution(const std::string& execution_id);

  RoutingHistory& History() {
    return *history_;
  }
  BacktrackRegistry& Backtracks() {
    return *backtracks_;
  }
  const RouterOptions& Options() const {
    return options_;
  }

 private:
  struct Candidate {
    graph::Edge        edge;
    double             base = 0.0;
    double             score = 0.0;
  };

  struct Scored {
    std::string              from;
    std::vector<std::string> parallel;
    std::vector<Candidate>   candidates;
    bool                     wants_advisor = false;
  };

  double BaseScore(const graph::Edge& edge, const state::State& state) const;
  double Jitter();
  Scored Score(const std::string& current_node, const std::vector<graph::Edge>& edges, const state::State& state);

  RoutingContext  BuildContext(const Scored& scored, const state::State& state) const;
  RoutingDecision Decide(Scored scored, const std::optional<Recommendation>& recommendation, const std::string& advisor_note) const;

  std::shared_ptr<RoutingHistory>    history_;
  std::shared_ptr<BacktrackRegistry> backtracks_;
  async::Executor&                   executor_;
  async::TimerService*               timer_;
  RoutingAdvisorPtr                  advisor_;
  RouterOptions                      options_;

  std::mutex      rng_mutex_;
  std::mt19937_64 rng_;
};

// Clamps to [0,1].
double ClampScore(double score);

} // namespace graphflow::router
