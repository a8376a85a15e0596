#include "conditional_router.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace graphflow::router {

using graph::RoutingStrategy;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

std::string DescribeError(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

std::string FormatScore(double score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << score;
  return out.str();
}

} // namespace

double ClampScore(double score) {
  if (!(score > 0.0)) return 0.0;
  return std::min(1.0, score);
}

RouterOptions RouterOptions::FromConfig(const graphflow::runtime::config::RouterConfig& cfg) {
  RouterOptions options;
  if (cfg.history_weight() > 0.0) options.history_weight = std::min(1.0, cfg.history_weight());
  if (cfg.default_success_rate() > 0.0) options.default_success_rate = std::min(1.0, cfg.default_success_rate());
  if (cfg.probabilistic_jitter() > 0.0) options.probabilistic_jitter = std::min(1.0, cfg.probabilistic_jitter());
  if (cfg.exclusive_boost() > 0.0) options.exclusive_boost = cfg.exclusive_boost();
  if (cfg.ai_nudge() > 0.0) options.ai_nudge = cfg.ai_nudge();
  if (cfg.close_contender_threshold() > 0.0) options.close_contender_threshold = cfg.close_contender_threshold();
  if (cfg.has_ai_timeout()) options.ai_timeout = util::ToMillis(cfg.ai_timeout(), options.ai_timeout);
  if (cfg.random_seed() != 0) options.random_seed = cfg.random_seed();
  return options;
}

ConditionalRouter::ConditionalRouter(std::shared_ptr<RoutingHistory> history, std::shared_ptr<BacktrackRegistry> backtracks,
                                     async::Executor& executor, async::TimerService* timer, RoutingAdvisorPtr advisor,
                                     RouterOptions options)
    : history_(std::move(history)),
      backtracks_(std::move(backtracks)),
      executor_(executor),
      timer_(timer),
      advisor_(std::move(advisor)),
      options_(std::move(options)) {
  if (!history_) history_ = std::make_shared<RoutingHistory>();
  if (!backtracks_) backtracks_ = std::make_shared<BacktrackRegistry>();
  rng_.seed(options_.random_seed ? *options_.random_seed : std::random_device{}());
}

// ------------------------------------------------------------
// Scoring
// ------------------------------------------------------------

double ConditionalRouter::BaseScore(const graph::Edge& edge, const state::State& state) const {
  if (edge.conditions.empty()) return ClampScore(edge.priority);

  double satisfied = 0.0;
  double total     = 0.0;
  for (const auto& condition : edge.conditions) {
    bool ok = false;
    try {
      ok = condition.predicate(state);
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("condition predicate threw",
                         {StringField("edge", edge.from + "->" + edge.to), StringField("condition", condition.name), StringField("error", e.what())});
    }
    if (ok) satisfied += condition.weight;
    total += condition.weight;
  }
  if (total <= 0.0) return 0.0;
  return ClampScore(edge.priority * (satisfied / total));
}

double ConditionalRouter::Jitter() {
  std::uniform_real_distribution<double> dist(1.0 - options_.probabilistic_jitter, 1.0 + options_.probabilistic_jitter);
  std::lock_guard                        lock(rng_mutex_);
  return dist(rng_);
}

ConditionalRouter::Scored ConditionalRouter::Score(const std::string& current_node, const std::vector<graph::Edge>& edges,
                                                   const state::State& state) {
  Scored scored;
  scored.from = current_node;

  for (const auto& edge : edges) {
    const double base = BaseScore(edge, state);

    if (edge.strategy == RoutingStrategy::kParallel) {
      if (base > 0.0) scored.parallel.push_back(edge.to);
      continue;
    }

    const double h       = options_.history_weight;
    const double history = history_->SuccessRateOr(edge.from, edge.to, options_.default_success_rate);
    double       score   = ClampScore((1.0 - h) * base + h * history);

    switch (edge.strategy) {
      case RoutingStrategy::kProbabilistic:
        score *= Jitter();
        break;
      case RoutingStrategy::kExclusive:
        score *= options_.exclusive_boost;
        break;
      case RoutingStrategy::kAiAssisted:
        scored.wants_advisor = true;
        break;
      default:
        break;
    }

    scored.candidates.push_back(Candidate{edge, base, ClampScore(score)});
  }
  return scored;
}

RoutingContext ConditionalRouter::BuildContext(const Scored& scored, const state::State& state) const {
  RoutingContext ctx;
  ctx.workflow_id  = state.WorkflowId();
  ctx.execution_id = state.ExecutionId();
  ctx.current_node = scored.from;

  auto path = state.Path();
  auto skip = path.size() > 3 ? path.size() - 3 : 0;
  ctx.recent_path.assign(path.begin() + static_cast<std::ptrdiff_t>(skip), path.end());
  ctx.data_keys = state.Keys();

  for (const auto& c : scored.candidates) {
    CandidateSummary summary;
    summary.to       = c.edge.to;
    summary.strategy = c.edge.strategy;
    summary.metadata = c.edge.metadata;
    summary.score    = c.score;
    for (const auto& condition : c.edge.conditions) summary.conditions.push_back(condition.name);
    ctx.candidates.push_back(std::move(summary));
  }
  return ctx;
}

RoutingDecision ConditionalRouter::Decide(Scored scored, const std::optional<Recommendation>& recommendation,
                                          const std::string& advisor_note) const {
  RoutingDecision decision;
  decision.parallel_nodes = scored.parallel;
  decision.ai_consulted   = recommendation.has_value() || !advisor_note.empty();

  if (recommendation) {
    for (auto& c : scored.candidates) {
      if (c.edge.to == recommendation->target) {
        c.score = ClampScore(c.score * options_.ai_nudge);
        break;
      }
    }
  }

  const Candidate* best = nullptr;
  for (const auto& c : scored.candidates) {
    decision.alternatives.emplace_back(c.edge.to, c.score);
    if (c.score > 0.0 && (!best || c.score > best->score)) best = &c;
  }

  if (!best && scored.parallel.empty()) {
    throw util::NoValidRouteError("no valid route from node '" + scored.from + "'");
  }

  std::ostringstream explanation;
  if (best) {
    decision.next_node  = best->edge.to;
    decision.confidence = best->score;
    decision.strategy   = best->edge.strategy;
    explanation << "selected " << best->edge.to << " (score " << FormatScore(best->score) << ", "
                << graph::RoutingStrategyName(best->edge.strategy) << ")";

    std::size_t contenders = 0;
    for (const auto& c : scored.candidates) {
      if (&c == best) continue;
      if (c.score > options_.close_contender_threshold) ++contenders;
    }
    decision.requires_backtrack_point = contenders > 1;
  } else {
    decision.confidence = 1.0;
    decision.strategy   = RoutingStrategy::kParallel;
    explanation << "parallel fan-out only";
  }

  if (!scored.parallel.empty()) {
    explanation << "; parallel:";
    for (const auto& target : scored.parallel) explanation << " " << target;
  }
  if (scored.candidates.size() > 1) {
    explanation << "; alternatives:";
    for (const auto& c : scored.candidates) {
      if (best && &c == best) continue;
      explanation << " " << c.edge.to << "=" << FormatScore(c.score);
    }
  }
  if (recommendation) {
    explanation << "; advisor recommended " << recommendation->target;
    if (!recommendation->reasoning.empty()) explanation << " (" << recommendation->reasoning << ")";
  } else if (!advisor_note.empty()) {
    explanation << "; advisor unavailable, using computed scores: " << advisor_note;
  }
  decision.explanation = explanation.str();

  observability::Metrics::Instance().RecordRoutingDecision(graph::RoutingStrategyName(decision.strategy), decision.confidence);
  GRAPHFLOW_LOG_DEBUG("routing decision", {StringField("from", scored.from), StringField("to", decision.next_node),
                                           DoubleField("confidence", decision.confidence),
                                           IntField("parallel", static_cast<int64_t>(decision.parallel_nodes.size()))});
  return decision;
}

// ------------------------------------------------------------
// Routing
// ------------------------------------------------------------

async::Future<RoutingDecision> ConditionalRouter::Route(const std::string& current_node, const std::vector<graph::Edge>& edges,
                                                        const state::State& state) {
  Scored scored;
  try {
    scored = Score(current_node, edges, state);
    if (!scored.wants_advisor || !advisor_) {
      return async::MakeReady(Decide(std::move(scored), std::nullopt, {}));
    }
  } catch (...) {
    return async::MakeFailed<RoutingDecision>(std::current_exception());
  }

  auto context = BuildContext(scored, state);

  async::Future<Recommendation> recommendation;
  try {
    recommendation = advisor_->Recommend(context);
  } catch (...) {
    recommendation = async::MakeFailed<Recommendation>(std::current_exception());
  }
  if (timer_) {
    auto timeout   = options_.ai_timeout;
    recommendation = async::WithTimeout(recommendation, timeout, *timer_, [timeout]() {
      return std::make_exception_ptr(util::InvalidState("routing advisor timed out after " + std::to_string(timeout.count()) + "ms"));
    });
  }

  async::Promise<RoutingDecision> promise;
  async::Executor*                executor = &executor_;
  auto                            shared   = std::make_shared<Scored>(std::move(scored));
  recommendation.OnComplete([this, promise, executor, shared](const async::Future<Recommendation>& done) mutable {
    auto finish = [this, promise, shared, done]() mutable {
      try {
        std::optional<Recommendation> rec;
        std::string                   note;
        if (auto error = done.Error()) {
          note = DescribeError(error);
        } else {
          rec         = done.Get();
          auto& cands = shared->candidates;
          bool  known = std::any_of(cands.begin(), cands.end(), [&](const Candidate& c) { return c.edge.to == rec->target; });
          if (!known) {
            note = "unknown target '" + rec->target + "'";
            rec.reset();
          }
        }
        if (!note.empty()) {
          GRAPHFLOW_LOG_WARN("routing advisor fallback", {StringField("from", shared->from), StringField("reason", note)});
        }
        promise.SetValue(Decide(std::move(*shared), rec, note));
      } catch (...) {
        promise.SetException(std::current_exception());
      }
    };
    try {
      executor->Post(finish);
    } catch (...) {
      promise.SetException(std::current_exception());
    }
  });
  return promise.GetFuture();
}

RoutingDecision ConditionalRouter::RouteSync(const std::string& current_node, const std::vector<graph::Edge>& edges,
                                             const state::State& state) {
  return Route(current_node, edges, state).Get();
}

// ------------------------------------------------------------
// Backtracking / history
// ------------------------------------------------------------

void ConditionalRouter::SaveBacktrackPoint(const state::State& state, const std::string& node_id, const RoutingDecision& decision) {
  BacktrackPoint point;
  point.execution_id = state.ExecutionId();
  point.node_id      = node_id;
  point.state        = state.Derive();
  point.alternatives = decision.alternatives;
  point.chosen       = decision.next_node;
  point.created_at   = util::Now();
  backtracks_->Save(std::move(point));

  GRAPHFLOW_LOG_DEBUG("backtrack point saved", {StringField("execution_id", state.ExecutionId()), StringField("node", node_id),
                                                IntField("alternatives", static_cast<int64_t>(decision.alternatives.size()))});
}

BacktrackResult ConditionalRouter::Backtrack(const std::string& execution_id, const std::string& current_node) {
  auto result = backtracks_->Backtrack(execution_id, current_node);
  GRAPHFLOW_LOG_INFO("backtrack", {StringField("execution_id", execution_id), StringField("from", current_node),
                                   StringField("to", result.next_node), StringField("message", result.message)});
  return result;
}

void ConditionalRouter::RecordOutcome(const std::string& from, const std::string& to, bool success, double confidence) {
  history_->RecordOutcome(from, to, success, confidence);
}

std::size_t ConditionalRouter::CleanupBacktrackPoints(std::chrono::milliseconds max_age) {
  return backtracks_->CleanupOlderThan(max_age);
}

void ConditionalRouter::ClearExecution(const std::string& execution_id) {
  backtracks_->ClearExecution(execution_id);
}

} // namespace graphflow::router
