#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/async/future.hpp"
#include "internal/graph/edge.hpp"

namespace graphflow::router {

struct CandidateSummary {
  std::string                        to;
  graph::RoutingStrategy             strategy = graph::RoutingStrategy::kSimple;
  std::vector<std::string>           conditions;
  std::map<std::string, std::string> metadata;
  double                             score = 0.0;
};

/*
  What the advisor is told about a routing decision: the node being
  left, a short state summary (last three path entries and the data
  keys) and every non-parallel candidate with its current score.
*/
struct RoutingContext {
  std::string                   workflow_id;
  std::string                   execution_id;
  std::string                   current_node;
  std::vector<std::string>      recent_path;
  std::vector<std::string>      data_keys;
  std::vector<CandidateSummary> candidates;

  // Plain-text rendering for language-model backed advisors.
  std::string Prompt() const;
};

struct Recommendation {
  std::string target;
  double      confidence = 0.0;
  std::string reasoning;
};

/*
  External recommendation capability. A recommendation is a soft nudge:
  the router multiplies the named candidate's score, it never overrides
  the selection outright. Failing the future or naming an unknown target
  makes the router fall back to its own scores.
*/
class RoutingAdvisor {
 public:
  virtual ~RoutingAdvisor() = default;

  virtual async::Future<Recommendation> Recommend(const RoutingContext& context) = 0;
};

using RoutingAdvisorPtr = std::shared_ptr<RoutingAdvisor>;

/*
  Accepts the first line that names one of the candidates, either bare
  ("B"), after "node:" or after "recommend". The rest of the text becomes
  the reasoning. nullopt when no line names a candidate.
*/
std::optional<Recommendation> ParseRecommendation(const std::string& text, const std::vector<std::string>& candidates);

/*
  Adapts a text completion capability (prompt in, free text out) into a
  RoutingAdvisor using RoutingContext::Prompt and ParseRecommendation.
*/
class TextRoutingAdvisor final : public RoutingAdvisor {
 public:
  using CompletionFn = std::function<async::Future<std::string>(const std::string& prompt)>;

  explicit TextRoutingAdvisor(CompletionFn complete);

  async::Future<Recommendation> Recommend(const RoutingContext& context) override;

 private:
  CompletionFn complete_;
};

} // namespace graphflow::router
