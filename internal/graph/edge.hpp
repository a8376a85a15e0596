#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/state/state.hpp"

namespace graphflow::graph {

enum class RoutingStrategy {
  kSimple,
  kAiAssisted,
  kProbabilistic,
  kWeighted,
  kParallel,
  kExclusive,
};

std::string_view RoutingStrategyName(RoutingStrategy strategy);

/*
  Weighted predicate over the current state. An edge's base score is
  the satisfied share of its condition weight.
*/
struct Condition {
  std::string                               name;
  std::function<bool(const state::State&)> predicate;
  double                                    weight = 1.0;
};

struct Edge {
  std::string                        from;
  std::string                        to;
  std::vector<Condition>             conditions;
  RoutingStrategy                    strategy = RoutingStrategy::kSimple;
  double                             priority = 1.0;
  std::map<std::string, std::string> metadata;
};

namespace conditions {

Condition Always(double weight = 1.0);
Condition KeyEquals(const std::string& key, google::protobuf::Value value, double weight = 1.0);
Condition KeyExists(const std::string& key, double weight = 1.0);
Condition KeyGreaterThan(const std::string& key, double threshold, double weight = 1.0);

} // namespace conditions

} // namespace graphflow::graph
