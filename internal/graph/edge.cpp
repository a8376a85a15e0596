#include "edge.hpp"

#include <sstream>

#include "internal/util/value.hpp"

namespace graphflow::graph {

std::string_view RoutingStrategyName(RoutingStrategy strategy) {
  switch (strategy) {
    case RoutingStrategy::kSimple:
      return "simple";
    case RoutingStrategy::kAiAssisted:
      return "ai_assisted";
    case RoutingStrategy::kProbabilistic:
      return "probabilistic";
    case RoutingStrategy::kWeighted:
      return "weighted";
    case RoutingStrategy::kParallel:
      return "parallel";
    case RoutingStrategy::kExclusive:
      return "exclusive";
  }
  return "unknown";
}

namespace conditions {

Condition Always(double weight) {
  return Condition{"always", [](const state::State&) { return true; }, weight};
}

Condition KeyEquals(const std::string& key, google::protobuf::Value value, double weight) {
  auto name = key + " == " + util::ValueToString(value);
  return Condition{std::move(name),
                   [key, value = std::move(value)](const state::State& s) {
                     auto current = s.Get(key);
                     return current && util::ValueEquals(*current, value);
                   },
                   weight};
}

Condition KeyExists(const std::string& key, double weight) {
  return Condition{"exists(" + key + ")", [key](const state::State& s) { return s.Has(key); }, weight};
}

Condition KeyGreaterThan(const std::string& key, double threshold, double weight) {
  std::ostringstream name;
  name << key << " > " << threshold;
  return Condition{name.str(),
                   [key, threshold](const state::State& s) {
                     auto current = s.Get(key);
                     return current && current->kind_case() == google::protobuf::Value::kNumberValue && current->number_value() > threshold;
                   },
                   weight};
}

} // namespace conditions

} // namespace graphflow::graph
