#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;

namespace {

graph::NodeFn Score(const std::string& key, double value) {
  return graph::SyncNode([key, value](state::State s) {
    s.Set(key, util::NumberValue(value));
    return s;
  });
}

} // namespace

int main() {
  graphflow::runtime::config::RuntimeConfig config;
  auto                                      rt = factory::BuildRuntime(config);

  // fan out to three reviewers, then join in "summarize"
  auto definition = graph::WorkflowBuilder("review")
                        .AddNode("intake", graph::SyncNode([](state::State s) {
                                   s.Set("document", util::StringValue("quarterly report"));
                                   return s;
                                 }))
                        .AddNode("legal", Score("legal_score", 0.9))
                        .AddNode("finance", Score("finance_score", 0.7))
                        .AddNode("style", Score("style_score", 0.8))
                        .AddNode("summarize", graph::SyncNode([](state::State s) {
                                   double total = 0;
                                   for (const auto* key : {"legal_score", "finance_score", "style_score"}) {
                                     if (auto v = s.Get(key)) total += v->number_value();
                                   }
                                   s.Set("average", util::NumberValue(total / 3.0));
                                   return s;
                                 }))
                        .AddEdge("intake", "legal", {}, graph::RoutingStrategy::kParallel)
                        .AddEdge("intake", "finance", {}, graph::RoutingStrategy::kParallel)
                        .AddEdge("intake", "style", {}, graph::RoutingStrategy::kParallel)
                        .AddEdge("intake", "summarize")
                        .AddEdge("legal", "summarize")
                        .AddEdge("finance", "summarize")
                        .AddEdge("style", "summarize")
                        .AddEdge("summarize", graph::kEndNode)
                        .Build();

  auto handle = rt.engine->Execute(definition);
  try {
    auto result = handle.result.Get();
    std::cout << "average score: " << result.Get("average")->number_value() << "\n";
    for (const auto& t : result.Transitions()) {
      std::cout << "  " << t.from_node() << " -> " << t.to_node() << " (" << t.reason() << ")\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "execution failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
