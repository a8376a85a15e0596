#include <iostream>
#include <string>

#include "internal/factory.hpp"
#include "internal/graph/workflow_builder.hpp"
#include "internal/util/value.hpp"

using namespace graphflow;

int main() {
  // In-memory repository, RAM blobs.
  graphflow::runtime::config::RuntimeConfig config;
  auto                                      rt = factory::BuildRuntime(config);

  auto definition = graph::WorkflowBuilder("greeting")
                        .AddNode("parse", graph::SyncNode([](state::State s) {
                                   auto name = s.Get("name");
                                   s.Set("who", util::StringValue(name ? util::ValueToString(*name) : "world"));
                                   return s;
                                 }))
                        .AddNode("greet", graph::SyncNode([](state::State s) {
                                   s.Set("greeting", util::StringValue("hello, " + util::ValueToString(*s.Get("who"))));
                                   return s;
                                 }))
                        .AddNode("shout", graph::SyncNode([](state::State s) {
                                   auto text = util::ValueToString(*s.Get("greeting"));
                                   for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
                                   s.Set("greeting", util::StringValue(text + "!"));
                                   return s;
                                 }))
                        .AddEdge("parse", "greet")
                        .AddEdge("greet", "shout", {graph::conditions::KeyEquals("loud", util::BoolValue(true))})
                        .AddEdge("greet", graph::kEndNode, {}, graph::RoutingStrategy::kSimple, 0.5)
                        .AddEdge("shout", graph::kEndNode)
                        .Build();

  google::protobuf::Struct input;
  (*input.mutable_fields())["name"] = util::StringValue("graphflow");
  (*input.mutable_fields())["loud"] = util::BoolValue(true);

  auto handle = rt.engine->Execute(definition, input);
  try {
    auto result = handle.result.Get();
    std::cout << "execution " << handle.execution_id << " finished at version " << result.Version() << "\n";
    std::cout << "greeting: " << util::ValueToString(*result.Get("greeting")) << "\n";
    std::cout << "path:";
    for (const auto& node : result.Path()) std::cout << " " << node;
    std::cout << "\n";
  } catch (const std::exception& e) {
    std::cerr << "execution failed: " << e.what() << "\n";
    return 1;
  }

  for (const auto& cp : rt.store->ListCheckpoints(handle.execution_id)) {
    std::cout << "checkpoint " << cp.id() << " at " << cp.node_id() << " (v" << cp.state_version() << ")\n";
  }
  return 0;
}
