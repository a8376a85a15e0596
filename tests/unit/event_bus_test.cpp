#include "internal/engine/event_bus.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace graphflow;
namespace v1 = graphflow::v1;

namespace {

v1::WorkflowEvent Event(v1::WorkflowEventType type, const std::string& node) {
  return engine::MakeEvent(type, "wf", "exec", node);
}

void TestDeliversInOrder() {
  engine::EventBus bus;
  std::mutex       mutex;
  std::vector<std::string> seen;
  bus.Subscribe([&](const v1::WorkflowEvent& e) {
    std::lock_guard lock(mutex);
    seen.push_back(e.node_id());
  });
  bus.Start();

  for (int i = 0; i < 100; ++i) bus.Publish(Event(v1::NODE_STARTED, "n" + std::to_string(i)));
  bus.Flush();

  std::lock_guard lock(mutex);
  assert(seen.size() == 100);
  assert(seen.front() == "n0");
  assert(seen.back() == "n99");
  assert(bus.Delivered() == 100);
  assert(bus.Dropped() == 0);
}

void TestThrowingSubscriberIsIsolated() {
  engine::EventBus bus;
  std::atomic<int> received{0};
  bus.Subscribe([](const v1::WorkflowEvent&) { throw std::runtime_error("subscriber broke"); });
  bus.Subscribe([&](const v1::WorkflowEvent&) { ++received; });
  bus.Start();

  bus.Publish(Event(v1::WORKFLOW_STARTED, ""));
  bus.Publish(Event(v1::WORKFLOW_COMPLETED, ""));
  bus.Flush();
  assert(received.load() == 2);
}

void TestUnsubscribe() {
  engine::EventBus bus;
  std::atomic<int> received{0};
  auto             id = bus.Subscribe([&](const v1::WorkflowEvent&) { ++received; });
  bus.Start();

  bus.Publish(Event(v1::NODE_COMPLETED, "a"));
  bus.Flush();
  bus.Unsubscribe(id);
  bus.Publish(Event(v1::NODE_COMPLETED, "b"));
  bus.Flush();
  assert(received.load() == 1);
}

void TestCapacityDropsAndStopDrains() {
  engine::EventBus bus(2);
  std::atomic<int> received{0};
  bus.Subscribe([&](const v1::WorkflowEvent&) { ++received; });

  // not started: the queue fills and further events are dropped
  bus.Publish(Event(v1::NODE_STARTED, "a"));
  bus.Publish(Event(v1::NODE_STARTED, "b"));
  bus.Publish(Event(v1::NODE_STARTED, "c"));
  assert(bus.Dropped() == 1);

  bus.Start();
  bus.Stop();
  assert(received.load() == 2);

  bus.Publish(Event(v1::NODE_STARTED, "late"));
  assert(bus.Dropped() == 2);
}

void TestMakeEvent() {
  google::protobuf::Struct data;
  (*data.mutable_fields())["k"].set_string_value("v");
  auto event = engine::MakeEvent(v1::EDGE_TRAVERSED, "wf", "exec", "from", data);
  assert(event.type() == v1::EDGE_TRAVERSED);
  assert(event.workflow_id() == "wf");
  assert(event.node_id() == "from");
  assert(event.timestamp().seconds() > 0);
  assert(event.data().fields().at("k").string_value() == "v");

  engine::LoggingEventSink sink;
  sink.Publish(event);
}

} // namespace

int main() {
  TestDeliversInOrder();
  TestThrowingSubscriberIsIsolated();
  TestUnsubscribe();
  TestCapacityDropsAndStopDrains();
  TestMakeEvent();

  std::cout << "event_bus_test: pass\n";
  return 0;
}
