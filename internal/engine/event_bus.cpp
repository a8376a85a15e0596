#include "event_bus.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace graphflow::engine {

using observability::StringField;

EventBus::EventBus(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

EventBus::~EventBus() {
  Stop();
}

void EventBus::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&EventBus::Run, this);
}

void EventBus::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

EventBus::SubscriptionId EventBus::Subscribe(Subscriber subscriber) {
  std::lock_guard lock(subscribers_mutex_);
  auto            id = next_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(subscribers_mutex_);
  subscribers_.erase(id);
}

void EventBus::Publish(const graphflow::v1::WorkflowEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_ || queue_.size() >= capacity_) {
      ++dropped_;
      return;
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

void EventBus::Flush() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [this] { return (queue_.empty() && !dispatching_) || !thread_.joinable(); });
}

void EventBus::Run() {
  for (;;) {
    graphflow::v1::WorkflowEvent event;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break;
      event = std::move(queue_.front());
      queue_.pop_front();
      dispatching_ = true;
    }

    Dispatch(event);

    {
      std::lock_guard lock(mutex_);
      dispatching_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void EventBus::Dispatch(const graphflow::v1::WorkflowEvent& event) {
  std::vector<Subscriber> subscribers;
  {
    std::lock_guard lock(subscribers_mutex_);
    subscribers.reserve(subscribers_.size());
    for (const auto& [_, subscriber] : subscribers_) subscribers.push_back(subscriber);
  }

  for (auto& subscriber : subscribers) {
    try {
      subscriber(event);
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_WARN("event subscriber failed", {StringField("type", graphflow::v1::WorkflowEventType_Name(event.type())),
                                                     StringField("execution_id", event.execution_id()), StringField("error", e.what())});
    }
  }
  ++delivered_;
}

} // namespace graphflow::engine
