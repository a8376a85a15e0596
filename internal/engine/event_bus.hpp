#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "event_sink.hpp"

namespace graphflow::engine {

/*
  Fans events out to subscribers on a dedicated dispatcher thread.

  Publish only enqueues; when the queue is at capacity the event is
  dropped and counted. A subscriber that throws is logged and skipped,
  the others still receive the event.
*/
class EventBus final : public EventSink {
 public:
  using Subscriber     = std::function<void(const graphflow::v1::WorkflowEvent&)>;
  using SubscriptionId = uint64_t;

  explicit EventBus(std::size_t capacity = 10000);
  ~EventBus() override;

  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  void Start();
  // Delivers what is queued, then joins.
  void Stop();

  SubscriptionId Subscribe(Subscriber subscriber);
  void           Unsubscribe(SubscriptionId id);

  void Publish(const graphflow::v1::WorkflowEvent& event) override;

  // Blocks until every event published so far has been dispatched.
  void Flush();

  uint64_t Delivered() const {
    return delivered_.load();
  }
  uint64_t Dropped() const {
    return dropped_.load();
  }

 private:
  void Run();
  void Dispatch(const graphflow::v1::WorkflowEvent& event);

  std::size_t capacity_;

  std::mutex                              mutex_;
  std::condition_variable                 cv_;
  std::condition_variable                 idle_cv_;
  std::deque<graphflow::v1::WorkflowEvent> queue_;
  bool                                    stopping_    = false;
  bool                                    dispatching_ = false;

  std::mutex                               subscribers_mutex_;
  std::map<SubscriptionId, Subscriber>     subscribers_;
  SubscriptionId                           next_id_ = 1;

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> dropped_{0};
  std::thread           thread_;
};

} // namespace graphflow::engine
