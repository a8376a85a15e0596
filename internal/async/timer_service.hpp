#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

#include "future.hpp"

namespace graphflow::async {

/*
  Single thread firing callbacks at deadlines.

  Callbacks run on the timer thread and must be short; they normally just
  complete a promise whose continuations are posted elsewhere.
*/
class TimerService {
 public:
  using TimerId = std::uint64_t;
  using SteadyClock = std::chrono::steady_clock;

  TimerService() = default;
  ~TimerService();

  TimerService(const TimerService&)            = delete;
  TimerService& operator=(const TimerService&) = delete;

  void Start();
  // Pending timers are dropped without firing.
  void Stop();

  TimerId Schedule(std::chrono::milliseconds delay, std::function<void()> fn);

  // false if the timer already fired or was cancelled.
  bool Cancel(TimerId id);

  std::size_t Pending() const;

 private:
  void Run();

  using Key = std::pair<SteadyClock::time_point, TimerId>;

  mutable std::mutex                                   mutex_;
  std::condition_variable                              cv_;
  std::map<Key, std::function<void()>>                 timers_;
  std::unordered_map<TimerId, SteadyClock::time_point> index_;
  TimerId                                              next_id_  = 1;
  bool                                                 stopping_ = false;
  std::thread                                          thread_;
};

// Completes with Unit after delay.
Future<Unit> Delay(TimerService& timer, std::chrono::milliseconds delay);

/*
  Mirrors future, or fails with on_timeout() if the deadline passes first.
  A non-positive timeout disables the deadline.
*/
template <typename T>
Future<T> WithTimeout(const Future<T>& future, std::chrono::milliseconds timeout, TimerService& timer,
                      std::function<std::exception_ptr()> on_timeout) {
  if (timeout.count() <= 0) return future;

  Promise<T>    promise;
  TimerService* t  = &timer;
  auto          id = timer.Schedule(timeout, [promise, on_timeout]() mutable { promise.SetException(on_timeout()); });
  future.OnComplete([promise, id, t](const Future<T>& done) mutable {
    t->Cancel(id);
    detail::Forward(done, promise);
  });
  return promise.GetFuture();
}

} // namespace graphflow::async
