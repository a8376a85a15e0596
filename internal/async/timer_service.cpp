#include "timer_service.hpp"

#include "internal/observability/logging.hpp"

namespace graphflow::async {

TimerService::~TimerService() {
  Stop();
}

void TimerService::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&TimerService::Run, this);
}

void TimerService::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();

  std::lock_guard lock(mutex_);
  timers_.clear();
  index_.clear();
}

TimerService::TimerId TimerService::Schedule(std::chrono::milliseconds delay, std::function<void()> fn) {
  const auto deadline = SteadyClock::now() + delay;
  TimerId    id;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_.emplace(Key{deadline, id}, std::move(fn));
    index_.emplace(id, deadline);
  }
  cv_.notify_all();
  return id;
}

bool TimerService::Cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  auto            it = index_.find(id);
  if (it == index_.end()) return false;
  timers_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

std::size_t TimerService::Pending() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

void TimerService::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (timers_.empty()) {
      cv_.wait(lock, [this] { return stopping_ || !timers_.empty(); });
      continue;
    }

    auto next = timers_.begin();
    if (SteadyClock::now() < next->first.first) {
      cv_.wait_until(lock, next->first.first);
      continue;
    }

    auto fn = std::move(next->second);
    index_.erase(next->first.second);
    timers_.erase(next);

    lock.unlock();
    try {
      fn();
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_ERROR("Timer callback failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

Future<Unit> Delay(TimerService& timer, std::chrono::milliseconds delay) {
  Promise<Unit> promise;
  timer.Schedule(delay, [promise]() mutable { promise.SetValue(Unit{}); });
  return promise.GetFuture();
}

} // namespace graphflow::async
