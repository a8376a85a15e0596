#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "executor.hpp"

namespace graphflow::async {

/*
  Minimal future/promise pair with continuations.

  - the first SetValue/SetException wins, later ones are ignored
  - OnComplete callbacks run on the completing thread
  - Then/Recover continuations are posted to an Executor
  - Get() blocks; only call it from outside the worker pool
*/

// Value type for futures that carry no result.
struct Unit {};

template <typename T>
class Future;
template <typename T>
class Promise;

namespace detail {

template <typename T>
struct SharedState {
  std::mutex                         mutex;
  std::condition_variable            cv;
  bool                               ready = false;
  std::optional<T>                   value;
  std::exception_ptr                 error;
  std::vector<std::function<void()>> callbacks;
};

template <typename T>
struct FutureTraits {
  static constexpr bool kIsFuture = false;
  using Inner                     = T;
};

template <typename T>
struct FutureTraits<Future<T>> {
  static constexpr bool kIsFuture = true;
  using Inner                     = T;
};

template <typename T>
void Forward(const Future<T>& from, Promise<T>& to);

} // namespace detail

// ------------------------------------------------------------
// Promise
// ------------------------------------------------------------

template <typename T>
class Promise {
 public:
  Promise() : state_(std::make_shared<detail::SharedState<T>>()) {
  }

  Future<T> GetFuture() const {
    return Future<T>(state_);
  }

  bool SetValue(T value) {
    return Complete([&](detail::SharedState<T>& s) { s.value.emplace(std::move(value)); });
  }

  bool SetException(std::exception_ptr error) {
    return Complete([&](detail::SharedState<T>& s) { s.error = std::move(error); });
  }

  template <typename E>
  bool SetError(E error) {
    return SetException(std::make_exception_ptr(std::move(error)));
  }

  bool IsSet() const {
    std::lock_guard lock(state_->mutex);
    return state_->ready;
  }

 private:
  template <typename Fill>
  bool Complete(Fill&& fill) {
    std::vector<std::function<void()>> callbacks;
    {
      std::lock_guard lock(state_->mutex);
      if (state_->ready) return false;
      fill(*state_);
      state_->ready = true;
      callbacks.swap(state_->callbacks);
    }
    state_->cv.notify_all();
    for (auto& cb : callbacks) cb();
    return true;
  }

  std::shared_ptr<detail::SharedState<T>> state_;
};

// ------------------------------------------------------------
// Future
// ------------------------------------------------------------

template <typename T>
class Future {
 public:
  using ValueType = T;

  Future() = default;

  bool Valid() const {
    return static_cast<bool>(state_);
  }

  bool IsReady() const {
    std::lock_guard lock(state_->mutex);
    return state_->ready;
  }

  void Wait() const {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->ready; });
  }

  template <typename Rep, typename Period>
  bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->ready; });
  }

  // Blocks until ready; rethrows the stored error.
  T Get() const {
    Wait();
    std::lock_guard lock(state_->mutex);
    if (state_->error) std::rethrow_exception(state_->error);
    return *state_->value;
  }

  // Blocks until ready; null when the future holds a value.
  std::exception_ptr Error() const {
    Wait();
    std::lock_guard lock(state_->mutex);
    return state_->error;
  }

  void OnComplete(std::function<void(const Future<T>&)> cb) const {
    Future<T> self = *this;
    {
      std::lock_guard lock(state_->mutex);
      if (!state_->ready) {
        state_->callbacks.push_back([self, cb]() { cb(self); });
        return;
      }
    }
    cb(self);
  }

  /*
    fn(T) -> R or Future<R>; the result is Future<R>.
    Errors skip fn and propagate unchanged.
  */
  template <typename F>
  auto Then(Executor& executor, F fn) const {
    using Raw = std::invoke_result_t<F, T>;
    using R   = typename detail::FutureTraits<Raw>::Inner;

    Promise<R> promise;
    Executor*  ex = &executor;
    OnComplete([promise, ex, fn](const Future<T>& done) mutable {
      if (auto error = done.Error()) {
        promise.SetException(error);
        return;
      }
      try {
        ex->Post([promise, fn, done]() mutable {
          try {
            if constexpr (detail::FutureTraits<Raw>::kIsFuture) {
              fn(done.Get()).OnComplete([promise](const Future<R>& inner) mutable { detail::Forward(inner, promise); });
            } else {
              promise.SetValue(fn(done.Get()));
            }
          } catch (...) {
            promise.SetException(std::current_exception());
          }
        });
      } catch (...) {
        promise.SetException(std::current_exception());
      }
    });
    return promise.GetFuture();
  }

  /*
    fn(std::exception_ptr) -> T or Future<T>; runs only on error.
  */
  template <typename F>
  Future<T> Recover(Executor& executor, F fn) const {
    using Raw = std::invoke_result_t<F, std::exception_ptr>;

    Promise<T> promise;
    Executor*  ex = &executor;
    OnComplete([promise, ex, fn](const Future<T>& done) mutable {
      auto error = done.Error();
      if (!error) {
        detail::Forward(done, promise);
        return;
      }
      try {
        ex->Post([promise, fn, error]() mutable {
          try {
            if constexpr (detail::FutureTraits<Raw>::kIsFuture) {
              fn(error).OnComplete([promise](const Future<T>& inner) mutable { detail::Forward(inner, promise); });
            } else {
              promise.SetValue(fn(error));
            }
          } catch (...) {
            promise.SetException(std::current_exception());
          }
        });
      } catch (...) {
        promise.SetException(std::current_exception());
      }
    });
    return promise.GetFuture();
  }

 private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<detail::SharedState<T>> state) : state_(std::move(state)) {
  }

  std::shared_ptr<detail::SharedState<T>> state_;
};

namespace detail {

template <typename T>
void Forward(const Future<T>& from, Promise<T>& to) {
  if (auto error = from.Error()) {
    to.SetException(error);
    return;
  }
  to.SetValue(from.Get());
}

} // namespace detail

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

template <typename T>
Future<T> MakeReady(T value) {
  Promise<T> promise;
  promise.SetValue(std::move(value));
  return promise.GetFuture();
}

template <typename T>
Future<T> MakeFailed(std::exception_ptr error) {
  Promise<T> promise;
  promise.SetException(std::move(error));
  return promise.GetFuture();
}

// Runs fn on the executor and returns its result as a future.
template <typename F>
auto Async(Executor& executor, F fn) -> Future<std::invoke_result_t<F>> {
  using R = std::invoke_result_t<F>;
  Promise<R> promise;
  try {
    executor.Post([promise, fn]() mutable {
      try {
        promise.SetValue(fn());
      } catch (...) {
        promise.SetException(std::current_exception());
      }
    });
  } catch (...) {
    promise.SetException(std::current_exception());
  }
  return promise.GetFuture();
}

/*
  Completes once every input is ready. Inputs are returned in order, each
  holding either its value or its error.
*/
template <typename T>
Future<std::vector<Future<T>>> WhenAll(std::vector<Future<T>> futures) {
  Promise<std::vector<Future<T>>> promise;
  if (futures.empty()) {
    promise.SetValue({});
    return promise.GetFuture();
  }

  auto remaining = std::make_shared<std::atomic<std::size_t>>(futures.size());
  auto all       = std::make_shared<std::vector<Future<T>>>(futures);
  for (const auto& f : futures) {
    f.OnComplete([promise, remaining, all](const Future<T>&) mutable {
      if (remaining->fetch_sub(1) == 1) promise.SetValue(*all);
    });
  }
  return promise.GetFuture();
}

} // namespace graphflow::async
