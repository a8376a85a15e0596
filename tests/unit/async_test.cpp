#include "internal/async/cancellation.hpp"
#include "internal/async/future.hpp"
#include "internal/async/timer_service.hpp"
#include "internal/async/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

using namespace graphflow;
using namespace std::chrono_literals;

namespace {

void TestThenChainsOnPool() {
  async::WorkerPool pool(2, "async-test");
  pool.Start();
  assert(pool.ThreadCount() == 2);

  auto result = async::Async(pool, [] { return 20; })
                    .Then(pool, [](int v) { return v + 1; })
                    .Then(pool, [&pool](int v) { return async::Async(pool, [v] { return std::to_string(v * 2); }); });
  assert(result.Get() == "42");

  pool.Stop();
}

void TestErrorsSkipThenAndReachRecover() {
  async::WorkerPool pool(1, "async-test");
  pool.Start();

  std::atomic<bool> then_ran{false};
  auto failed = async::MakeFailed<int>(std::make_exception_ptr(util::NotFound("missing")))
                    .Then(pool, [&](int v) {
                      then_ran = true;
                      return v;
                    });
  auto recovered = failed.Recover(pool, [](std::exception_ptr error) {
    try {
      std::rethrow_exception(error);
    } catch (const util::NotFound&) {
      return -1;
    } catch (...) {
      return -2;
    }
  });
  assert(recovered.Get() == -1);
  assert(!then_ran);

  // Recover passes values straight through
  auto untouched = async::MakeReady(5).Recover(pool, [](std::exception_ptr) { return 0; });
  assert(untouched.Get() == 5);

  // a throwing recovery handler fails the future
  auto rethrown = async::MakeFailed<int>(std::make_exception_ptr(std::runtime_error("boom")))
                      .Recover(pool, [](std::exception_ptr error) -> int { std::rethrow_exception(error); });
  bool threw = false;
  try {
    rethrown.Get();
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "boom";
  }
  assert(threw);

  pool.Stop();
}

void TestFirstCompletionWins() {
  async::Promise<int> promise;
  assert(!promise.IsSet());
  assert(promise.SetValue(1));
  assert(promise.IsSet());
  assert(!promise.SetValue(2));
  assert(!promise.SetException(std::make_exception_ptr(std::runtime_error("late"))));
  assert(promise.GetFuture().Get() == 1);
}

void TestWhenAllKeepsOrderAndErrors() {
  async::Promise<int> slow;
  std::vector<async::Future<int>> inputs{slow.GetFuture(), async::MakeReady(2),
                                         async::MakeFailed<int>(std::make_exception_ptr(std::runtime_error("x")))};
  auto all = async::WhenAll(inputs);
  assert(!all.IsReady());
  assert(!all.WaitFor(5ms));

  slow.SetValue(1);
  auto done = all.Get();
  assert(done.size() == 3);
  assert(done[0].Get() == 1);
  assert(done[1].Get() == 2);
  assert(done[2].Error());

  assert(async::WhenAll(std::vector<async::Future<int>>{}).Get().empty());
}

void TestWithTimeout() {
  async::TimerService timer;
  timer.Start();

  async::Promise<int> never;
  auto timed = async::WithTimeout(never.GetFuture(), 20ms, timer,
                                  [] { return std::make_exception_ptr(util::InvalidState("deadline")); });
  bool threw = false;
  try {
    timed.Get();
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  // completing first cancels the deadline
  auto fast = async::WithTimeout(async::MakeReady(3), 1s, timer, [] { return std::make_exception_ptr(util::InvalidState("deadline")); });
  assert(fast.Get() == 3);
  assert(timer.Pending() == 0);

  auto start = std::chrono::steady_clock::now();
  async::Delay(timer, 15ms).Get();
  assert(std::chrono::steady_clock::now() - start >= 15ms);

  timer.Stop();
}

void TestCancellationCallbacks() {
  async::CancellationToken token;
  int                      calls = 0;
  auto                     id    = token.OnCancel([&] { ++calls; });
  token.OnCancel([&] { calls += 10; });
  token.Unregister(id);

  token.Cancel("user request");
  token.Cancel("again");
  assert(token.IsCancelled());
  assert(token.Reason() == "user request");
  assert(calls == 10);

  // registering after cancellation runs immediately
  token.OnCancel([&] { ++calls; });
  assert(calls == 11);
}

void TestPostAfterStopThrows() {
  async::WorkerPool pool(1, "async-test");
  pool.Start();
  pool.Stop();
  assert(pool.QueueDepth() == 0);

  bool threw = false;
  try {
    pool.Post([] {});
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestThenChainsOnPool();
  TestErrorsSkipThenAndReachRecover();
  TestFirstCompletionWins();
  TestWhenAllKeepsOrderAndErrors();
  TestWithTimeout();
  TestCancellationCallbacks();
  TestPostAfterStopThrows();

  std::cout << "async_test: pass\n";
  return 0;
}
