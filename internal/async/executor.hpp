#pragma once

#include <functional>

namespace graphflow::async {

/*
  Something that runs tasks. Continuations are always posted to an
  executor, never run on the thread that completed the promise.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Post(std::function<void()> task) = 0;
};

// Runs the task on the calling thread.
class InlineExecutor final : public Executor {
 public:
  void Post(std::function<void()> task) override {
    task();
  }
};

} // namespace graphflow::async
