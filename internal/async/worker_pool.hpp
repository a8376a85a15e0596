#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "executor.hpp"
#include "task_queue.hpp"

namespace graphflow::async {

/*
  Bounded pool of worker threads draining one TaskQueue.

  Node invocations, routing continuations and persistence I/O all run
  here. Tasks must not block waiting for other pool tasks; chain futures
  instead.
*/
class WorkerPool final : public Executor {
 public:
  explicit WorkerPool(std::size_t threads, std::string name = "graphflow-worker");
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  // Drains queued tasks, then joins.
  void Stop();

  // Throws util::InvalidState after Stop().
  void Post(std::function<void()> task) override;

  std::size_t ThreadCount() const {
    return thread_count_;
  }

  std::size_t QueueDepth() const {
    return queue_.Size();
  }

 private:
  void Run();

  std::size_t              thread_count_;
  std::string              name_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace graphflow::async
