#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace graphflow::async {

using Task = std::function<void()>;

/*
  Thread-safe blocking queue for pool workers.

  After Shutdown() the queue still drains: Dequeue() returns nullopt only
  once it is both shut down and empty.
*/
class TaskQueue {
 public:
  // false once shut down
  bool Enqueue(Task task);

  // blocking wait
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace graphflow::async
