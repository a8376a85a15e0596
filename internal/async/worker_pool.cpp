#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::async {

WorkerPool::WorkerPool(std::size_t threads, std::string name) : thread_count_(threads == 0 ? 1 : threads), name_(std::move(name)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void WorkerPool::Post(std::function<void()> task) {
  if (!queue_.Enqueue(std::move(task))) {
    throw util::InvalidState(name_ + " is shut down");
  }
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_ERROR("Worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace graphflow::async
