#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "config/config.pb.h"

namespace graphflow::state {
class StateStore;
}
namespace graphflow::router {
class ConditionalRouter;
}
namespace graphflow::debug {
class TraceRecorder;
}
namespace graphflow::engine {
class WorkflowEngine;
}

namespace graphflow::runtime {

struct MaintenanceOptions {
  std::chrono::milliseconds interval          = std::chrono::minutes(1);
  std::chrono::milliseconds state_retention   = std::chrono::hours(24 * 7);
  std::chrono::milliseconds backtrack_max_age = std::chrono::hours(1);
  std::chrono::milliseconds trace_retention   = std::chrono::hours(24 * 7);

  static MaintenanceOptions FromConfig(const graphflow::runtime::config::RuntimeConfig& config);
};

struct MaintenanceReport {
  std::size_t states_removed      = 0;
  std::size_t backtracks_removed  = 0;
  std::size_t traces_removed      = 0;
  std::size_t executions_pruned   = 0;
};

/*
  Background worker that enforces retention.

  Executes, every interval:
      old state versions and checkpoints → deleted
      expired backtrack points           → dropped
      old traces                         → dropped
      finished executions                → forgotten by the engine

  Any component may be null. A failing pass is logged and retried on the
  next tick.
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<state::StateStore> store, std::shared_ptr<router::ConditionalRouter> router,
                    std::shared_ptr<debug::TraceRecorder> recorder, std::shared_ptr<engine::WorkflowEngine> engine,
                    MaintenanceOptions options = {});
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // One pass on the calling thread.
  MaintenanceReport RunOnce();

 private:
  void Run();

  std::shared_ptr<state::StateStore>         store_;
  std::shared_ptr<router::ConditionalRouter> router_;
  std::shared_ptr<debug::TraceRecorder>      recorder_;
  std::shared_ptr<engine::WorkflowEngine>    engine_;
  MaintenanceOptions                         options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace graphflow::runtime
