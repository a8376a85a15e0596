#include "maintenance_worker.hpp"

#include "internal/debug/trace_recorder.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/router/conditional_router.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/time.hpp"

namespace graphflow::runtime {

using observability::IntField;
using observability::StringField;

MaintenanceOptions MaintenanceOptions::FromConfig(const graphflow::runtime::config::RuntimeConfig& config) {
  MaintenanceOptions options;
  const auto&        m      = config.maintenance();
  options.interval          = util::ToMillis(m.interval(), options.interval);
  options.state_retention   = util::ToMillis(m.state_retention(), options.state_retention);
  options.backtrack_max_age = util::ToMillis(m.backtrack_max_age(), options.backtrack_max_age);
  options.trace_retention   = util::ToMillis(config.debugger().trace_retention(), options.trace_retention);
  return options;
}

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<state::StateStore> store, std::shared_ptr<router::ConditionalRouter> router,
                                     std::shared_ptr<debug::TraceRecorder> recorder, std::shared_ptr<engine::WorkflowEngine> engine,
                                     MaintenanceOptions options)
    : store_(std::move(store)),
      router_(std::move(router)),
      recorder_(std::move(recorder)),
      engine_(std::move(engine)),
      options_(options) {
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&MaintenanceWorker::Run, this);
}

void MaintenanceWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

MaintenanceReport MaintenanceWorker::RunOnce() {
  MaintenanceReport report;
  if (store_) report.states_removed = store_->CleanOldStates(options_.state_retention);
  if (router_) report.backtracks_removed = router_->CleanupBacktrackPoints(options_.backtrack_max_age);
  if (recorder_) report.traces_removed = recorder_->CleanupTraces(options_.trace_retention);
  if (engine_) report.executions_pruned = engine_->PruneFinished(options_.state_retention);

  GRAPHFLOW_LOG_INFO("maintenance pass", {IntField("states_removed", static_cast<int64_t>(report.states_removed)),
                                          IntField("backtracks_removed", static_cast<int64_t>(report.backtracks_removed)),
                                          IntField("traces_removed", static_cast<int64_t>(report.traces_removed)),
                                          IntField("executions_pruned", static_cast<int64_t>(report.executions_pruned))});
  return report;
}

void MaintenanceWorker::Run() {
  observability::ScopedLogFields log_scope({StringField("component", "maintenance")});

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, options_.interval, [&] { return !running_; })) break;

    lock.unlock();
    try {
      RunOnce();
    } catch (const std::exception& e) {
      GRAPHFLOW_LOG_ERROR("maintenance pass failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace graphflow::runtime
