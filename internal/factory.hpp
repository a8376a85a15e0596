#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/async/timer_service.hpp"
#include "internal/async/worker_pool.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/debug/trace_recorder.hpp"
#include "internal/debug/workflow_debugger.hpp"
#include "internal/engine/event_bus.hpp"
#include "internal/engine/quota_gate.hpp"
#include "internal/engine/workflow_engine.hpp"
#include "internal/router/conditional_router.hpp"
#include "internal/router/routing_advisor.hpp"
#include "internal/runtime/maintenance_worker.hpp"
#include "internal/state/state_store.hpp"
#include "internal/storage/storage_backend.hpp"

namespace graphflow::factory {

/*
  Collaborators the embedding application supplies. Both are optional:
  without an advisor AI_ASSISTED edges score like the others, without a
  gate every tenant is allowed.
*/
struct Collaborators {
  router::RoutingAdvisorPtr         advisor;
  std::shared_ptr<engine::QuotaGate> gate;
};

/*
  Runtime

  Owns every long-lived component of one engine instance. Shutdown()
  (also run by the destructor) cancels running executions, stops the
  background threads and only then releases the engine.
*/
struct Runtime {
  Runtime() = default;
  ~Runtime();

  Runtime(Runtime&&)            = default;
  Runtime& operator=(Runtime&&) = default;

  void Shutdown();

  std::shared_ptr<db::Repository>            repository;
  storage::StorageBackendPtr                 blobs;
  std::shared_ptr<async::WorkerPool>         pool;
  std::shared_ptr<async::TimerService>       timer;
  std::shared_ptr<state::StateStore>         store;
  std::shared_ptr<router::ConditionalRouter> router;
  std::shared_ptr<engine::EventBus>          events;
  std::shared_ptr<debug::TraceRecorder>      recorder;
  std::shared_ptr<debug::WorkflowDebugger>   debugger;
  std::shared_ptr<engine::WorkflowEngine>    engine;
  std::shared_ptr<runtime::MaintenanceWorker> maintenance;
};

/*
  BuildRuntime

  Constructs the engine and its collaborators from the runtime config and
  starts the background threads (maintenance excluded; the server starts
  it explicitly).

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and storage types.
*/
Runtime BuildRuntime(const graphflow::runtime::config::RuntimeConfig& config, Collaborators collaborators = {});

// Only the repository, with its schema applied; used by graphflowctl.
std::shared_ptr<db::Repository> BuildRepository(const graphflow::runtime::config::RuntimeConfig& config);

} // namespace graphflow::factory
