#include "factory.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/engine/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/router/backtrack_registry.hpp"
#include "internal/router/routing_history.hpp"
#include "internal/storage/storage_factory.hpp"
#if GRAPHFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GRAPHFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace graphflow::factory {

using observability::IntField;
using observability::StringField;

namespace {

#if GRAPHFLOW_DB_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const graphflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GRAPHFLOW_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    GRAPHFLOW_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GRAPHFLOW_DB_POSTGRES
    const auto& pg      = database.postgres();
    auto        pool    = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() ? pg.max_connections() : 16);
    {
      auto                conn = pool->Acquire();
      pqxx::work          tx(*conn);
      PgMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }
    GRAPHFLOW_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  GRAPHFLOW_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full engine dependency graph
*/
Runtime BuildRuntime(const graphflow::runtime::config::RuntimeConfig& config, Collaborators collaborators) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.blobs      = storage::StorageFactory::Build(config.storage());

  // ------------------------------------------------------------------
  // Async runtime
  // ------------------------------------------------------------------
  const std::size_t threads = config.engine().worker_threads() ? config.engine().worker_threads() : 8;
  rt.pool                   = std::make_shared<async::WorkerPool>(threads);
  rt.timer                  = std::make_shared<async::TimerService>();
  rt.pool->Start();
  rt.timer->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  rt.store = std::make_shared<state::StateStore>(rt.repository, rt.blobs, *rt.pool,
                                                 state::StateStoreOptions::FromConfig(config.state_store(), config.storage()));

  rt.router = std::make_shared<router::ConditionalRouter>(std::make_shared<router::RoutingHistory>(),
                                                          std::make_shared<router::BacktrackRegistry>(), *rt.pool, rt.timer.get(),
                                                          std::move(collaborators.advisor), router::RouterOptions::FromConfig(config.router()));

  rt.events = std::make_shared<engine::EventBus>();
  rt.events->Subscribe([sink = std::make_shared<engine::LoggingEventSink>()](const graphflow::v1::WorkflowEvent& event) {
    sink->Publish(event);
  });
  rt.events->Start();

  engine::EngineDependencies deps;
  deps.executor = rt.pool.get();
  deps.timer    = rt.timer.get();
  deps.store    = rt.store;
  deps.router   = rt.router;
  deps.gate     = collaborators.gate ? std::move(collaborators.gate) : std::make_shared<engine::AllowAllGate>();
  deps.events   = rt.events;
  rt.engine     = std::make_shared<engine::WorkflowEngine>(std::move(deps), engine::EngineOptions::FromConfig(config.engine()));

  // ------------------------------------------------------------------
  // Trace + debugger
  // ------------------------------------------------------------------
  auto trace_options = debug::TraceRecorderOptions::FromConfig(config.debugger());
  rt.recorder        = std::make_shared<debug::TraceRecorder>(trace_options.persist ? rt.repository : nullptr, trace_options);
  rt.recorder->Start();
  rt.debugger = std::make_shared<debug::WorkflowDebugger>(rt.recorder, rt.repository);

  // Recorder first so the enter event precedes a debugger pause.
  rt.engine->AddObserver(rt.recorder);
  rt.engine->AddObserver(rt.debugger);

  // ------------------------------------------------------------------
  // Maintenance
  // ------------------------------------------------------------------
  rt.maintenance = std::make_shared<runtime::MaintenanceWorker>(rt.store, rt.router, rt.recorder, rt.engine,
                                                                runtime::MaintenanceOptions::FromConfig(config));

  GRAPHFLOW_LOG_INFO("runtime built", {IntField("worker_threads", static_cast<int64_t>(threads))});
  return rt;
}

// ------------------------------------------------------------------
// Runtime
// ------------------------------------------------------------------

Runtime::~Runtime() {
  Shutdown();
}

void Runtime::Shutdown() {
  if (maintenance) maintenance->Stop();

  if (engine) {
    for (const auto& status : engine->ListExecutions()) {
      engine->Cancel(status.execution_id, "runtime shutting down");
    }
  }

  if (debugger) {
    for (const auto& id : debugger->SessionIds()) debugger->EndSession(id);
  }

  if (timer) timer->Stop();
  if (pool) pool->Stop();
  if (recorder) recorder->Stop();
  if (events) events->Stop();

  maintenance.reset();
  engine.reset();
  debugger.reset();
  recorder.reset();
  router.reset();
  store.reset();
  events.reset();
  timer.reset();
  pool.reset();
  blobs.reset();
  repository.reset();
}

} // namespace graphflow::factory
