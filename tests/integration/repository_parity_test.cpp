#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

#if GRAPHFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if GRAPHFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using graphflow::db::ErrorCode;
using graphflow::db::Repository;
using graphflow::db::memory::MemoryRepository;
using graphflow::db::model::BreakpointRecord;
using graphflow::db::model::CheckpointRecord;
using graphflow::db::model::StateRecord;
using graphflow::db::model::TraceEventRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

StateRecord MakeState(const std::string& execution_id, uint64_t version, const std::string& branch_id, uint64_t created_at_ms) {
  StateRecord r;
  r.execution_id  = execution_id;
  r.workflow_id   = "wf";
  r.tenant_id     = "tenant-a";
  r.branch_id     = branch_id;
  r.version       = version;
  r.state_id      = branch_id.empty() ? execution_id + "_v" + std::to_string(version)
                                      : execution_id + "." + branch_id + "_v" + std::to_string(version);
  r.inline_json   = R"({"v":)" + std::to_string(version) + "}";
  r.size_bytes    = r.inline_json.size();
  r.created_at_ms = created_at_ms;
  return r;
}

CheckpointRecord MakeCheckpoint(const StateRecord& state, const std::string& id, uint64_t created_at_ms) {
  CheckpointRecord cp;
  cp.id            = id;
  cp.execution_id  = state.execution_id;
  cp.workflow_id   = state.workflow_id;
  cp.node_id       = "node-" + std::to_string(state.version);
  cp.state_id      = state.state_id;
  cp.state_version = state.version;
  cp.type          = graphflow::v1::CHECKPOINT_TYPE_AUTO;
  cp.created_at_ms = created_at_ms;
  return cp;
}

void VerifyStateVersions(Repository& repo, const std::string& exec) {
  const uint64_t now = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.UpsertState(*tx, MakeState(exec, 1, "", now)));
    assert(repo.UpsertState(*tx, MakeState(exec, 2, "", now)));
    assert(repo.UpsertState(*tx, MakeState(exec, 3, "a-b", now)));
    // reads inside the transaction see its writes
    assert(repo.GetState(*tx, exec + "_v2").has_value());
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto latest = repo.GetLatestState(*tx, exec);
  assert(latest.has_value());
  assert(latest->version == 2);
  assert(latest->branch_id.empty());

  auto all = repo.ListStates(*tx, exec);
  assert(all.size() == 3);
  assert(all[0].version == 1);
  assert(all[2].branch_id == "a-b");

  auto branch = repo.GetState(*tx, exec + ".a-b_v3");
  assert(branch.has_value());
  assert(branch->inline_json == R"({"v":3})");
  assert(branch->blob_path.empty());
  assert(branch->tenant_id == "tenant-a");

  // upsert replaces the payload of an existing id
  auto replaced        = MakeState(exec, 1, "", now);
  replaced.inline_json = "";
  replaced.blob_path   = "states/tenant-a/" + exec + "_v1.json";
  assert(repo.UpsertState(*tx, replaced));
  auto v1 = repo.GetState(*tx, exec + "_v1");
  assert(v1.has_value());
  assert(v1->inline_json.empty());
  assert(v1->blob_path == replaced.blob_path);

  assert(repo.DeleteState(*tx, exec + "_v1"));
  assert(!repo.GetState(*tx, exec + "_v1").has_value());
  assert(repo.ListStates(*tx, exec).size() == 2);
  assert(!repo.GetLatestState(*tx, exec + "-missing").has_value());
  tx->Commit();
}

void VerifyCheckpoints(Repository& repo, const std::string& exec) {
  const uint64_t base  = NowMs();
  auto           s1    = MakeState(exec, 1, "", base);
  auto           s2    = MakeState(exec, 2, "", base);
  auto           s3    = MakeState(exec, 3, "", base + 10);
  {
    auto tx = repo.Begin();
    assert(repo.UpsertState(*tx, s1));
    assert(repo.UpsertState(*tx, s2));
    assert(repo.UpsertState(*tx, s3));
    assert(repo.InsertCheckpoint(*tx, MakeCheckpoint(s1, exec + "-cp-1", base)));
    assert(repo.InsertCheckpoint(*tx, MakeCheckpoint(s2, exec + "-cp-2", base)));

    auto failed        = MakeCheckpoint(s3, exec + "-cp-3", base + 10);
    failed.type        = graphflow::v1::CHECKPOINT_TYPE_ERROR;
    failed.location    = graphflow::v1::STORAGE_LOCATION_BLOB;
    failed.description = "node failed";
    assert(repo.InsertCheckpoint(*tx, failed));
    tx->Commit();
  }

  {
    auto tx        = repo.Begin();
    auto duplicate = repo.InsertCheckpoint(*tx, MakeCheckpoint(s1, exec + "-cp-1", base));
    assert(!duplicate);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx = repo.Begin();

  // newest first, ties broken by state version
  auto list = repo.ListCheckpoints(*tx, exec);
  assert(list.size() == 3);
  assert(list[0].id == exec + "-cp-3");
  assert(list[1].id == exec + "-cp-2");
  assert(list[2].id == exec + "-cp-1");

  auto cp = repo.GetCheckpoint(*tx, exec + "-cp-3");
  assert(cp.has_value());
  assert(cp->type == graphflow::v1::CHECKPOINT_TYPE_ERROR);
  assert(cp->location == graphflow::v1::STORAGE_LOCATION_BLOB);
  assert(cp->description == "node failed");
  assert(cp->state_id == s3.state_id);
  assert(cp->state_version == 3);

  assert(repo.DeleteCheckpoint(*tx, exec + "-cp-1"));
  assert(!repo.GetCheckpoint(*tx, exec + "-cp-1").has_value());
  tx->Commit();
}

void VerifyRetentionQueries(Repository& repo, const std::string& exec) {
  const uint64_t now = NowMs();
  auto           old = MakeState(exec, 1, "", 1000);
  auto           cur = MakeState(exec, 2, "", now);
  {
    auto tx = repo.Begin();
    assert(repo.UpsertState(*tx, old));
    assert(repo.UpsertState(*tx, cur));
    assert(repo.InsertCheckpoint(*tx, MakeCheckpoint(old, exec + "-old", 1000)));
    assert(repo.InsertCheckpoint(*tx, MakeCheckpoint(cur, exec + "-new", now)));
    tx->Commit();
  }

  auto tx = repo.Begin();

  bool saw_old = false;
  for (const auto& record : repo.ListStatesOlderThan(*tx, 2000)) {
    assert(record.created_at_ms < 2000);
    if (record.state_id == old.state_id) saw_old = true;
  }
  assert(saw_old);

  bool saw_old_cp = false;
  for (const auto& record : repo.ListCheckpointsOlderThan(*tx, 2000)) {
    assert(record.created_at_ms < 2000);
    if (record.id == exec + "-old") saw_old_cp = true;
  }
  assert(saw_old_cp);
  tx->Rollback();
}

void VerifyBreakpoints(Repository& repo, const std::string& session) {
  graphflow::db::RunInTransaction(repo, [&](graphflow::db::Transaction& tx) {
    assert(repo.UpsertBreakpoint(tx, BreakpointRecord{session + "-bp-2", session, R"({"node_id":"B"})", 1}));
    assert(repo.UpsertBreakpoint(tx, BreakpointRecord{session + "-bp-1", session, R"({"node_id":"A"})", 1}));
    assert(repo.UpsertBreakpoint(tx, BreakpointRecord{"other-bp", session + "-other", "{}", 1}));
  });

  auto listed = graphflow::db::RunInTransaction(repo, [&](graphflow::db::Transaction& tx) {
    assert(repo.UpsertBreakpoint(tx, BreakpointRecord{session + "-bp-2", session, R"({"node_id":"B","enabled":false})", 2}));
    return repo.ListBreakpoints(tx, session);
  });
  assert(listed.size() == 2);
  assert(listed[0].id == session + "-bp-1");
  // postgres stores JSONB, so only check the replaced content survived
  assert(listed[1].json.find("enabled") != std::string::npos);
  assert(listed[1].updated_at_ms == 2);

  graphflow::db::RunInTransaction(repo, [&](graphflow::db::Transaction& tx) {
    assert(repo.DeleteBreakpoint(tx, session + "-bp-1"));
    assert(repo.ListBreakpoints(tx, session).size() == 1);
  });
}

void VerifyTraceEvents(Repository& repo, const std::string& exec) {
  const uint64_t now = NowMs();

  std::vector<TraceEventRecord> first;
  for (uint64_t seq = 1; seq <= 3; ++seq) {
    first.push_back(TraceEventRecord{exec + "-ev-" + std::to_string(seq), exec, seq, 1, "A", "{}", seq == 1 ? 1000 : now});
  }
  std::vector<TraceEventRecord> second = {
      TraceEventRecord{exec + "-ev-3-dup", exec, 3, 2, "B", R"({"dup":true})", now},
      TraceEventRecord{exec + "-ev-4", exec, 4, 2, "B", "{}", now},
  };

  graphflow::db::RunInTransaction(repo, [&](graphflow::db::Transaction& tx) {
    // appended out of order across batches
    assert(repo.AppendTraceEvents(tx, second));
    assert(repo.AppendTraceEvents(tx, first));
  });

  auto tx     = repo.Begin();
  auto events = repo.ReadTraceEvents(*tx, exec);
  assert(events.size() == 4);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence == i + 1);
  }
  // an already stored sequence is kept
  assert(events[2].id == exec + "-ev-3-dup");
  assert(events[3].node_id == "B");

  assert(repo.DeleteTraceEventsOlderThan(*tx, 2000));
  events = repo.ReadTraceEvents(*tx, exec);
  assert(events.size() == 3);
  assert(events.front().sequence == 2);
  assert(repo.ReadTraceEvents(*tx, exec + "-missing").empty());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& exec) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertState(*tx, MakeState(exec, 1, "", NowMs())));
    tx->Rollback();
  }
  {
    // destructor rolls back an unfinished transaction
    auto tx = repo.Begin();
    assert(repo.UpsertState(*tx, MakeState(exec, 2, "", NowMs())));
  }

  auto tx = repo.Begin();
  assert(repo.ListStates(*tx, exec).empty());

  bool threw = false;
  tx->Commit();
  try {
    tx->Commit();
  } catch (const graphflow::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& exec, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1    = repo.Begin();
  auto tx2    = repo.Begin();
  auto reader = repo.Begin();

  assert(repo.UpsertState(*tx1, MakeState(exec, 1, "", NowMs())));
  // uncommitted writes stay invisible to other transactions
  assert(!repo.GetState(*tx2, exec + "_v1").has_value());
  tx1->Commit();

  assert(repo.UpsertState(*tx2, MakeState(exec, 2, "", NowMs())));
  // tx2 read a snapshot older than tx1's commit
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const graphflow::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  // read-only transactions never conflict
  assert(repo.ListStates(*reader, exec).empty());
  reader->Commit();

  // RunInTransaction retries a lost optimistic commit
  graphflow::db::RunInTransaction(repo, [&](graphflow::db::Transaction& tx) {
    assert(repo.UpsertState(tx, MakeState(exec, 2, "", NowMs())));
  });

  auto verify = repo.Begin();
  assert(repo.ListStates(*verify, exec).size() == 2);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& exec) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo  = backend.make_repository();
  auto state = MakeState(exec, 1, "", NowMs());
  {
    auto tx = repo->Begin();
    assert(repo->UpsertState(*tx, state));
    assert(repo->InsertCheckpoint(*tx, MakeCheckpoint(state, exec + "-cp", NowMs())));
    assert(repo->AppendTraceEvents(*tx, {TraceEventRecord{exec + "-ev", exec, 1, 1, "A", "{}", NowMs()}}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto s  = repo->GetState(*tx, state.state_id);
  assert(s.has_value());
  assert(s->inline_json == state.inline_json);
  assert(repo->GetCheckpoint(*tx, exec + "-cp").has_value());
  assert(repo->ReadTraceEvents(*tx, exec).size() == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if GRAPHFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("graphflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<graphflow::db::sqlite::SqliteDB>(db_path);
    graphflow::db::sql::RunMigrations(*db, graphflow::db::sql::SqliteSchema());
    return std::make_shared<graphflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if GRAPHFLOW_DB_POSTGRES
class PgMigrationExecutor final : public graphflow::db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("GRAPHFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("GRAPHFLOW_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<graphflow::db::postgres::PgPool>(conninfo);
    {
      auto                conn = pool->Acquire();
      pqxx::work          tx(*conn);
      PgMigrationExecutor executor(tx);
      graphflow::db::sql::RunMigrations(executor, graphflow::db::sql::PostgresSchema());
      tx.commit();
    }
    return std::make_shared<graphflow::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  {
    auto repo = backend.make_repository();

    VerifyStateVersions(*repo, prefix + "-states");
    VerifyCheckpoints(*repo, prefix + "-checkpoints");
    VerifyRetentionQueries(*repo, prefix + "-retention");
    VerifyBreakpoints(*repo, prefix + "-session");
    VerifyTraceEvents(*repo, prefix + "-trace");
    VerifyRollbackBehavior(*repo, prefix + "-rollback");
    VerifyConcurrentTransactions(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);
  }

  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if GRAPHFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if GRAPHFLOW_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
