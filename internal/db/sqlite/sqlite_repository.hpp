#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace graphflow::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                            UpsertState(Transaction&, const model::StateRecord&) override;
  std::optional<model::StateRecord> GetState(Transaction&, const std::string&) override;
  std::optional<model::StateRecord> GetLatestState(Transaction&, const std::string& execution_id) override;
  std::vector<model::StateRecord>   ListStates(Transaction&, const std::string& execution_id) override;
  std::vector<model::StateRecord>   ListStatesOlderThan(Transaction&, uint64_t cutoff_ms) override;
  Result                            DeleteState(Transaction&, const std::string&) override;

  Result                                 InsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string&) override;
  std::vector<model::CheckpointRecord>   ListCheckpoints(Transaction&, const std::string& execution_id) override;
  std::vector<model::CheckpointRecord>   ListCheckpointsOlderThan(Transaction&, uint64_t cutoff_ms) override;
  Result                                 DeleteCheckpoint(Transaction&, const std::string&) override;

  Result                               UpsertBreakpoint(Transaction&, const model::BreakpointRecord&) override;
  std::vector<model::BreakpointRecord> ListBreakpoints(Transaction&, const std::string& session_id) override;
  Result                               DeleteBreakpoint(Transaction&, const std::string&) override;

  Result                               AppendTraceEvents(Transaction&, const std::vector<model::TraceEventRecord>&) override;
  std::vector<model::TraceEventRecord> ReadTraceEvents(Transaction&, const std::string& execution_id) override;
  Result                               DeleteTraceEventsOlderThan(Transaction&, uint64_t cutoff_ms) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace graphflow::db::sqlite
