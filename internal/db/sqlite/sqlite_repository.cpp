#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace graphflow::db::sqlite {

using graphflow::db::ErrorCode;
using graphflow::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) st = nullptr;
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st != nullptr;
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::StateRecord ReadState(sqlite3_stmt* st) {
  model::StateRecord r;
  r.state_id      = ColText(st, 0);
  r.execution_id  = ColText(st, 1);
  r.workflow_id   = ColText(st, 2);
  r.tenant_id     = ColText(st, 3);
  r.branch_id     = ColText(st, 4);
  r.version       = ColU64(st, 5);
  r.inline_json   = ColText(st, 6);
  r.blob_path     = ColText(st, 7);
  r.size_bytes    = ColU64(st, 8);
  r.created_at_ms = ColU64(st, 9);
  return r;
}

model::CheckpointRecord ReadCheckpoint(sqlite3_stmt* st) {
  model::CheckpointRecord r;
  r.id            = ColText(st, 0);
  r.execution_id  = ColText(st, 1);
  r.workflow_id   = ColText(st, 2);
  r.node_id       = ColText(st, 3);
  r.state_id      = ColText(st, 4);
  r.state_version = ColU64(st, 5);
  r.location      = static_cast<graphflow::v1::StorageLocation>(ColI32(st, 6));
  r.type          = static_cast<graphflow::v1::CheckpointType>(ColI32(st, 7));
  r.description   = ColText(st, 8);
  r.created_at_ms = ColU64(st, 9);
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> CollectRows(sqlite3_stmt* st, Reader read) {
  std::vector<Record> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// State versions
// ------------------------------------------------------------------

Result SqliteRepository::UpsertState(Transaction& t, const model::StateRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_STATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, r.state_id);
  BindText(st.st, 2, r.execution_id);
  BindText(st.st, 3, r.workflow_id);
  BindText(st.st, 4, r.tenant_id);
  BindText(st.st, 5, r.branch_id);
  BindU64(st.st, 6, r.version);
  BindTextOrNull(st.st, 7, r.inline_json);
  BindTextOrNull(st.st, 8, r.blob_path);
  BindU64(st.st, 9, r.size_bytes);
  BindU64(st.st, 10, r.created_at_ms);

  return Translate(db, sqlite3_step(st.st));
}

std::optional<model::StateRecord> SqliteRepository::GetState(Transaction& t, const std::string& state_id) {
  Statement st(TX(t).Handle(), sql::SELECT_STATE);
  if (!st) return std::nullopt;

  BindText(st.st, 1, state_id);
  if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
  return ReadState(st.st);
}

std::optional<model::StateRecord> SqliteRepository::GetLatestState(Transaction& t, const std::string& execution_id) {
  Statement st(TX(t).Handle(), sql::SELECT_LATEST_STATE);
  if (!st) return std::nullopt;

  BindText(st.st, 1, execution_id);
  if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
  return ReadState(st.st);
}

std::vector<model::StateRecord> SqliteRepository::ListStates(Transaction& t, const std::string& execution_id) {
  Statement st(TX(t).Handle(), sql::SELECT_STATES_FOR_EXECUTION);
  if (!st) return {};

  BindText(st.st, 1, execution_id);
  return CollectRows<model::StateRecord>(st.st, ReadState);
}

std::vector<model::StateRecord> SqliteRepository::ListStatesOlderThan(Transaction& t, uint64_t cutoff_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_STATES_OLDER_THAN);
  if (!st) return {};

  BindU64(st.st, 1, cutoff_ms);
  return CollectRows<model::StateRecord>(st.st, ReadState);
}

Result SqliteRepository::DeleteState(Transaction& t, const std::string& state_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_STATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, state_id);
  return Translate(db, sqlite3_step(st.st));
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_CHECKPOINT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, r.id);
  BindText(st.st, 2, r.execution_id);
  BindText(st.st, 3, r.workflow_id);
  BindText(st.st, 4, r.node_id);
  BindText(st.st, 5, r.state_id);
  BindU64(st.st, 6, r.state_version);
  BindI32(st.st, 7, static_cast<int>(r.location));
  BindI32(st.st, 8, static_cast<int>(r.type));
  BindText(st.st, 9, r.description);
  BindU64(st.st, 10, r.created_at_ms);

  return Translate(db, sqlite3_step(st.st));
}

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_CHECKPOINT);
  if (!st) return std::nullopt;

  BindText(st.st, 1, id);
  if (sqlite3_step(st.st) != SQLITE_ROW) return std::nullopt;
  return ReadCheckpoint(st.st);
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpoints(Transaction& t, const std::string& execution_id) {
  Statement st(TX(t).Handle(), sql::SELECT_CHECKPOINTS_FOR_EXECUTION);
  if (!st) return {};

  BindText(st.st, 1, execution_id);
  return CollectRows<model::CheckpointRecord>(st.st, ReadCheckpoint);
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpointsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  Statement st(TX(t).Handle(), sql::SELECT_CHECKPOINTS_OLDER_THAN);
  if (!st) return {};

  BindU64(st.st, 1, cutoff_ms);
  return CollectRows<model::CheckpointRecord>(st.st, ReadCheckpoint);
}

Result SqliteRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_CHECKPOINT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, id);
  return Translate(db, sqlite3_step(st.st));
}

// ------------------------------------------------------------------
// Breakpoints
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBreakpoint(Transaction& t, const model::BreakpointRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_BREAKPOINT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, r.id);
  BindText(st.st, 2, r.session_id);
  BindText(st.st, 3, r.json);
  BindU64(st.st, 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.st));
}

std::vector<model::BreakpointRecord> SqliteRepository::ListBreakpoints(Transaction& t, const std::string& session_id) {
  Statement st(TX(t).Handle(), sql::SELECT_BREAKPOINTS_FOR_SESSION);
  if (!st) return {};

  BindText(st.st, 1, session_id);
  return CollectRows<model::BreakpointRecord>(st.st, [](sqlite3_stmt* row) {
    model::BreakpointRecord r;
    r.id            = ColText(row, 0);
    r.session_id    = ColText(row, 1);
    r.json          = ColText(row, 2);
    r.updated_at_ms = ColU64(row, 3);
    return r;
  });
}

Result SqliteRepository::DeleteBreakpoint(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_BREAKPOINT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.st, 1, id);
  return Translate(db, sqlite3_step(st.st));
}

// ------------------------------------------------------------------
// Trace events
// ------------------------------------------------------------------

Result SqliteRepository::AppendTraceEvents(Transaction& t, const std::vector<model::TraceEventRecord>& events) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_TRACE_EVENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& e : events) {
    sqlite3_reset(st.st);
    sqlite3_clear_bindings(st.st);

    BindText(st.st, 1, e.execution_id);
    BindU64(st.st, 2, e.sequence);
    BindText(st.st, 3, e.id);
    BindI32(st.st, 4, e.type);
    BindText(st.st, 5, e.node_id);
    BindText(st.st, 6, e.json);
    BindU64(st.st, 7, e.timestamp_ms);

    if (auto result = Translate(db, sqlite3_step(st.st)); !result) return result;
  }
  return Result::Ok();
}

std::vector<model::TraceEventRecord> SqliteRepository::ReadTraceEvents(Transaction& t, const std::string& execution_id) {
  Statement st(TX(t).Handle(), sql::SELECT_TRACE_EVENTS);
  if (!st) return {};

  BindText(st.st, 1, execution_id);
  return CollectRows<model::TraceEventRecord>(st.st, [](sqlite3_stmt* row) {
    model::TraceEventRecord r;
    r.id           = ColText(row, 0);
    r.execution_id = ColText(row, 1);
    r.sequence     = ColU64(row, 2);
    r.type         = ColI32(row, 3);
    r.node_id      = ColText(row, 4);
    r.json         = ColText(row, 5);
    r.timestamp_ms = ColU64(row, 6);
    return r;
  });
}

Result SqliteRepository::DeleteTraceEventsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_TRACE_EVENTS_OLDER_THAN);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.st, 1, cutoff_ms);
  return Translate(db, sqlite3_step(st.st));
}

} // namespace graphflow::db::sqlite
