#include "pg_repository.hpp"

#include <optional>

namespace graphflow::db::postgres {

namespace {

constexpr const char* kStateColumns =
    "state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json::text,blob_path,size_bytes,created_at_ms";

constexpr const char* kCheckpointColumns = "id,execution_id,workflow_id,node_id,state_id,state_version,location,type,description,created_at_ms";

std::optional<std::string> NullIfEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::StateRecord ReadState(const pqxx::row& row) {
  model::StateRecord r;
  r.state_id      = row[0].c_str();
  r.execution_id  = row[1].c_str();
  r.workflow_id   = row[2].c_str();
  r.tenant_id     = row[3].c_str();
  r.branch_id     = TextOrEmpty(row[4]);
  r.version       = row[5].as<uint64_t>();
  r.inline_json   = TextOrEmpty(row[6]);
  r.blob_path     = TextOrEmpty(row[7]);
  r.size_bytes    = row[8].as<uint64_t>();
  r.created_at_ms = row[9].as<uint64_t>();
  return r;
}

model::CheckpointRecord ReadCheckpoint(const pqxx::row& row) {
  model::CheckpointRecord r;
  r.id            = row[0].c_str();
  r.execution_id  = row[1].c_str();
  r.workflow_id   = row[2].c_str();
  r.node_id       = row[3].c_str();
  r.state_id      = row[4].c_str();
  r.state_version = row[5].as<uint64_t>();
  r.location      = static_cast<graphflow::v1::StorageLocation>(row[6].as<int>());
  r.type          = static_cast<graphflow::v1::CheckpointType>(row[7].as<int>());
  r.description   = TextOrEmpty(row[8]);
  r.created_at_ms = row[9].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// State versions
// ------------------------------------------------------------------

Result PgRepository::UpsertState(Transaction& t, const model::StateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_state", r.state_id, r.execution_id, r.workflow_id, r.tenant_id, r.branch_id, r.version,
                               NullIfEmpty(r.inline_json), NullIfEmpty(r.blob_path), r.size_bytes, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::StateRecord> PgRepository::GetState(Transaction& t, const std::string& state_id) {
  auto res = TX(t).Work().exec_prepared("get_state", state_id);
  if (res.empty()) return std::nullopt;
  return ReadState(res[0]);
}

std::optional<model::StateRecord> PgRepository::GetLatestState(Transaction& t, const std::string& execution_id) {
  auto res = TX(t).Work().exec_prepared("get_latest_state", execution_id);
  if (res.empty()) return std::nullopt;
  return ReadState(res[0]);
}

std::vector<model::StateRecord> PgRepository::ListStates(Transaction& t, const std::string& execution_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kStateColumns + " FROM workflow_state WHERE execution_id=$1 ORDER BY version ASC, branch_id ASC;", execution_id);

  std::vector<model::StateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadState(row));
  }
  return out;
}

std::vector<model::StateRecord> PgRepository::ListStatesOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kStateColumns + " FROM workflow_state WHERE created_at_ms<$1;", cutoff_ms);

  std::vector<model::StateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadState(row));
  }
  return out;
}

Result PgRepository::DeleteState(Transaction& t, const std::string& state_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM workflow_state WHERE state_id=$1;", state_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result PgRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_checkpoint", r.id, r.execution_id, r.workflow_id, r.node_id, r.state_id, r.state_version,
                               static_cast<int>(r.location), static_cast<int>(r.type), r.description, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CheckpointRecord> PgRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCheckpointColumns + " FROM workflow_checkpoint WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadCheckpoint(res[0]);
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpoints(Transaction& t, const std::string& execution_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kCheckpointColumns +
                                          " FROM workflow_checkpoint WHERE execution_id=$1 ORDER BY created_at_ms DESC, state_version DESC, id DESC;",
                                      execution_id);

  std::vector<model::CheckpointRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadCheckpoint(row));
  }
  return out;
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpointsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto res =
      TX(t).Work().exec_params(std::string("SELECT ") + kCheckpointColumns + " FROM workflow_checkpoint WHERE created_at_ms<$1;", cutoff_ms);

  std::vector<model::CheckpointRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadCheckpoint(row));
  }
  return out;
}

Result PgRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM workflow_checkpoint WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Breakpoints
// ------------------------------------------------------------------

Result PgRepository::UpsertBreakpoint(Transaction& t, const model::BreakpointRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO debug_breakpoint(id,session_id,json,updated_at_ms) VALUES($1,$2,$3::jsonb,$4) "
        "ON CONFLICT(id) DO UPDATE SET session_id=EXCLUDED.session_id, json=EXCLUDED.json, updated_at_ms=EXCLUDED.updated_at_ms;",
        r.id, r.session_id, r.json, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BreakpointRecord> PgRepository::ListBreakpoints(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_params("SELECT id,session_id,json::text,updated_at_ms FROM debug_breakpoint WHERE session_id=$1 ORDER BY id ASC;",
                                      session_id);

  std::vector<model::BreakpointRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::BreakpointRecord r;
    r.id            = row[0].c_str();
    r.session_id    = row[1].c_str();
    r.json          = row[2].c_str();
    r.updated_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteBreakpoint(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_params("DELETE FROM debug_breakpoint WHERE id=$1;", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Trace events
// ------------------------------------------------------------------

Result PgRepository::AppendTraceEvents(Transaction& t, const std::vector<model::TraceEventRecord>& events) {
  try {
    auto& work = TX(t).Work();
    for (const auto& e : events) {
      work.exec_prepared("insert_trace_event", e.execution_id, e.sequence, e.id, e.type, e.node_id, e.json, e.timestamp_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TraceEventRecord> PgRepository::ReadTraceEvents(Transaction& t, const std::string& execution_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,execution_id,sequence,type,node_id,json::text,timestamp_ms FROM trace_event WHERE execution_id=$1 ORDER BY sequence ASC;",
      execution_id);

  std::vector<model::TraceEventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::TraceEventRecord r;
    r.id           = row[0].c_str();
    r.execution_id = row[1].c_str();
    r.sequence     = row[2].as<uint64_t>();
    r.type         = row[3].as<int>();
    r.node_id      = TextOrEmpty(row[4]);
    r.json         = row[5].c_str();
    r.timestamp_ms = row[6].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteTraceEventsOlderThan(Transaction& t, uint64_t cutoff_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM trace_event WHERE timestamp_ms<$1;", cutoff_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace graphflow::db::postgres
