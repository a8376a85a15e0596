#pragma once

namespace graphflow::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements; column order must stay identical so the
  row readers can be shared in spirit.
*/

// state versions

static constexpr const char* UPSERT_STATE =
    "INSERT INTO workflow_state(state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json,blob_path,size_bytes,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(state_id) DO UPDATE SET"
    " inline_json=excluded.inline_json,"
    " blob_path=excluded.blob_path,"
    " size_bytes=excluded.size_bytes,"
    " created_at_ms=excluded.created_at_ms;";

#define GRAPHFLOW_STATE_COLUMNS "state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json,blob_path,size_bytes,created_at_ms"

static constexpr const char* SELECT_STATE = "SELECT " GRAPHFLOW_STATE_COLUMNS " FROM workflow_state WHERE state_id=?;";

static constexpr const char* SELECT_LATEST_STATE =
    "SELECT " GRAPHFLOW_STATE_COLUMNS " FROM workflow_state WHERE execution_id=? AND branch_id='' ORDER BY version DESC LIMIT 1;";

static constexpr const char* SELECT_STATES_FOR_EXECUTION =
    "SELECT " GRAPHFLOW_STATE_COLUMNS " FROM workflow_state WHERE execution_id=? ORDER BY version ASC, branch_id ASC;";

static constexpr const char* SELECT_STATES_OLDER_THAN = "SELECT " GRAPHFLOW_STATE_COLUMNS " FROM workflow_state WHERE created_at_ms<?;";

static constexpr const char* DELETE_STATE = "DELETE FROM workflow_state WHERE state_id=?;";

// checkpoints

static constexpr const char* INSERT_CHECKPOINT =
    "INSERT INTO workflow_checkpoint(id,execution_id,workflow_id,node_id,state_id,state_version,location,type,description,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

#define GRAPHFLOW_CHECKPOINT_COLUMNS "id,execution_id,workflow_id,node_id,state_id,state_version,location,type,description,created_at_ms"

static constexpr const char* SELECT_CHECKPOINT = "SELECT " GRAPHFLOW_CHECKPOINT_COLUMNS " FROM workflow_checkpoint WHERE id=?;";

static constexpr const char* SELECT_CHECKPOINTS_FOR_EXECUTION =
    "SELECT " GRAPHFLOW_CHECKPOINT_COLUMNS " FROM workflow_checkpoint WHERE execution_id=?"
    " ORDER BY created_at_ms DESC, state_version DESC, id DESC;";

static constexpr const char* SELECT_CHECKPOINTS_OLDER_THAN =
    "SELECT " GRAPHFLOW_CHECKPOINT_COLUMNS " FROM workflow_checkpoint WHERE created_at_ms<?;";

static constexpr const char* DELETE_CHECKPOINT = "DELETE FROM workflow_checkpoint WHERE id=?;";

// breakpoints

static constexpr const char* UPSERT_BREAKPOINT =
    "INSERT INTO debug_breakpoint(id,session_id,json,updated_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET session_id=excluded.session_id, json=excluded.json, updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_BREAKPOINTS_FOR_SESSION =
    "SELECT id,session_id,json,updated_at_ms FROM debug_breakpoint WHERE session_id=? ORDER BY id ASC;";

static constexpr const char* DELETE_BREAKPOINT = "DELETE FROM debug_breakpoint WHERE id=?;";

// trace events

static constexpr const char* INSERT_TRACE_EVENT =
    "INSERT INTO trace_event(execution_id,sequence,id,type,node_id,json,timestamp_ms) VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(execution_id,sequence) DO NOTHING;";

static constexpr const char* SELECT_TRACE_EVENTS =
    "SELECT id,execution_id,sequence,type,node_id,json,timestamp_ms FROM trace_event WHERE execution_id=? ORDER BY sequence ASC;";

static constexpr const char* DELETE_TRACE_EVENTS_OLDER_THAN = "DELETE FROM trace_event WHERE timestamp_ms<?;";

} // namespace graphflow::db::sql
