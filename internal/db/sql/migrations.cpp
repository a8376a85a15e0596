#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace graphflow::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  GRAPHFLOW_LOG_DEBUG("database migrations applied", {observability::IntField("statements", static_cast<int64_t>(ordered_sql.size()))});
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS workflow_state (state_id TEXT PRIMARY KEY, execution_id TEXT NOT NULL, workflow_id TEXT NOT NULL, "
      "tenant_id TEXT NOT NULL, branch_id TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL, inline_json TEXT, blob_path TEXT, "
      "size_bytes INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workflow_state_execution_idx ON workflow_state(execution_id, branch_id, version);",
      "CREATE INDEX IF NOT EXISTS workflow_state_created_idx ON workflow_state(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS workflow_checkpoint (id TEXT PRIMARY KEY, execution_id TEXT NOT NULL, workflow_id TEXT NOT NULL, "
      "node_id TEXT NOT NULL, state_id TEXT NOT NULL, state_version INTEGER NOT NULL, location INTEGER NOT NULL, type INTEGER NOT NULL, "
      "description TEXT, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workflow_checkpoint_execution_idx ON workflow_checkpoint(execution_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS debug_breakpoint (id TEXT PRIMARY KEY, session_id TEXT NOT NULL, json TEXT NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS debug_breakpoint_session_idx ON debug_breakpoint(session_id);",
      "CREATE TABLE IF NOT EXISTS trace_event (execution_id TEXT NOT NULL, sequence INTEGER NOT NULL, id TEXT NOT NULL, type INTEGER NOT NULL, "
      "node_id TEXT, json TEXT NOT NULL, timestamp_ms INTEGER NOT NULL, PRIMARY KEY (execution_id, sequence));",
      "CREATE INDEX IF NOT EXISTS trace_event_timestamp_idx ON trace_event(timestamp_ms);",
  };
  return schema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> schema = {
      "CREATE TABLE IF NOT EXISTS workflow_state (state_id TEXT PRIMARY KEY, execution_id TEXT NOT NULL, workflow_id TEXT NOT NULL, "
      "tenant_id TEXT NOT NULL, branch_id TEXT NOT NULL DEFAULT '', version BIGINT NOT NULL, inline_json JSONB, blob_path TEXT, "
      "size_bytes BIGINT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workflow_state_execution_idx ON workflow_state(execution_id, branch_id, version);",
      "CREATE INDEX IF NOT EXISTS workflow_state_created_idx ON workflow_state(created_at_ms);",
      "CREATE TABLE IF NOT EXISTS workflow_checkpoint (id TEXT PRIMARY KEY, execution_id TEXT NOT NULL, workflow_id TEXT NOT NULL, "
      "node_id TEXT NOT NULL, state_id TEXT NOT NULL, state_version BIGINT NOT NULL, location SMALLINT NOT NULL, type SMALLINT NOT NULL, "
      "description TEXT, created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workflow_checkpoint_execution_idx ON workflow_checkpoint(execution_id, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS debug_breakpoint (id TEXT PRIMARY KEY, session_id TEXT NOT NULL, json JSONB NOT NULL, "
      "updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS debug_breakpoint_session_idx ON debug_breakpoint(session_id);",
      "CREATE TABLE IF NOT EXISTS trace_event (execution_id TEXT NOT NULL, sequence BIGINT NOT NULL, id TEXT NOT NULL, type SMALLINT NOT NULL, "
      "node_id TEXT, json JSONB NOT NULL, timestamp_ms BIGINT NOT NULL, PRIMARY KEY (execution_id, sequence));",
      "CREATE INDEX IF NOT EXISTS trace_event_timestamp_idx ON trace_event(timestamp_ms);",
  };
  return schema;
}

} // namespace graphflow::db::sql
