#include "pg_pool.hpp"

namespace graphflow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("upsert_state",
               "INSERT INTO workflow_state(state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json,blob_path,size_bytes,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8,$9,$10) "
               "ON CONFLICT(state_id) DO UPDATE SET inline_json=EXCLUDED.inline_json, blob_path=EXCLUDED.blob_path, "
               "size_bytes=EXCLUDED.size_bytes, created_at_ms=EXCLUDED.created_at_ms");

  conn.prepare("get_state",
               "SELECT state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json::text,blob_path,size_bytes,created_at_ms "
               "FROM workflow_state WHERE state_id=$1");

  conn.prepare("get_latest_state",
               "SELECT state_id,execution_id,workflow_id,tenant_id,branch_id,version,inline_json::text,blob_path,size_bytes,created_at_ms "
               "FROM workflow_state WHERE execution_id=$1 AND branch_id='' ORDER BY version DESC LIMIT 1");

  conn.prepare("insert_checkpoint",
               "INSERT INTO workflow_checkpoint(id,execution_id,workflow_id,node_id,state_id,state_version,location,type,description,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("insert_trace_event",
               "INSERT INTO trace_event(execution_id,sequence,id,type,node_id,json,timestamp_ms) VALUES($1,$2,$3,$4,$5,$6::jsonb,$7) "
               "ON CONFLICT(execution_id,sequence) DO NOTHING");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace graphflow::db::postgres
