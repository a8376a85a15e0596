#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    GRAPHFLOW_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) throw util::InvalidState("transaction already finished");
  tx_->commit();
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  tx_->abort();
  finished_ = true;
}

} // namespace graphflow::db::postgres
