#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace graphflow::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("transaction already finished");
  }
  finished_ = true;
  if (!wrote_) return;

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::TransactionConflict("memory transaction lost to a writer that committed after snapshot v" +
                                    std::to_string(snapshot_version_));
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  working_  = {};
}

} // namespace graphflow::db::memory
