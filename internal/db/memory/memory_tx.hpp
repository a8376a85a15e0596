#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace graphflow::db::memory {

/*
  Optimistic transaction over a private copy of the committed tables.

  Reads see the snapshot taken at Begin. A transaction that wrote
  anything commits only if no other writer committed since its snapshot;
  otherwise it throws util::TransactionConflict. Read-only transactions
  always commit.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    wrote_            = false;
  bool                    finished_         = false;
};

} // namespace graphflow::db::memory
