#pragma once

namespace graphflow::db {

/*
  Abstract transaction.

  Every backend guarantees:

  - writes stay invisible to other transactions until Commit()
  - reads inside the transaction see its own writes
  - Rollback() discards the write set
  - the destructor rolls back anything not committed

  SQLite:   BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory:   snapshot copy-on-write, Commit() throws on a concurrent commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished
  virtual bool IsCommitted() const = 0;
};

} // namespace graphflow::db
