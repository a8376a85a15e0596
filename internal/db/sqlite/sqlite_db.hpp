#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace graphflow::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; TxMutex() serializes
  them because sqlite does not nest BEGIN on a single connection.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  // WAL, foreign keys, busy timeout
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace graphflow::db::sqlite
