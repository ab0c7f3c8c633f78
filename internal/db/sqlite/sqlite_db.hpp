#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace caretask::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions; transactions serialize on
  TxMutex() so BEGIN IMMEDIATE never nests on the same handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace caretask::db::sqlite
