#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace edgestore::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction of the process; TxMutex()
  serializes them, so only one BEGIN ... COMMIT is open at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws TransactionConflict on SQLITE_BUSY / SQLITE_LOCKED.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode, int busy_timeout_ms);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace edgestore::db::sqlite
