#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace edgestore::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex for its whole lifetime and uses
  BEGIN IMMEDIATE:
    - grabs write lock early
    - a busy database surfaces at BEGIN, not halfway through the write set
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace edgestore::db::sqlite
