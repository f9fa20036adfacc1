#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace edgestore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    EDGESTORE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) return;
  // a failed COMMIT leaves the transaction open; the destructor rolls it back
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace edgestore::db::sqlite
