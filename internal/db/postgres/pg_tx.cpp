#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace edgestore::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  conn_ = pool->Acquire();
  tx_   = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& ex) {
    EDGESTORE_LOG_WARN("postgres rollback failed", {observability::StringField("error", ex.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) return;
  try {
    tx_->commit();
  } catch (const pqxx::transaction_rollback& ex) {
    finished_ = true;
    throw TransactionConflict(std::string("postgres: ") + ex.what());
  }
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace edgestore::db::postgres
