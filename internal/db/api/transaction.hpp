#pragma once

#include <stdexcept>
#include <string>

namespace edgestore::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws TransactionConflict when the backend refuses the
    write set (optimistic validation, busy lock, serialization failure);
    nothing from the transaction is visible afterwards

  SQLite: BEGIN IMMEDIATE on a connection serialized per process
  Postgres: pqxx::work
  Memory: snapshot copy-on-write, validated against the commit counter
*/

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace edgestore::db
