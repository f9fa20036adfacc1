#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace edgestore::db::memory {

/*
  Transaction = snapshot + write set

  Commit is optimistic and per section: a transaction fails with
  TransactionConflict when another writer committed to one of the sections it
  wrote after its snapshot was taken. Only written sections are published, so
  reads see a stable snapshot and disjoint writers do not abort each other.
  Read-only transactions always commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable(MemoryRepository::Section section) {
    dirty_[static_cast<std::size_t>(section)] = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&                                 repo_;
  MemoryRepository::State                           working_;
  MemoryRepository::SectionVersions                 snapshot_versions_{};
  std::array<bool, MemoryRepository::kSectionCount> dirty_{};
  bool                                              committed_   = false;
  bool                                              rolled_back_ = false;
};

} // namespace edgestore::db::memory
