#include "memory_tx.hpp"

#include <algorithm>

namespace edgestore::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_           = repo_.committed_; // snapshot copy
  snapshot_versions_ = repo_.section_versions_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    return;
  }
  if (std::none_of(dirty_.begin(), dirty_.end(), [](bool d) { return d; })) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  for (std::size_t i = 0; i < dirty_.size(); ++i) {
    if (dirty_[i] && repo_.section_versions_[i] != snapshot_versions_[i]) {
      rolled_back_ = true;
      throw TransactionConflict("memory transaction conflict: state was modified by a concurrent transaction");
    }
  }
  for (std::size_t i = 0; i < dirty_.size(); ++i) {
    if (!dirty_[i]) continue;
    MemoryRepository::TakeSection(repo_.committed_, working_, static_cast<MemoryRepository::Section>(i));
    repo_.section_versions_[i]++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace edgestore::db::memory
