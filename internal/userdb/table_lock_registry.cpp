#include "table_lock_registry.hpp"

namespace edgestore::userdb {

std::shared_ptr<std::shared_mutex> TableLockRegistry::Acquire(const std::string& user_id, const std::string& table_name) {
  std::lock_guard lock(mutex_);
  Key             key{user_id, table_name};
  auto&           slot = locks_[key];
  if (auto live = slot.lock()) {
    return live;
  }

  std::weak_ptr<TableLockRegistry>   weak_self = weak_from_this();
  std::shared_ptr<std::shared_mutex> created(new std::shared_mutex(), [weak_self, key](std::shared_mutex* released) {
    delete released;
    if (auto self = weak_self.lock()) {
      self->Release(key);
    }
  });
  slot = created;
  return created;
}

void TableLockRegistry::Release(const Key& key) {
  std::lock_guard lock(mutex_);
  auto            it = locks_.find(key);
  // a newer lock may already occupy the slot
  if (it != locks_.end() && it->second.expired()) {
    locks_.erase(it);
  }
}

std::size_t TableLockRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return locks_.size();
}

} // namespace edgestore::userdb
