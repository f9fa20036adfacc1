#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace edgestore::userdb {

/*
  Process-wide metadata locks, one per (user, table).

  Schema changes (CreateIndex, DropIndex, DropTable) hold the lock exclusively,
  writes hold it shared, queries do not take it.

  The registry only tracks locks somebody currently holds: an entry is created
  by the first Acquire and erased when the last returned pointer is released.
  Must be owned by a shared_ptr.
*/
class TableLockRegistry : public std::enable_shared_from_this<TableLockRegistry> {
 public:
  std::shared_ptr<std::shared_mutex> Acquire(const std::string& user_id, const std::string& table_name);

  std::size_t Size() const;

 private:
  using Key = std::pair<std::string, std::string>;

  void Release(const Key& key);

  mutable std::mutex                             mutex_;
  std::map<Key, std::weak_ptr<std::shared_mutex>> locks_;
};

} // namespace edgestore::userdb
