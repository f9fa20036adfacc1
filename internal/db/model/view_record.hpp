#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace edgestore::db::model {

// Append-only; id is assigned by the repository in append order.
struct UserViewRecord {
  std::uint64_t id = 0;
  std::string   user_id;
  std::string   dataset_id;
  std::string   version;
  std::string   item;
  std::int64_t  ts = 0;
};

// Keyset page over the view log, ordered by id.
struct UserViewQuery {
  std::string   user_id;
  std::string   dataset_id;
  // empty matches every version
  std::string   version;
  std::int64_t  since_ts = 0;
  std::uint64_t after_id = 0;
  std::size_t   limit    = 0;
};

} // namespace edgestore::db::model
