#pragma once

#include <cstdint>
#include <string>

namespace edgestore::db::model {

struct UserContextRecord {
  std::uint64_t id = 0;
  std::string   user_id;
  std::string   dataset_id;

  // JSON object text
  std::string ctx;

  std::int64_t ts = 0;
};

} // namespace edgestore::db::model
