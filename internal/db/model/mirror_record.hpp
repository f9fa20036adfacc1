#pragma once

#include <cstdint>
#include <string>

namespace edgestore::db::model {

/*
  One published snapshot of a global dataset.

  id is the insertion order and breaks ties between equal ts values.
*/
struct MirrorVersionRecord {
  std::uint64_t id = 0;
  std::string   dataset_id;
  std::string   version;
  std::string   checksum;
  std::int64_t  ts = 0;
};

/*
  One item of a dataset version. item is JSON text:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/
struct GlobalRowRecord {
  std::uint64_t id = 0;
  std::string   dataset_id;
  std::string   version;
  std::string   item;
};

} // namespace edgestore::db::model
