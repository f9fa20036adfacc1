#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace edgestore::db::model {

// One row of a physical UserDB document table.
struct DocumentRecord {
  std::string  pk;
  std::string  item;
  std::int64_t updated_at = 0;
};

enum class DocumentWriteMode {
  // unconditional replace
  kReplace,
  // write only when absent or stored updated_at < incoming; otherwise Conflict
  kIfNewer,
};

enum class DocumentOrder {
  kByPk,
  kUpdatedAsc,
  kUpdatedDesc,
};

struct DocumentScan {
  std::optional<std::int64_t> updated_since;
  // keyset cursor, honoured for kByPk only
  std::string   after_pk;
  std::size_t   limit = 0;
  DocumentOrder order = DocumentOrder::kByPk;
};

} // namespace edgestore::db::model
