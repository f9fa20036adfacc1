#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/index_entry.hpp"

namespace edgestore::db::model {

struct UserTableRecord {
  std::uint64_t id = 0;
  std::string   user_id;
  std::string   table_name;

  // physical document table; stable for the table's lifetime
  std::string phy_table;

  std::string  pk_path;
  std::string  ts_path;
  std::int64_t created_at = 0;
};

// building: backfill has not completed, the index must not answer queries
enum class IndexState {
  kBuilding,
  kReady,
};

inline std::string_view IndexStateName(IndexState state) {
  return state == IndexState::kReady ? "ready" : "building";
}

inline std::optional<IndexState> ParseIndexState(std::string_view text) {
  if (text == "ready") return IndexState::kReady;
  if (text == "building") return IndexState::kBuilding;
  return std::nullopt;
}

struct UserTableIndexRecord {
  std::uint64_t id = 0;
  std::string   user_id;
  std::string   table_name;
  std::string   col_name;
  std::string   json_path;
  ColumnType    col_type = ColumnType::kString;
  IndexState    state    = IndexState::kBuilding;
};

} // namespace edgestore::db::model
