#pragma once

#include <array>
#include <string>
#include <string_view>

#include "internal/util/hash.hpp"

namespace edgestore::db::sql {

/*
  Physical names that are spliced into SQL text.

  Only [A-Za-z_][A-Za-z0-9_]{0,62} is accepted, so a validated name can be
  double-quoted without escaping on every backend.
*/

inline bool IsValidIdentifier(std::string_view name) {
  if (name.empty() || name.size() > 63) return false;
  auto alpha = [](char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; };
  if (!alpha(name.front())) return false;
  for (char c : name) {
    if (!alpha(c) && !(c >= '0' && c <= '9')) return false;
  }
  return true;
}

// Names owned by the schema itself; never valid as a UserDB physical table.
inline bool IsReservedTableName(std::string_view name) {
  static constexpr std::array<std::string_view, 7> kSystemTables = {
      "global_mirror_versions", "global_rows",          "user_contexts", "user_views",
      "userdb_tables",          "userdb_table_indexes", "init_complete",
  };
  for (auto reserved : kSystemTables) {
    if (name == reserved) return true;
  }
  return name.rfind("udbx_", 0) == 0;
}

inline std::string Quote(std::string_view name) {
  return "\"" + std::string(name) + "\"";
}

// Deterministic per-tenant document table name.
inline std::string DocumentTableName(std::string_view user_id, std::string_view table_name) {
  return "udb_" + util::Sha256Hex(std::string(user_id) + ":" + std::string(table_name)).substr(0, 16);
}

// Auxiliary typed table backing one secondary index.
inline std::string IndexTableName(std::string_view phy_table, std::string_view col_name) {
  return "udbx_" + util::Sha256Hex(std::string(phy_table) + ":" + std::string(col_name)).substr(0, 16);
}

} // namespace edgestore::db::sql
