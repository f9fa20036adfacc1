#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace edgestore::db::model {

enum class ColumnType {
  kString,
  kNumber,
  kInteger,
  kDatetime,
  kBoolean,
};

inline std::string_view ColumnTypeName(ColumnType type) {
  switch (type) {
    case ColumnType::kString:
      return "string";
    case ColumnType::kNumber:
      return "number";
    case ColumnType::kInteger:
      return "integer";
    case ColumnType::kDatetime:
      return "datetime";
    case ColumnType::kBoolean:
      return "boolean";
  }
  return "string";
}

inline std::optional<ColumnType> ParseColumnType(std::string_view text) {
  if (text == "string") return ColumnType::kString;
  if (text == "number") return ColumnType::kNumber;
  if (text == "integer") return ColumnType::kInteger;
  if (text == "datetime") return ColumnType::kDatetime;
  if (text == "boolean") return ColumnType::kBoolean;
  return std::nullopt;
}

/*
  Typed value stored in an index table.

    string   -> std::string
    number   -> double
    integer  -> int64
    datetime -> int64 (epoch ms)
    boolean  -> bool

  All entries of one index hold the same alternative, so variant ordering
  is the natural ordering of the column.
*/
using IndexValue = std::variant<bool, std::int64_t, double, std::string>;

enum class CompareOp {
  kEq,
  kLt,
  kLte,
  kGt,
  kGte,
  kIn,
};

// kIn uses every operand, the other operators only the first.
struct IndexLookup {
  CompareOp               op = CompareOp::kEq;
  std::vector<IndexValue> operands;
};

struct IndexEntryRecord {
  std::string pk;
  IndexValue  value;
};

inline bool MatchesLookup(const IndexValue& value, const IndexLookup& lookup) {
  if (lookup.operands.empty()) {
    return false;
  }
  const auto& operand = lookup.operands.front();
  switch (lookup.op) {
    case CompareOp::kEq:
      return value == operand;
    case CompareOp::kLt:
      return value < operand;
    case CompareOp::kLte:
      return value <= operand;
    case CompareOp::kGt:
      return value > operand;
    case CompareOp::kGte:
      return value >= operand;
    case CompareOp::kIn:
      for (const auto& candidate : lookup.operands) {
        if (value == candidate) return true;
      }
      return false;
  }
  return false;
}

} // namespace edgestore::db::model
