#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/index_entry.hpp"
#include "internal/util/json.hpp"
#include "internal/util/json_path.hpp"

namespace edgestore::userdb {

/*
  Typed extraction from UserDB documents.

    string   JSON string
    number   any JSON number
    integer  JSON number without a fractional part
    boolean  JSON bool
    datetime ISO-8601 string, stored as epoch ms

  Absent and null values yield nullopt and are never indexed.
*/

inline constexpr std::size_t kMaxPrimaryKeyLength = 191;

// Throws InvalidPath when the value exists but does not fit the type.
std::optional<db::model::IndexValue> ExtractColumnValue(const util::Json& doc, const util::JsonPath& path, db::model::ColumnType type);

// Like ExtractColumnValue, but a mismatching value is treated as absent.
std::optional<db::model::IndexValue> TryExtractColumnValue(const util::Json& doc, const util::JsonPath& path, db::model::ColumnType type);

// Predicate operand to the column's storage type; InvalidArgument on mismatch.
db::model::IndexValue CoerceOperand(const util::Json& operand, db::model::ColumnType type);

// Column type assumed for an unindexed column, from the operand's JSON type.
db::model::ColumnType InferColumnType(const util::Json& operand);

// String or integral number rendered in decimal; InvalidPath otherwise.
std::string ExtractPrimaryKey(const util::Json& doc, const util::JsonPath& path);

// Integral number, ISO-8601 string or decimal digits; nullopt when absent.
// InvalidPath for any other value.
std::optional<std::int64_t> ExtractTimestamp(const util::Json& doc, const util::JsonPath& path);

std::optional<db::model::CompareOp> ParseCompareOp(std::string_view text);
std::string_view                    CompareOpName(db::model::CompareOp op);

} // namespace edgestore::userdb
