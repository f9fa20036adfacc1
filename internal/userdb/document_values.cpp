#include "document_values.hpp"


#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace edgestore::userdb {

using db::model::ColumnType;
using db::model::CompareOp;
using db::model::IndexValue;

namespace {

// nullopt when value does not fit type
std::optional<IndexValue> Convert(const util::Json& value, ColumnType type) {
  switch (type) {
    case ColumnType::kString:
      if (value.kind_case() == util::Json::kStringValue) return IndexValue{value.string_value()};
      break;
    case ColumnType::kNumber:
      if (value.kind_case() == util::Json::kNumberValue) return IndexValue{value.number_value()};
      break;
    case ColumnType::kInteger:
      if (util::IsIntegral(value)) return IndexValue{static_cast<std::int64_t>(value.number_value())};
      break;
    case ColumnType::kBoolean:
      if (value.kind_case() == util::Json::kBoolValue) return IndexValue{value.bool_value()};
      break;
    case ColumnType::kDatetime:
      if (value.kind_case() == util::Json::kStringValue) {
        if (auto ms = util::ParseIso8601Millis(value.string_value())) return IndexValue{*ms};
      }
      break;
  }
  return std::nullopt;
}

bool IsAbsent(const util::Json* value) {
  return value == nullptr || value->kind_case() == util::Json::kNullValue || value->kind_case() == util::Json::KIND_NOT_SET;
}

bool IsDecimalDigits(const std::string& text) {
  if (text.empty() || text.size() > 18) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

} // namespace

std::optional<IndexValue> ExtractColumnValue(const util::Json& doc, const util::JsonPath& path, ColumnType type) {
  const auto* value = path.Resolve(doc);
  if (IsAbsent(value)) {
    return std::nullopt;
  }
  auto converted = Convert(*value, type);
  if (!converted) {
    throw util::InvalidPath("value at " + path.Text() + " is " + util::ToJson(*value) + ", not a " + std::string(db::model::ColumnTypeName(type)));
  }
  return converted;
}

std::optional<IndexValue> TryExtractColumnValue(const util::Json& doc, const util::JsonPath& path, ColumnType type) {
  const auto* value = path.Resolve(doc);
  if (IsAbsent(value)) {
    return std::nullopt;
  }
  return Convert(*value, type);
}

IndexValue CoerceOperand(const util::Json& operand, ColumnType type) {
  auto converted = Convert(operand, type);
  if (!converted) {
    throw util::InvalidArgument("operand " + util::ToJson(operand) + " is not a " + std::string(db::model::ColumnTypeName(type)));
  }
  return *converted;
}

ColumnType InferColumnType(const util::Json& operand) {
  switch (operand.kind_case()) {
    case util::Json::kNumberValue:
      return ColumnType::kNumber;
    case util::Json::kBoolValue:
      return ColumnType::kBoolean;
    case util::Json::kStringValue:
      return ColumnType::kString;
    default:
      throw util::InvalidArgument("operand " + util::ToJson(operand) + " has no comparable type");
  }
}

std::string ExtractPrimaryKey(const util::Json& doc, const util::JsonPath& path) {
  const auto* value = path.Resolve(doc);
  if (IsAbsent(value)) {
    throw util::InvalidPath("primary key at " + path.Text() + " is missing");
  }

  std::string pk;
  if (value->kind_case() == util::Json::kStringValue) {
    pk = value->string_value();
  } else if (util::IsIntegral(*value)) {
    pk = std::to_string(static_cast<std::int64_t>(value->number_value()));
  } else {
    throw util::InvalidPath("primary key at " + path.Text() + " must be a string or an integer");
  }

  if (pk.empty() || pk.size() > kMaxPrimaryKeyLength) {
    throw util::InvalidPath("primary key at " + path.Text() + " must be 1.." + std::to_string(kMaxPrimaryKeyLength) + " characters");
  }
  return pk;
}

std::optional<std::int64_t> ExtractTimestamp(const util::Json& doc, const util::JsonPath& path) {
  const auto* value = path.Resolve(doc);
  if (IsAbsent(value)) {
    return std::nullopt;
  }
  if (util::IsIntegral(*value)) {
    return static_cast<std::int64_t>(value->number_value());
  }
  if (value->kind_case() == util::Json::kStringValue) {
    const auto& text = value->string_value();
    if (IsDecimalDigits(text)) {
      return std::stoll(text);
    }
    if (auto ms = util::ParseIso8601Millis(text)) {
      return ms;
    }
  }
  throw util::InvalidPath("timestamp at " + path.Text() + " must be an integer, digits or an ISO-8601 datetime");
}

std::optional<CompareOp> ParseCompareOp(std::string_view text) {
  if (text == "eq") return CompareOp::kEq;
  if (text == "lt") return CompareOp::kLt;
  if (text == "lte") return CompareOp::kLte;
  if (text == "gt") return CompareOp::kGt;
  if (text == "gte") return CompareOp::kGte;
  if (text == "in") return CompareOp::kIn;
  return std::nullopt;
}

std::string_view CompareOpName(CompareOp op) {
  switch (op) {
    case CompareOp::kEq:
      return "eq";
    case CompareOp::kLt:
      return "lt";
    case CompareOp::kLte:
      return "lte";
    case CompareOp::kGt:
      return "gt";
    case CompareOp::kGte:
      return "gte";
    case CompareOp::kIn:
      return "in";
  }
  return "eq";
}

} // namespace edgestore::userdb
