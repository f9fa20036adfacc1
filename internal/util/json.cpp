#include "json.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "internal/util/errors.hpp"

namespace edgestore::util {

namespace {

std::string ScalarToJson(const Json& value) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    throw InvalidArgument("unprintable JSON value: " + std::string(status.message()));
  }
  return out;
}

void AppendJson(const Json& value, std::string& out) {
  switch (value.kind_case()) {
    case Json::kStructValue: {
      const auto&                     fields = value.struct_value().fields();
      std::vector<const std::string*> keys;
      keys.reserve(fields.size());
      for (const auto& [key, _] : fields) {
        keys.push_back(&key);
      }
      std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

      out.push_back('{');
      bool first = true;
      for (const auto* key : keys) {
        if (!first) out.push_back(',');
        first = false;
        out += ScalarToJson(JsonString(*key));
        out.push_back(':');
        AppendJson(fields.at(*key), out);
      }
      out.push_back('}');
      return;
    }
    case Json::kListValue: {
      out.push_back('[');
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) out.push_back(',');
        first = false;
        AppendJson(item, out);
      }
      out.push_back(']');
      return;
    }
    case Json::KIND_NOT_SET:
      out += "null";
      return;
    default:
      out += ScalarToJson(value);
      return;
  }
}

} // namespace

Json ParseJson(std::string_view text) {
  Json value;
  auto status = google::protobuf::util::JsonStringToMessage(google::protobuf::StringPiece(text.data(), text.size()), &value);
  if (!status.ok()) {
    throw InvalidArgument("malformed JSON: " + std::string(status.message()));
  }
  return value;
}

std::string ToJson(const Json& value) {
  std::string out;
  AppendJson(value, out);
  return out;
}

bool JsonEquals(const Json& lhs, const Json& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

Json JsonString(std::string_view value) {
  Json json;
  json.set_string_value(std::string(value));
  return json;
}

Json JsonNumber(double value) {
  Json json;
  json.set_number_value(value);
  return json;
}

Json JsonBool(bool value) {
  Json json;
  json.set_bool_value(value);
  return json;
}

Json JsonNull() {
  Json json;
  json.set_null_value(google::protobuf::NULL_VALUE);
  return json;
}

Json JsonObject() {
  Json json;
  json.mutable_struct_value();
  return json;
}

bool IsObject(const Json& value) {
  return value.kind_case() == Json::kStructValue;
}

bool IsIntegral(const Json& value) {
  if (value.kind_case() != Json::kNumberValue) {
    return false;
  }
  const double number = value.number_value();
  return std::isfinite(number) && std::trunc(number) == number && std::fabs(number) <= 9007199254740992.0;
}

} // namespace edgestore::util
