#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace edgestore::util {

/*
  JSON documents, rows and contexts use protobuf's JSON value model.

  Numbers are doubles (integers are exact up to 2^53).
*/
using Json = google::protobuf::Value;

// Throws InvalidArgument on malformed input.
Json ParseJson(std::string_view text);

// Compact rendering with object keys sorted, so equal values print equally.
std::string ToJson(const Json& value);

bool JsonEquals(const Json& lhs, const Json& rhs);

Json JsonString(std::string_view value);
Json JsonNumber(double value);
Json JsonBool(bool value);
Json JsonNull();
Json JsonObject();

bool IsObject(const Json& value);

// true when the number has no fractional part and fits in int64
bool IsIntegral(const Json& value);

} // namespace edgestore::util
