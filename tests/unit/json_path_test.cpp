#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/json_path.hpp"

namespace {

using edgestore::util::JsonPath;
using edgestore::util::ParseJson;
using edgestore::util::ToJson;

void TestResolvesMembersAndIndexes() {
  const auto doc = ParseJson(R"({"order":{"id":"o1","lines":[{"sku":"A1"},{"sku":"B2"}],"ship-to":{"zip":"10115"}}})");

  const auto* id = JsonPath::Parse("$.order.id").Resolve(doc);
  assert(id && id->string_value() == "o1");

  const auto* sku = JsonPath::Parse("$.order.lines[1].sku").Resolve(doc);
  assert(sku && sku->string_value() == "B2");

  const auto* zip = JsonPath::Parse(R"($["order"]['ship-to'].zip)").Resolve(doc);
  assert(zip && zip->string_value() == "10115");

  assert(JsonPath::Parse("$").IsRoot());
  assert(JsonPath::Parse("$").Resolve(doc) == &doc);
}

void TestMissingSegmentsResolveToNull() {
  const auto doc = ParseJson(R"({"a":{"b":[1,2]}})");
  assert(JsonPath::Parse("$.a.c").Resolve(doc) == nullptr);
  assert(JsonPath::Parse("$.a.b[2]").Resolve(doc) == nullptr);
  assert(JsonPath::Parse("$.a.b.c").Resolve(doc) == nullptr);
  assert(JsonPath::Parse("$.a[0]").Resolve(doc) == nullptr);
}

void TestMalformedPathsAreRejected() {
  for (const char* text : {"", "a.b", "$.", "$..a", "$[", "$[x]", "$['a'", "$.a b", "$[1"}) {
    bool threw = false;
    try {
      (void)JsonPath::Parse(text);
    } catch (const edgestore::util::InvalidPath&) {
      threw = true;
    }
    assert(threw && "malformed path must raise InvalidPath");
  }
}

void TestCanonicalRendering() {
  const auto value = ParseJson(R"({ "b": 1, "a": [true, null, "x"], "c": {"z": 1.5, "y": "q"} })");
  assert(ToJson(value) == R"({"a":[true,null,"x"],"b":1,"c":{"y":"q","z":1.5}})");
  assert(edgestore::util::JsonEquals(value, ParseJson(ToJson(value))));
  assert(edgestore::util::IsIntegral(ParseJson("42")));
  assert(!edgestore::util::IsIntegral(ParseJson("4.2")));
}

void TestMalformedJsonIsInvalidArgument() {
  bool threw = false;
  try {
    (void)ParseJson("{\"a\":");
  } catch (const edgestore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestResolvesMembersAndIndexes();
  TestMissingSegmentsResolveToNull();
  TestMalformedPathsAreRejected();
  TestCanonicalRendering();
  TestMalformedJsonIsInvalidArgument();

  std::cout << "edgestore_unit_json_path: pass\n";
  return 0;
}
