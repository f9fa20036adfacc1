#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/util/json.hpp"

namespace edgestore::util {

/*
  Minimal JSONPath: "$" followed by any number of
    .name        object member (letters, digits, '_' and '-')
    ["name"]     object member, quoted with ' or "
    [n]          array element
  Wildcards, slices and filters are not supported.
*/
class JsonPath {
 public:
  // Throws InvalidPath on a malformed expression.
  static JsonPath Parse(std::string_view text);

  // nullptr when any segment is absent or has the wrong container type.
  const Json* Resolve(const Json& root) const;

  const std::string& Text() const {
    return text_;
  }

  bool IsRoot() const {
    return segments_.empty();
  }

 private:
  using Segment = std::variant<std::string, std::size_t>;

  std::string          text_;
  std::vector<Segment> segments_;
};

} // namespace edgestore::util
