#include "json_path.hpp"

#include "internal/util/errors.hpp"

namespace edgestore::util {

namespace {

bool IsMemberChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

[[noreturn]] void Fail(std::string_view text, std::size_t pos, std::string_view reason) {
  throw InvalidPath("invalid JSON path '" + std::string(text) + "' at offset " + std::to_string(pos) + ": " + std::string(reason));
}

} // namespace

JsonPath JsonPath::Parse(std::string_view text) {
  JsonPath path;
  path.text_ = std::string(text);

  if (text.empty() || text[0] != '$') {
    Fail(text, 0, "must start with '$'");
  }

  std::size_t pos = 1;
  while (pos < text.size()) {
    if (text[pos] == '.') {
      const std::size_t start = ++pos;
      while (pos < text.size() && IsMemberChar(text[pos])) {
        ++pos;
      }
      if (pos == start) {
        Fail(text, start, "empty member name");
      }
      path.segments_.emplace_back(std::string(text.substr(start, pos - start)));
      continue;
    }

    if (text[pos] == '[') {
      ++pos;
      if (pos < text.size() && (text[pos] == '"' || text[pos] == '\'')) {
        const char  quote = text[pos];
        std::string member;
        ++pos;
        while (pos < text.size() && text[pos] != quote) {
          if (text[pos] == '\\' && pos + 1 < text.size()) {
            ++pos;
          }
          member.push_back(text[pos]);
          ++pos;
        }
        if (pos >= text.size()) {
          Fail(text, pos, "unterminated quoted member");
        }
        ++pos; // closing quote
        if (pos >= text.size() || text[pos] != ']') {
          Fail(text, pos, "expected ']'");
        }
        ++pos;
        path.segments_.emplace_back(std::move(member));
        continue;
      }

      const std::size_t start = pos;
      std::size_t       index = 0;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
        index = index * 10 + static_cast<std::size_t>(text[pos] - '0');
        ++pos;
      }
      if (pos == start) {
        Fail(text, start, "expected array index or quoted member");
      }
      if (pos >= text.size() || text[pos] != ']') {
        Fail(text, pos, "expected ']'");
      }
      ++pos;
      path.segments_.emplace_back(index);
      continue;
    }

    Fail(text, pos, "unexpected character");
  }

  return path;
}

const Json* JsonPath::Resolve(const Json& root) const {
  const Json* current = &root;
  for (const auto& segment : segments_) {
    if (const auto* member = std::get_if<std::string>(&segment)) {
      if (current->kind_case() != Json::kStructValue) {
        return nullptr;
      }
      const auto& fields = current->struct_value().fields();
      auto        it     = fields.find(*member);
      if (it == fields.end()) {
        return nullptr;
      }
      current = &it->second;
      continue;
    }

    const auto index = std::get<std::size_t>(segment);
    if (current->kind_case() != Json::kListValue || index >= static_cast<std::size_t>(current->list_value().values_size())) {
      return nullptr;
    }
    current = &current->list_value().values(static_cast<int>(index));
  }
  return current;
}

} // namespace edgestore::util
