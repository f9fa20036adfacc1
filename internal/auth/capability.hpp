#pragma once

#include <optional>
#include <string_view>

namespace edgestore::auth {

/*
  Fixed capability roles.

    writer  every operation
    reader  reads only; mutations fail with Unauthorized
*/
enum class Capability {
  kWriter,
  kReader,
};

inline std::string_view CapabilityName(Capability capability) {
  return capability == Capability::kReader ? "reader" : "writer";
}

inline std::optional<Capability> ParseCapability(std::string_view text) {
  if (text == "writer") return Capability::kWriter;
  if (text == "reader") return Capability::kReader;
  return std::nullopt;
}

} // namespace edgestore::auth
