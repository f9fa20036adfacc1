#pragma once

#include <string>
#include <string_view>

namespace edgestore::util {

// Lowercase hex SHA-256 digest.
std::string Sha256Hex(std::string_view data);

} // namespace edgestore::util
