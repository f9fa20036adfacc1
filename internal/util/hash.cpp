#include "hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace edgestore::util {

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

  std::ostringstream out;
  for (unsigned char c : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return out.str();
}

} // namespace edgestore::util
