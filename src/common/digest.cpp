#include "engram/common/digest.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace engram::common {

std::string sha256_hex(const std::string &bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

bool is_sha256_hex(const std::string &text) {
  if (text.size() != SHA256_DIGEST_LENGTH * 2) {
    return false;
  }
  for (const char ch : text) {
    const bool digit = ch >= '0' && ch <= '9';
    const bool lower_hex = ch >= 'a' && ch <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

} // namespace engram::common
