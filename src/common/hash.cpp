#include "strata/common/hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace strata::common {

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

std::string random_id(const std::string &prefix, const std::size_t bytes) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::ostringstream out;
  out << prefix;
  for (std::size_t i = 0; i < bytes; ++i) {
    const auto value = static_cast<unsigned>(rng() & 0xFFULL);
    out << "0123456789abcdef"[value >> 4U] << "0123456789abcdef"[value & 0x0FU];
  }
  return out.str();
}

} // namespace strata::common
