#include "lancet/core/random.h"

#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace lancet::core {

std::string to_hex(const unsigned char* data, const std::size_t size) {
  constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4U]);
    out.push_back(kDigits[data[i] & 0x0FU]);
  }
  return out;
}

std::string random_hex(const std::size_t num_bytes) {
  std::vector<unsigned char> buf(num_bytes);
  if (num_bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed: CSPRNG unavailable");
  }
  return to_hex(buf.data(), buf.size());
}

}  // namespace lancet::core
