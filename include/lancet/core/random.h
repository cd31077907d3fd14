#pragma once

#include <cstddef>
#include <string>

namespace lancet::core {

// random_hex returns num_bytes of CSPRNG output (OpenSSL RAND_bytes) as lower-case hex.
// The result has 2 * num_bytes characters.
// Throws std::runtime_error if the generator is not seeded.
[[nodiscard]] std::string random_hex(std::size_t num_bytes);

// to_hex renders raw bytes as lower-case hex.
[[nodiscard]] std::string to_hex(const unsigned char* data, std::size_t size);

}  // namespace lancet::core
