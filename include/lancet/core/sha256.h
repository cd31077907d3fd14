#pragma once

#include <string>
#include <string_view>

namespace lancet::core {

// sha256_hex returns the SHA-256 digest of input as a 64-character lower-case hex string.
// Backed by OpenSSL EVP.
[[nodiscard]] std::string sha256_hex(std::string_view input);

// sha256_prefix returns the first n hex characters of sha256_hex(input).
[[nodiscard]] std::string sha256_prefix(std::string_view input, std::size_t n);

}  // namespace lancet::core
