#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lancet::core {

// UTF-8 helpers. All lengths exposed to callers of the security pipeline are counted in
// Unicode code points, never bytes.

inline constexpr char32_t kReplacementChar = 0xFFFD;

// decode_utf8 decodes input into code points. Each malformed byte (bad lead byte, truncated or
// overlong sequence, surrogate, value above U+10FFFF) decodes to U+FFFD.
[[nodiscard]] std::u32string decode_utf8(std::string_view input);

// append_utf8 appends the UTF-8 encoding of cp to out.
void append_utf8(std::string& out, char32_t cp);

[[nodiscard]] std::string encode_utf8(std::u32string_view input);

// code_point_count returns the number of code points decode_utf8 would produce.
[[nodiscard]] std::size_t code_point_count(std::string_view input);

// truncate_code_points returns the first max_code_points code points of input.
[[nodiscard]] std::string truncate_code_points(std::string_view input,
                                               std::size_t max_code_points);

// normalize_nfkc applies Unicode NFKC normalization (ICU Normalizer2).
// Malformed input is passed through decode/encode first so the result is always valid UTF-8.
// Never throws.
[[nodiscard]] std::string normalize_nfkc(std::string_view input);

}  // namespace lancet::core
