#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace lancet::core {

// Locale-independent ASCII helpers shared by the linear scanners in security/ and response/.
// Case folding touches A-Z only; every other code point compares by value.

inline constexpr char32_t ascii_lower(const char32_t ch) {
  return (ch >= U'A' && ch <= U'Z') ? ch + (U'a' - U'A') : ch;
}

inline constexpr bool is_ascii_digit(const char32_t ch) {
  return ch >= U'0' && ch <= U'9';
}

inline constexpr bool is_ascii_alpha(const char32_t ch) {
  return (ch >= U'a' && ch <= U'z') || (ch >= U'A' && ch <= U'Z');
}

inline constexpr bool is_ascii_alnum(const char32_t ch) {
  return is_ascii_alpha(ch) || is_ascii_digit(ch);
}

inline constexpr bool is_hex_digit(const char32_t ch) {
  return is_ascii_digit(ch) || (ch >= U'a' && ch <= U'f') || (ch >= U'A' && ch <= U'F');
}

// Unicode White_Space subset relevant after NFKC (ASCII whitespace plus NBSP and ideographic
// space, which NFKC maps to U+0020 anyway).
inline constexpr bool is_space(const char32_t ch) {
  return ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'\f' || ch == U'\v' ||
         ch == 0x00A0 || ch == 0x3000;
}

// matches_ci_at reports whether text[pos..] begins with needle, ASCII case-insensitively.
// needle must already be lower-case.
inline bool matches_ci_at(const std::u32string_view text, const std::size_t pos,
                          const std::u32string_view needle) {
  if (pos > text.size() || text.size() - pos < needle.size()) {
    return false;
  }
  for (std::size_t i = 0; i < needle.size(); ++i) {
    if (ascii_lower(text[pos + i]) != needle[i]) {
      return false;
    }
  }
  return true;
}

// normalize_ascii_lower converts A-Z to a-z; other bytes are preserved.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

}  // namespace lancet::core
