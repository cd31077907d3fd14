#include "lancet/core/utf8.h"

#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace lancet::core {

namespace {

// Decodes one code point starting at pos; sets len to the bytes consumed (>= 1).
char32_t decode_one(const std::string_view input, const std::size_t pos, std::size_t& len) {
  const auto b0 = static_cast<unsigned char>(input[pos]);
  len = 1;
  if (b0 < 0x80) {
    return b0;
  }

  std::size_t need = 0;
  char32_t cp = 0;
  char32_t min_value = 0;
  if ((b0 & 0xE0U) == 0xC0U) {
    need = 1;
    cp = b0 & 0x1FU;
    min_value = 0x80;
  } else if ((b0 & 0xF0U) == 0xE0U) {
    need = 2;
    cp = b0 & 0x0FU;
    min_value = 0x800;
  } else if ((b0 & 0xF8U) == 0xF0U) {
    need = 3;
    cp = b0 & 0x07U;
    min_value = 0x10000;
  } else {
    return kReplacementChar;
  }

  if (pos + need >= input.size()) {
    return kReplacementChar;
  }
  for (std::size_t i = 1; i <= need; ++i) {
    const auto b = static_cast<unsigned char>(input[pos + i]);
    if ((b & 0xC0U) != 0x80U) {
      return kReplacementChar;
    }
    cp = (cp << 6U) | (b & 0x3FU);
  }

  if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return kReplacementChar;
  }
  len = need + 1;
  return cp;
}

}  // namespace

std::u32string decode_utf8(const std::string_view input) {
  std::u32string out;
  out.reserve(input.size());
  std::size_t pos = 0;
  while (pos < input.size()) {
    std::size_t len = 1;
    out.push_back(decode_one(input, pos, len));
    pos += len;
  }
  return out;
}

void append_utf8(std::string& out, const char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::string encode_utf8(const std::u32string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char32_t cp : input) {
    append_utf8(out, cp);
  }
  return out;
}

std::size_t code_point_count(const std::string_view input) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < input.size()) {
    std::size_t len = 1;
    (void)decode_one(input, pos, len);
    pos += len;
    ++count;
  }
  return count;
}

std::string truncate_code_points(const std::string_view input, const std::size_t max_code_points) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < input.size() && count < max_code_points) {
    std::size_t len = 1;
    (void)decode_one(input, pos, len);
    pos += len;
    ++count;
  }
  return std::string{input.substr(0, pos)};
}

std::string normalize_nfkc(const std::string_view input) {
  if (input.empty()) {
    return std::string{};
  }

  const std::string clean = encode_utf8(decode_utf8(input));

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || nfkc == nullptr) {
    return clean;
  }

  const icu::UnicodeString source =
      icu::UnicodeString::fromUTF8(icu::StringPiece(clean.data(), static_cast<int32_t>(clean.size())));
  const icu::UnicodeString normalized = nfkc->normalize(source, status);
  if (U_FAILURE(status)) {
    return clean;
  }

  std::string out;
  normalized.toUTF8String(out);
  return out;
}

}  // namespace lancet::core
