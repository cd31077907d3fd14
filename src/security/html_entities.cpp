#include "lancet/security/html_entities.h"

#include "lancet/core/ascii.h"
#include "lancet/core/utf8.h"

#include <array>
#include <optional>
#include <utility>

namespace lancet::security {

namespace {

struct NamedEntity {
  std::u32string_view name;
  char32_t value;
  bool legacy;  // may appear without the trailing ';'
};

// Entities that matter for smuggling markup, quotes, spacing or invisible characters.
constexpr std::array<NamedEntity, 34> kNamedEntities{{
    {U"lt", U'<', true},         {U"LT", U'<', true},         {U"gt", U'>', true},
    {U"GT", U'>', true},         {U"amp", U'&', true},        {U"AMP", U'&', true},
    {U"quot", U'"', true},       {U"QUOT", U'"', true},       {U"apos", U'\'', false},
    {U"sol", U'/', false},       {U"bsol", U'\\', false},     {U"lsqb", U'[', false},
    {U"rsqb", U']', false},      {U"lbrace", U'{', false},    {U"rbrace", U'}', false},
    {U"colon", U':', false},     {U"semi", U';', false},      {U"num", U'#', false},
    {U"nbsp", 0x00A0, false},    {U"ensp", 0x2002, false},    {U"emsp", 0x2003, false},
    {U"thinsp", 0x2009, false},  {U"ZeroWidthSpace", 0x200B, false},   {U"zwnj", 0x200C, false},
    {U"zwj", 0x200D, false},     {U"lrm", 0x200E, false},     {U"rlm", 0x200F, false},
    {U"shy", 0x00AD, false},     {U"NewLine", U'\n', false},  {U"Tab", U'\t', false},
    {U"hellip", 0x2026, false},  {U"mdash", 0x2014, false},   {U"ndash", 0x2013, false},
    {U"copy", 0x00A9, false},
}};

constexpr std::size_t kMaxNumericDigits = 8;

char32_t sanitize_code_point(const char32_t cp) {
  if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    return core::kReplacementChar;
  }
  return cp;
}

// Parses "&#...;" at text[pos] == '&'. Returns {code point, length}.
std::optional<std::pair<char32_t, std::size_t>> parse_numeric(const std::u32string_view text,
                                                              const std::size_t pos) {
  std::size_t cur = pos + 2;
  bool hex = false;
  if (cur < text.size() && (text[cur] == U'x' || text[cur] == U'X')) {
    hex = true;
    ++cur;
  }
  const std::size_t digits_begin = cur;
  char32_t value = 0;
  while (cur < text.size() && cur - digits_begin < kMaxNumericDigits) {
    const char32_t ch = text[cur];
    if (core::is_ascii_digit(ch)) {
      value = value * (hex ? 16 : 10) + (ch - U'0');
    } else if (hex && core::is_hex_digit(ch)) {
      value = value * 16 + (core::ascii_lower(ch) - U'a' + 10);
    } else {
      break;
    }
    ++cur;
  }
  if (cur == digits_begin || cur >= text.size() || text[cur] != U';') {
    return std::nullopt;
  }
  return std::make_pair(sanitize_code_point(value), cur + 1 - pos);
}

std::optional<std::pair<char32_t, std::size_t>> parse_named(const std::u32string_view text,
                                                            const std::size_t pos) {
  for (const auto& entity : kNamedEntities) {
    const std::size_t name_end = pos + 1 + entity.name.size();
    if (name_end > text.size() || text.substr(pos + 1, entity.name.size()) != entity.name) {
      continue;
    }
    if (name_end < text.size() && text[name_end] == U';') {
      return std::make_pair(entity.value, entity.name.size() + 2);
    }
    if (entity.legacy) {
      return std::make_pair(entity.value, entity.name.size() + 1);
    }
  }
  return std::nullopt;
}

}  // namespace

std::u32string decode_html_entities(const std::u32string_view input) {
  std::u32string text{input};
  std::u32string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != U'&') {
      out.push_back(text[pos++]);
      continue;
    }
    std::optional<std::pair<char32_t, std::size_t>> decoded;
    if (pos + 1 < text.size() && text[pos + 1] == U'#') {
      decoded = parse_numeric(text, pos);
    } else {
      decoded = parse_named(text, pos);
    }
    if (decoded && decoded->first == U'&') {
      // Re-read the decoded '&' with what follows it: &amp;amp;lt; becomes '<' here.
      pos += decoded->second - 1;
      text[pos] = U'&';
    } else if (decoded) {
      out.push_back(decoded->first);
      pos += decoded->second;
    } else {
      out.push_back(text[pos++]);
    }
  }
  return out;
}

}  // namespace lancet::security
