#include "lancet/security/tag_pattern.h"

#include "lancet/core/ascii.h"
#include "lancet/core/utf8.h"

#include <algorithm>

namespace lancet::security {

namespace {

bool is_separator(const char32_t ch) {
  return ch == U' ' || ch == U'\t' || ch == U'\n' || ch == U'\r' || ch == U'_' || ch == U'-';
}

bool is_name_char(const char32_t ch) {
  return core::is_ascii_alnum(ch) || ch == U'_' || ch == U'-';
}

}  // namespace

std::optional<std::size_t> match_tag_markup_at(const std::u32string_view text, std::size_t pos,
                                               const std::u32string_view prefix_lower) {
  if (pos >= text.size() || text[pos] != U'<') {
    return std::nullopt;
  }
  ++pos;
  if (pos < text.size() && text[pos] == U'/') {
    ++pos;
  }
  if (!core::matches_ci_at(text, pos, prefix_lower)) {
    return std::nullopt;
  }
  pos += prefix_lower.size();
  while (pos < text.size() && is_separator(text[pos])) {
    ++pos;
  }
  while (pos < text.size() && is_name_char(text[pos])) {
    ++pos;
  }
  if (pos < text.size() && text[pos] == U'>') {
    return pos + 1;
  }
  return std::nullopt;
}

std::u32string lower_prefix(const std::string_view prefix) {
  std::u32string out = core::decode_utf8(prefix);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](const char32_t ch) { return core::ascii_lower(ch); });
  return out;
}

std::optional<TextSpan> find_tag_markup(const std::u32string_view text, std::size_t pos,
                                        const std::u32string_view prefix_lower) {
  while (pos < text.size()) {
    const auto lt = text.find(U'<', pos);
    if (lt == std::u32string_view::npos) {
      return std::nullopt;
    }
    if (const auto end = match_tag_markup_at(text, lt, prefix_lower)) {
      return TextSpan{lt, *end};
    }
    pos = lt + 1;
  }
  return std::nullopt;
}

std::size_t strip_tag_markup(std::u32string& text, const std::u32string_view prefix_lower) {
  std::u32string out;
  out.reserve(text.size());
  std::size_t removed = 0;
  std::size_t pos = 0;
  const std::u32string_view view{text};
  while (const auto span = find_tag_markup(view, pos, prefix_lower)) {
    out.append(view.substr(pos, span->begin - pos));
    pos = span->end;
    ++removed;
  }
  if (removed == 0) {
    return 0;
  }
  out.append(view.substr(pos));
  text = std::move(out);
  return removed;
}

std::optional<std::size_t> match_bare_tag_name_at(const std::u32string_view text,
                                                  const std::size_t pos,
                                                  const std::u32string_view prefix_lower) {
  constexpr std::size_t kMinSuffix = 4;
  if (!core::matches_ci_at(text, pos, prefix_lower)) {
    return std::nullopt;
  }
  std::size_t cur = pos + prefix_lower.size();
  if (cur >= text.size() || (text[cur] != U'-' && text[cur] != U'_')) {
    return std::nullopt;
  }
  ++cur;
  const std::size_t suffix_begin = cur;
  while (cur < text.size() && core::is_ascii_alnum(text[cur])) {
    ++cur;
  }
  if (cur - suffix_begin < kMinSuffix) {
    return std::nullopt;
  }
  return cur;
}

std::vector<std::string> extract_tag_names(const std::string_view text,
                                           const std::string_view prefix) {
  const std::u32string decoded = core::decode_utf8(text);
  const std::u32string prefix_l = lower_prefix(prefix);
  const std::u32string_view view{decoded};

  std::vector<std::string> names;
  std::size_t pos = 0;
  while (const auto span = find_tag_markup(view, pos, prefix_l)) {
    std::size_t begin = span->begin + 1;
    if (view[begin] == U'/') {
      ++begin;
    }
    std::string name = core::encode_utf8(view.substr(begin, span->end - 1 - begin));
    if (name.size() > prefix.size() &&
        std::find(names.begin(), names.end(), name) == names.end()) {
      names.push_back(std::move(name));
    }
    pos = span->end;
  }
  return names;
}

}  // namespace lancet::security
