#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::security {

// Linear scanners for the session-tag family. Matching is ASCII case-insensitive on the prefix.
//
// Markup form:  "<" "/"? PREFIX [ \t\n\r_-]* [A-Za-z0-9_-]* ">"
// Bare form:    PREFIX [_-] [A-Za-z0-9]{4,}          (a tag name written without brackets)
//
// Every scanner inspects each code point a bounded number of times; no backtracking.

struct TextSpan {
  std::size_t begin{0};  // NOLINT(readability-identifier-naming)
  std::size_t end{0};    // NOLINT(readability-identifier-naming)
};

// lower_prefix converts a configured tag prefix to the lower-case UTF-32 form the scanners use.
[[nodiscard]] std::u32string lower_prefix(std::string_view prefix);

// match_tag_markup_at returns the end of a markup span that starts exactly at pos.
[[nodiscard]] std::optional<std::size_t> match_tag_markup_at(std::u32string_view text,
                                                             std::size_t pos,
                                                             std::u32string_view prefix_lower);

// find_tag_markup returns the first markup span starting at or after pos.
[[nodiscard]] std::optional<TextSpan> find_tag_markup(std::u32string_view text, std::size_t pos,
                                                      std::u32string_view prefix_lower);

// strip_tag_markup removes every markup span and returns how many were removed.
// Content between an opening and closing tag is kept.
std::size_t strip_tag_markup(std::u32string& text, std::u32string_view prefix_lower);

// match_bare_tag_name_at returns the end of a bare-form span that starts exactly at pos.
[[nodiscard]] std::optional<std::size_t> match_bare_tag_name_at(
    std::u32string_view text, std::size_t pos, std::u32string_view prefix_lower);

// extract_tag_names collects the distinct tag names ("PREFIX-<suffix>") that appear as markup in
// text, in first-seen order. Used to learn which tags a system prompt carries.
[[nodiscard]] std::vector<std::string> extract_tag_names(std::string_view text,
                                                         std::string_view prefix);

}  // namespace lancet::security
