#include "lancet/security/output_validator.h"

#include "lancet/core/ascii.h"
#include "lancet/core/utf8.h"
#include "lancet/security/secret_markers.h"
#include "lancet/security/tag_pattern.h"

#include <algorithm>

namespace lancet::security {

namespace {

bool is_word_char(const char32_t ch) {
  return core::is_ascii_alnum(ch) || ch == U'_';
}

bool is_url_terminator(const char32_t ch) {
  return core::is_space(ch) || ch == U'<' || ch == U'>' || ch == U'"' || ch == U'\'';
}

void push_unique(std::vector<std::string>& out, std::string value) {
  if (std::find(out.begin(), out.end(), value) == out.end()) {
    out.push_back(std::move(value));
  }
}

std::size_t url_scheme_length(const std::u32string_view text, const std::size_t pos) {
  static const std::u32string_view kSchemes[] = {U"https://", U"http://", U"ftp://"};
  for (const auto scheme : kSchemes) {
    if (core::matches_ci_at(text, pos, scheme)) {
      return scheme.size();
    }
  }
  return 0;
}

// Octet: 1-3 digits, value <= 255.
bool is_octet(const std::u32string_view group) {
  if (group.empty() || group.size() > 3) {
    return false;
  }
  int value = 0;
  for (const char32_t ch : group) {
    value = value * 10 + static_cast<int>(ch - U'0');
  }
  return value <= 255;
}

void scan_ipv4_run(const std::u32string_view text, const std::size_t begin, const std::size_t end,
                   std::vector<std::string>& out) {
  // Split the [0-9.] run into dot-separated groups, remembering offsets.
  std::vector<std::pair<std::size_t, std::size_t>> groups;
  std::size_t start = begin;
  for (std::size_t i = begin; i <= end; ++i) {
    if (i == end || text[i] == U'.') {
      groups.emplace_back(start, i);
      start = i + 1;
    }
  }

  const bool left_ok = begin == 0 || !is_word_char(text[begin - 1]);
  const bool right_ok = end == text.size() || !is_word_char(text[end]);

  std::size_t g = 0;
  while (g + 4 <= groups.size()) {
    bool ok = true;
    for (std::size_t k = 0; k < 4 && ok; ++k) {
      const auto [gb, ge] = groups[g + k];
      ok = is_octet(text.substr(gb, ge - gb));
    }
    const std::size_t match_begin = groups[g].first;
    const std::size_t match_end = groups[g + 3].second;
    if (ok && match_begin == begin && !left_ok) {
      ok = false;
    }
    if (ok && match_end == end && !right_ok) {
      ok = false;
    }
    if (ok) {
      push_unique(out, core::encode_utf8(text.substr(match_begin, match_end - match_begin)));
      g += 4;
    } else {
      ++g;
    }
  }
}

// Counts ':'-separated groups of 1-4 hex digits; returns -1 if any group is empty or too long.
int count_hex_groups(const std::u32string_view part) {
  if (part.empty()) {
    return 0;
  }
  int groups = 0;
  std::size_t pos = 0;
  while (true) {
    const auto colon = part.find(U':', pos);
    const std::size_t group_end = colon == std::u32string_view::npos ? part.size() : colon;
    const std::size_t len = group_end - pos;
    if (len == 0 || len > 4) {
      return -1;
    }
    ++groups;
    if (colon == std::u32string_view::npos) {
      return groups;
    }
    pos = colon + 1;
  }
}

bool is_ipv6_literal(const std::u32string_view run) {
  const auto double_colon = run.find(U"::");
  if (double_colon == std::u32string_view::npos) {
    return count_hex_groups(run) == 8;
  }
  if (run.find(U"::", double_colon + 1) != std::u32string_view::npos) {
    return false;
  }
  const int left = count_hex_groups(run.substr(0, double_colon));
  const int right = count_hex_groups(run.substr(double_colon + 2));
  if (left < 0 || right < 0) {
    return false;
  }
  const int total = left + right;
  return total >= 1 && total <= 7;
}

}  // namespace

std::vector<std::string> find_urls(const std::u32string_view text) {
  std::vector<std::string> urls;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const char32_t lower = core::ascii_lower(text[pos]);
    const std::size_t scheme = (lower == U'h' || lower == U'f') ? url_scheme_length(text, pos) : 0;
    if (scheme == 0) {
      ++pos;
      continue;
    }
    std::size_t end = pos + scheme;
    while (end < text.size() && !is_url_terminator(text[end])) {
      ++end;
    }
    if (end > pos + scheme) {
      push_unique(urls, core::encode_utf8(text.substr(pos, end - pos)));
    }
    pos = end;
  }
  return urls;
}

std::vector<std::string> find_ip_literals(const std::u32string_view text) {
  std::vector<std::string> ips;

  // IPv4: maximal runs of [0-9.]
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!core::is_ascii_digit(text[pos])) {
      ++pos;
      continue;
    }
    std::size_t end = pos;
    while (end < text.size() && (core::is_ascii_digit(text[end]) || text[end] == U'.')) {
      ++end;
    }
    scan_ipv4_run(text, pos, end, ips);
    pos = end;
  }

  // IPv6: maximal runs of [0-9A-Fa-f:] bounded by non-word characters
  pos = 0;
  while (pos < text.size()) {
    if (!core::is_hex_digit(text[pos]) && text[pos] != U':') {
      ++pos;
      continue;
    }
    std::size_t end = pos;
    while (end < text.size() && (core::is_hex_digit(text[end]) || text[end] == U':')) {
      ++end;
    }
    const bool bounded = (pos == 0 || !is_word_char(text[pos - 1])) &&
                         (end == text.size() || !is_word_char(text[end]));
    const auto run = text.substr(pos, end - pos);
    if (bounded && run.find(U':') != std::u32string_view::npos && is_ipv6_literal(run)) {
      push_unique(ips, core::encode_utf8(run));
    }
    pos = end;
  }

  return ips;
}

std::vector<std::string> leakage_markers(const std::string_view system_prompt,
                                         const std::string_view tag_prefix) {
  std::vector<std::string> markers = extract_tag_names(system_prompt, tag_prefix);
  for (const auto phrase : kSecretMarkerPhrases) {
    if (system_prompt.find(phrase) != std::string_view::npos) {
      markers.emplace_back(phrase);
    }
  }
  return markers;
}

std::size_t mask_markers(std::u32string& text, const std::vector<std::string>& markers) {
  const std::u32string token = core::decode_utf8(kRedactionToken);
  std::size_t replaced = 0;

  for (const auto& marker : markers) {
    std::u32string needle = core::decode_utf8(marker);
    if (needle.empty()) {
      continue;
    }
    std::transform(needle.begin(), needle.end(), needle.begin(),
                   [](const char32_t ch) { return core::ascii_lower(ch); });

    std::u32string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    bool changed = false;
    while (pos < text.size()) {
      if (core::matches_ci_at(text, pos, needle)) {
        out.append(token);
        pos += needle.size();
        ++replaced;
        changed = true;
      } else {
        out.push_back(text[pos++]);
      }
    }
    if (changed) {
      text = std::move(out);
    }
  }
  return replaced;
}

OutputValidationResult validate_llm_output(const std::string_view text,
                                           const std::optional<std::size_t> expected_max_length,
                                           const std::optional<std::string_view> system_prompt,
                                           const OutputValidatorOptions& options) {
  OutputValidationResult result;
  std::u32string working = core::decode_utf8(text);
  result.original_length = working.size();

  result.urls_found = find_urls(working);
  result.ips_found = find_ip_literals(working);
  result.had_suspicious_content = !result.urls_found.empty() || !result.ips_found.empty();

  if (system_prompt.has_value() && !system_prompt->empty()) {
    const auto markers = leakage_markers(*system_prompt, options.tag_prefix);
    if (mask_markers(working, markers) > 0) {
      result.leakage_detected = true;
    }
  }

  if (expected_max_length.has_value()) {
    const std::size_t max_allowed = *expected_max_length * options.max_output_multiplier;
    if (working.size() > max_allowed) {
      working.resize(max_allowed);
      result.was_truncated = true;
    }
  }

  if (!result.leakage_detected && !result.was_truncated) {
    result.validated_text = std::string{text};
  } else {
    result.validated_text = core::encode_utf8(working);
  }
  return result;
}

}  // namespace lancet::security
