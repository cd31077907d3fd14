#include "lancet/logging/redaction.h"

#include "lancet/core/ascii.h"
#include "lancet/core/utf8.h"
#include "lancet/security/secret_markers.h"
#include "lancet/security/tag_pattern.h"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>
#include <optional>
#include <typeinfo>
#include <vector>

namespace lancet::logging {

namespace {

bool is_token_boundary(const char32_t ch) {
  return core::is_space(ch) || ch == U'"' || ch == U'\'' || ch == U'(' || ch == U'[' ||
         ch == U'<' || ch == U'=' || ch == U',' || ch == U'`' || ch == U'{';
}

bool is_path_terminator(const char32_t ch) {
  return core::is_space(ch) || ch == U'"' || ch == U'\'' || ch == U')' || ch == U']' ||
         ch == U'>' || ch == U',' || ch == U'`' || ch == U'}';
}

// Returns the end of a path token starting at pos, if one starts there.
std::optional<std::size_t> match_path(const std::u32string_view text, const std::size_t pos) {
  if (pos > 0 && !is_token_boundary(text[pos - 1])) {
    return std::nullopt;
  }

  std::size_t cur = pos;
  std::size_t min_separators = 1;
  if (text[cur] == U'/') {
    min_separators = 2;
  } else if (text[cur] == U'~' && cur + 1 < text.size() && text[cur + 1] == U'/') {
    cur += 1;
  } else if (core::is_ascii_alpha(text[cur]) && cur + 2 < text.size() && text[cur + 1] == U':' &&
             (text[cur + 2] == U'\\' || text[cur + 2] == U'/')) {
    cur += 2;
  } else {
    return std::nullopt;
  }

  std::size_t separators = 0;
  bool has_name = false;
  while (cur < text.size() && !is_path_terminator(text[cur])) {
    if (text[cur] == U'/' || text[cur] == U'\\') {
      ++separators;
    } else {
      has_name = true;
    }
    ++cur;
  }
  if (separators >= min_separators && has_name) {
    return cur;
  }
  return std::nullopt;
}

std::u32string lower(std::u32string s) {
  for (auto& ch : s) {
    ch = core::ascii_lower(ch);
  }
  return s;
}

}  // namespace

Redacted mask_secret_markers(const std::string_view text, const std::string_view tag_prefix) {
  const std::u32string decoded = core::decode_utf8(text);
  const std::u32string_view view{decoded};
  const std::u32string prefix_l = security::lower_prefix(tag_prefix);

  static const std::vector<std::u32string> kPhrases = [] {
    std::vector<std::u32string> phrases;
    for (const auto phrase : security::kSecretMarkerPhrases) {
      phrases.push_back(lower(core::decode_utf8(phrase)));
    }
    return phrases;
  }();

  Redacted out;
  std::u32string result;
  result.reserve(decoded.size());
  const std::u32string mask = core::decode_utf8(kMaskToken);

  std::size_t pos = 0;
  while (pos < view.size()) {
    std::size_t end = 0;
    if (const auto markup = security::match_tag_markup_at(view, pos, prefix_l)) {
      end = *markup;
    } else if (const auto bare = security::match_bare_tag_name_at(view, pos, prefix_l)) {
      end = *bare;
    }
    if (end == 0 && view[pos] == U'#') {
      for (const auto& phrase : kPhrases) {
        if (core::matches_ci_at(view, pos, phrase)) {
          end = pos + phrase.size();
          break;
        }
      }
    }
    if (end > pos) {
      result.append(mask);
      ++out.redactions;
      pos = end;
    } else {
      result.push_back(view[pos++]);
    }
  }

  out.text = out.redactions > 0 ? core::encode_utf8(result) : std::string{text};
  return out;
}

Redacted mask_paths(const std::string_view text) {
  const std::u32string decoded = core::decode_utf8(text);
  const std::u32string_view view{decoded};
  const std::u32string token = core::decode_utf8(kPathToken);

  Redacted out;
  std::u32string result;
  result.reserve(decoded.size());
  std::size_t pos = 0;
  while (pos < view.size()) {
    const char32_t ch = view[pos];
    const bool candidate = ch == U'/' || ch == U'~' || core::is_ascii_alpha(ch);
    if (candidate) {
      if (const auto end = match_path(view, pos)) {
        result.append(token);
        ++out.redactions;
        pos = *end;
        continue;
      }
    }
    result.push_back(ch);
    ++pos;
  }

  out.text = out.redactions > 0 ? core::encode_utf8(result) : std::string{text};
  return out;
}

std::string_view first_line(const std::string_view text) {
  const auto nl = text.find_first_of("\r\n");
  return nl == std::string_view::npos ? text : text.substr(0, nl);
}

std::string describe_exception_type(const std::exception& e) {
  const char* mangled = typeid(e).name();
  int status = 0;
  std::unique_ptr<char, decltype(&std::free)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return mangled;
}

Redacted sanitize_exception_message(const std::string_view message,
                                    const std::string_view tag_prefix,
                                    const std::size_t max_length) {
  Redacted out;
  const std::string_view line = first_line(message);
  if (line.size() != message.size()) {
    ++out.redactions;
  }

  Redacted paths = mask_paths(line);
  Redacted markers = mask_secret_markers(paths.text, tag_prefix);
  out.redactions += paths.redactions + markers.redactions;

  std::string text = core::trim(markers.text);
  if (core::code_point_count(text) > max_length) {
    text = core::truncate_code_points(text, max_length) + "...";
  }
  out.text = std::move(text);
  return out;
}

nlohmann::json sanitize_details(const nlohmann::json& details, const std::string_view tag_prefix) {
  if (details.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : details.items()) {
      out[key] = sanitize_details(value, tag_prefix);
    }
    return out;
  }
  if (details.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& value : details) {
      out.push_back(sanitize_details(value, tag_prefix));
    }
    return out;
  }
  if (!details.is_string()) {
    return details;
  }

  const auto& value = details.get_ref<const std::string&>();
  if (mask_secret_markers(value, tag_prefix).redactions > 0) {
    return "[MASKED:prompt_content]";
  }
  Redacted paths = mask_paths(value);
  if (paths.redactions > 0) {
    return paths.text;
  }
  if (core::code_point_count(value) > kMaxErrorMessageLength) {
    return core::truncate_code_points(value, kMaxErrorMessageLength) + "...";
  }
  return details;
}

}  // namespace lancet::logging
