#include "lancet/security/input_sanitizer.h"

#include "lancet/core/ascii.h"
#include "lancet/core/utf8.h"
#include "lancet/security/html_entities.h"
#include "lancet/security/tag_pattern.h"

#include <algorithm>
#include <string>
#include <utility>

namespace lancet::security {

namespace {

// ── Dangerous pattern matcher ──────────────────────────────────────────────
//
// A pattern is a short list of steps. Each step is constant-size, so matching at one start
// position is bounded by the step count plus the whitespace/word runs it consumes.

enum class StepKind {
  kText,    // one of `alternatives`, ASCII case-insensitive
  kWord,    // one or more [A-Za-z0-9_]
  kSpaces,  // one or more whitespace
  kGap,     // 0..max_gap arbitrary code points
};

struct Step {
  StepKind kind;
  std::vector<std::u32string> alternatives{};
  bool optional{false};
  std::size_t max_gap{0};
};

struct Pattern {
  std::string label;
  std::vector<Step> steps;
};

Step text(std::u32string value) {
  return Step{StepKind::kText, {std::move(value)}};
}
Step one_of(std::vector<std::u32string> values) {
  return Step{StepKind::kText, std::move(values)};
}
Step spaces() {
  return Step{StepKind::kSpaces};
}
Step optional_text(std::u32string value) {
  return Step{StepKind::kText, {std::move(value)}, true};
}
Step optional_word() {
  return Step{StepKind::kWord, {}, true};
}
Step gap(const std::size_t n) {
  return Step{StepKind::kGap, {}, false, n};
}

// Optional steps are immediately followed by their own kSpaces step with optional == true.
Step optional_spaces() {
  return Step{StepKind::kSpaces, {}, true};
}

const std::vector<Pattern>& dangerous_patterns() {
  static const std::vector<Pattern> kPatterns = {
      {"ignore previous", {text(U"ignore"), spaces(), optional_text(U"all"), optional_spaces(),
                           text(U"previous")}},
      {"disregard above/previous",
       {text(U"disregard"), spaces(), optional_text(U"all"), optional_spaces(),
        one_of({U"above", U"previous"})}},
      {"forget instructions",
       {text(U"forget"), spaces(), optional_word(), optional_spaces(), text(U"instructions")}},
      {"system prompt", {text(U"system"), spaces(), text(U"prompt")}},
      {"new instructions", {text(U"new"), spaces(), text(U"instruction")}},
      {"override instructions", {text(U"override"), spaces(), text(U"instruction")}},
      {"you are now", {text(U"you"), spaces(), text(U"are"), spaces(), text(U"now")}},
      {"act as if", {text(U"act"), spaces(), text(U"as"), spaces(), text(U"if")}},
      {"pretend to be", {text(U"pretend"), spaces(), text(U"to"), spaces(), text(U"be")}},
      {"pretend you are", {text(U"pretend"), spaces(), text(U"you"), spaces(), text(U"are")}},
      {"from now on", {text(U"from"), spaces(), text(U"now"), spaces(), text(U"on")}},
      {"ignore everything", {text(U"ignore"), spaces(), text(U"everything")}},
      {"上記を無視", {text(U"上記"), gap(5), text(U"無視")}},
      {"指示に従わない",
       {text(U"指示"), one_of({U"を", U"に"}), text(U"従"), one_of({U"わ", U"う"}), text(U"な")}},
      {"新しい指示", {text(U"新しい指示")}},
      {"システムプロンプト", {text(U"システムプロンプト")}},
  };
  return kPatterns;
}

bool is_word_char(const char32_t ch) {
  return core::is_ascii_alnum(ch) || ch == U'_';
}

// Consumes one step at pos. Returns the new position, or npos if the step fails.
// kGap is handled by the caller because it has several outcomes.
std::size_t consume(const Step& step, const std::u32string_view text, std::size_t pos) {
  constexpr auto kFail = std::u32string_view::npos;
  switch (step.kind) {
    case StepKind::kText:
      for (const auto& alt : step.alternatives) {
        if (core::matches_ci_at(text, pos, alt)) {
          return pos + alt.size();
        }
      }
      return kFail;
    case StepKind::kWord: {
      const std::size_t begin = pos;
      while (pos < text.size() && is_word_char(text[pos])) {
        ++pos;
      }
      return pos == begin ? kFail : pos;
    }
    case StepKind::kSpaces: {
      const std::size_t begin = pos;
      while (pos < text.size() && core::is_space(text[pos])) {
        ++pos;
      }
      return pos == begin ? kFail : pos;
    }
    case StepKind::kGap:
      return kFail;
  }
  return kFail;
}

bool match_steps(const std::vector<Step>& steps, const std::size_t index,
                 const std::u32string_view text, const std::size_t pos) {
  if (index == steps.size()) {
    return true;
  }
  const Step& step = steps[index];

  if (step.kind == StepKind::kGap) {
    for (std::size_t skip = 0; skip <= step.max_gap && pos + skip <= text.size(); ++skip) {
      if (match_steps(steps, index + 1, text, pos + skip)) {
        return true;
      }
    }
    return false;
  }

  if (step.optional) {
    // An optional step and its optional trailing whitespace form one group.
    const bool grouped = index + 1 < steps.size() && steps[index + 1].optional &&
                         steps[index + 1].kind == StepKind::kSpaces &&
                         step.kind != StepKind::kSpaces;
    const std::size_t next = consume(step, text, pos);
    if (next != std::u32string_view::npos) {
      if (grouped) {
        const std::size_t after_spaces = consume(steps[index + 1], text, next);
        if (after_spaces != std::u32string_view::npos &&
            match_steps(steps, index + 2, text, after_spaces)) {
          return true;
        }
      } else if (match_steps(steps, index + 1, text, next)) {
        return true;
      }
    }
    return match_steps(steps, grouped ? index + 2 : index + 1, text, pos);
  }

  const std::size_t next = consume(step, text, pos);
  if (next == std::u32string_view::npos) {
    return false;
  }
  return match_steps(steps, index + 1, text, next);
}

bool pattern_occurs(const Pattern& pattern, const std::u32string_view text) {
  const Step& first = pattern.steps.front();
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    // Cheap first-character filter before running the step machine.
    bool candidate = false;
    for (const auto& alt : first.alternatives) {
      if (!alt.empty() && core::ascii_lower(text[pos]) == alt.front()) {
        candidate = true;
        break;
      }
    }
    if (candidate && match_steps(pattern.steps, 0, text, pos)) {
      return true;
    }
  }
  return false;
}

bool is_stripped_control(const char32_t cp) {
  if (cp == U'\n' || cp == U'\t' || cp == U'\r') {
    return false;
  }
  return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

std::size_t strip_zero_width(std::u32string& text) {
  const auto new_end = std::remove_if(text.begin(), text.end(), is_zero_width);
  const auto removed = static_cast<std::size_t>(std::distance(new_end, text.end()));
  text.erase(new_end, text.end());
  return removed;
}

void strip_control_chars(std::u32string& text) {
  text.erase(std::remove_if(text.begin(), text.end(), is_stripped_control), text.end());
}

// One normalize/decode/strip pass over current.
std::string sanitize_pass(const std::string& current, const std::u32string_view prefix_l,
                          SanitizationResult& result) {
  std::u32string working = core::decode_utf8(core::normalize_nfkc(current));
  working = decode_html_entities(working);
  result.removed_zero_width += strip_zero_width(working);
  strip_control_chars(working);
  result.removed_tags += strip_tag_markup(working, prefix_l);
  return core::encode_utf8(working);
}

bool is_markup_starter(const char32_t cp) {
  return cp == U'&' || cp == U'<';
}

// Drops every '&' and '<' so no entity or tag can form in a later pass.
std::string drop_markup_starters(std::string text) {
  for (int round = 0; round < kMaxSanitizePasses; ++round) {
    std::u32string working = core::decode_utf8(core::normalize_nfkc(text));
    strip_zero_width(working);
    strip_control_chars(working);
    working.erase(std::remove_if(working.begin(), working.end(), is_markup_starter),
                  working.end());
    std::string next = core::encode_utf8(working);
    if (next == text) {
      break;
    }
    text = std::move(next);
  }
  return text;
}

}  // namespace

bool is_zero_width(const char32_t cp) {
  switch (cp) {
    case 0x200B:
    case 0x200C:
    case 0x200D:
    case 0xFEFF:
    case 0x2060:
    case 0x180E:
    case 0x200E:
    case 0x200F:
      return true;
    default:
      return (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069);
  }
}

std::vector<std::string> detect_dangerous_patterns(const std::u32string_view text) {
  std::vector<std::string> found;
  for (const auto& pattern : dangerous_patterns()) {
    if (pattern_occurs(pattern, text)) {
      found.push_back(pattern.label);
    }
  }
  return found;
}

std::vector<std::string> detect_dangerous_patterns(const std::string_view text) {
  return detect_dangerous_patterns(std::u32string_view{core::decode_utf8(text)});
}

SanitizationResult sanitize_llm_input(const std::string_view text,
                                      const SanitizerOptions& options) {
  SanitizationResult result;
  if (text.empty()) {
    return result;
  }
  result.original_length = core::code_point_count(text);

  const std::u32string prefix_l = lower_prefix(options.tag_prefix);
  std::string current{text};

  bool converged = false;
  for (int pass = 0; pass < kMaxSanitizePasses && !converged; ++pass) {
    std::string next = sanitize_pass(current, prefix_l, result);
    converged = next == current;
    current = std::move(next);
  }

  if (!converged) {
    current = drop_markup_starters(std::move(current));
    result.had_warnings = true;
  }
  if (result.removed_tags > 0) {
    result.had_warnings = true;
  }

  const std::u32string decoded = core::decode_utf8(current);
  result.dangerous_patterns_found = detect_dangerous_patterns(std::u32string_view{decoded});
  if (!result.dangerous_patterns_found.empty()) {
    result.had_warnings = true;
  }

  if (decoded.size() > options.max_length) {
    result.sanitized_text =
        core::encode_utf8(std::u32string_view{decoded}.substr(0, options.max_length));
    result.was_truncated = true;
  } else {
    result.sanitized_text = std::move(current);
  }

  return result;
}

}  // namespace lancet::security
