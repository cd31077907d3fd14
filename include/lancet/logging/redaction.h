#pragma once

#include "lancet/core/security_config.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <string_view>

namespace lancet::logging {

inline constexpr std::string_view kMaskToken = "[MASKED]";
inline constexpr std::string_view kPathToken = "[PATH]";
inline constexpr std::size_t kMaxErrorMessageLength = 200;

struct Redacted {
  std::string text;            // NOLINT(readability-identifier-naming)
  std::size_t redactions{0};   // NOLINT(readability-identifier-naming)
};

// mask_secret_markers replaces session-tag markup, bare tag names and rule-block marker phrases
// with kMaskToken.
[[nodiscard]] Redacted mask_secret_markers(std::string_view text,
                                           std::string_view tag_prefix = core::kDefaultTagPrefix);

// mask_paths replaces absolute filesystem paths with kPathToken. A path starts at a token
// boundary with "/" (and has at least two components), "~/", or a drive letter ("C:\", "C:/").
[[nodiscard]] Redacted mask_paths(std::string_view text);

// first_line returns text up to (not including) the first line break.
[[nodiscard]] std::string_view first_line(std::string_view text);

// describe_exception_type returns the demangled dynamic type name of e.
[[nodiscard]] std::string describe_exception_type(const std::exception& e);

// sanitize_exception_message keeps the first line of message, masks paths and secret markers
// and clamps to max_length code points (appending "..."). redactions counts masked spans plus
// one when trailing lines were dropped.
[[nodiscard]] Redacted sanitize_exception_message(
    std::string_view message, std::string_view tag_prefix = core::kDefaultTagPrefix,
    std::size_t max_length = kMaxErrorMessageLength);

// sanitize_details walks a JSON value and, in every string, masks secret markers (the whole
// value becomes "[MASKED:prompt_content]") or paths, and clamps long strings.
[[nodiscard]] nlohmann::json sanitize_details(const nlohmann::json& details,
                                              std::string_view tag_prefix = core::kDefaultTagPrefix);

}  // namespace lancet::logging
