#pragma once

#include <array>
#include <string_view>

namespace lancet::security {

// Fixed phrases of the secure prompt rule block. They only ever appear in prompts this process
// builds, so their reappearance in model output or logs means prompt internals leaked.
inline constexpr std::string_view kRulesHeader = "### LANCET SYSTEM RULES (CONFIDENTIAL) ###";
inline constexpr std::string_view kTaskHeader = "### LANCET TASK INSTRUCTIONS ###";
inline constexpr std::string_view kTaskFooter = "### END LANCET TASK INSTRUCTIONS ###";

inline constexpr std::array<std::string_view, 3> kSecretMarkerPhrases{kRulesHeader, kTaskHeader,
                                                                      kTaskFooter};

// Replacement for leaked spans in model output.
inline constexpr std::string_view kRedactionToken = "[REDACTED]";

}  // namespace lancet::security
