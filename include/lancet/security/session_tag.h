#pragma once

#include "lancet/core/security_config.h"

#include <string>
#include <string_view>

namespace lancet::security {

// SessionTag delimits untrusted content inside one prompt.
// tag_name has the form "<PREFIX>-<32 lower-case hex>"; the suffix carries 128 bits of CSPRNG
// output. tag_id is the first 8 hex characters of SHA-256(tag_name), safe to log.
// A tag is an isolation marker, not a secret credential. It is never persisted.
struct SessionTag {
  std::string tag_name;   // NOLINT(readability-identifier-naming)
  std::string tag_id;     // NOLINT(readability-identifier-naming)
  std::string open_tag;   // NOLINT(readability-identifier-naming)
  std::string close_tag;  // NOLINT(readability-identifier-naming)
};

inline constexpr std::size_t kTagSuffixHexLength = 32;
inline constexpr std::size_t kTagIdLength = 8;

[[nodiscard]] SessionTag generate_session_tag(std::string_view prefix = core::kDefaultTagPrefix);

// make_session_tag builds the derived fields for an existing tag name.
[[nodiscard]] SessionTag make_session_tag(std::string tag_name);

// tag_id_for returns the 8-hex correlation id of tag_name.
[[nodiscard]] std::string tag_id_for(std::string_view tag_name);

// is_well_formed_tag_name checks "<prefix>-" followed by exactly 32 lower-case hex digits.
[[nodiscard]] bool is_well_formed_tag_name(std::string_view tag_name, std::string_view prefix);

}  // namespace lancet::security
