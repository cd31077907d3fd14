#include "lancet/core/security_config.h"

#include "lancet/core/ascii.h"

namespace lancet::core {

std::string validate_security_config(const SecurityConfig& config) {
  if (config.tag_prefix.empty() || config.tag_prefix.size() > 32) {
    return "tag_prefix must be 1-32 characters";
  }
  for (const char ch : config.tag_prefix) {
    if (!is_ascii_alnum(static_cast<unsigned char>(ch))) {
      return "tag_prefix must be alphanumeric: " + config.tag_prefix;
    }
  }
  if (config.max_input_length == 0) {
    return "max_input_length must be positive";
  }
  if (config.max_output_multiplier == 0) {
    return "max_output_multiplier must be positive";
  }
  if (config.max_preview_length == 0) {
    return "max_preview_length must be positive";
  }
  if (config.min_independent_sources < 1) {
    return "min_independent_sources must be at least 1";
  }
  if (config.max_rejection_rate < 0.0 || config.max_rejection_rate >= 1.0) {
    return "max_rejection_rate must be in [0, 1)";
  }
  return "";
}

}  // namespace lancet::core
