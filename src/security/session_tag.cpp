#include "lancet/security/session_tag.h"

#include "lancet/core/random.h"
#include "lancet/core/sha256.h"

namespace lancet::security {

SessionTag generate_session_tag(const std::string_view prefix) {
  return make_session_tag(std::string(prefix) + "-" + core::random_hex(kTagSuffixHexLength / 2));
}

SessionTag make_session_tag(std::string tag_name) {
  SessionTag tag;
  tag.tag_id = tag_id_for(tag_name);
  tag.open_tag = "<" + tag_name + ">";
  tag.close_tag = "</" + tag_name + ">";
  tag.tag_name = std::move(tag_name);
  return tag;
}

std::string tag_id_for(const std::string_view tag_name) {
  return core::sha256_prefix(tag_name, kTagIdLength);
}

bool is_well_formed_tag_name(const std::string_view tag_name, const std::string_view prefix) {
  if (tag_name.size() != prefix.size() + 1 + kTagSuffixHexLength) {
    return false;
  }
  if (tag_name.substr(0, prefix.size()) != prefix || tag_name[prefix.size()] != '-') {
    return false;
  }
  for (const char ch : tag_name.substr(prefix.size() + 1)) {
    const bool lower_hex = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
    if (!lower_hex) {
      return false;
    }
  }
  return true;
}

}  // namespace lancet::security
