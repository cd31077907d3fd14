#pragma once

#include <string>
#include <string_view>

namespace lancet::security {

// decode_html_entities decodes HTML character references in a single linear pass:
//   &#DDDD;  &#xHHHH;  named references (&lt; &amp; &zwj; ...)
//   and the legacy unterminated forms &lt &gt &amp &quot.
// Numeric references to NUL, surrogates or values above U+10FFFF decode to U+FFFD.
// Unknown references are left untouched. A reference that decodes to '&' is read again together
// with the text after it, so nested escapes such as "&amp;amp;lt;" decode all the way down.
[[nodiscard]] std::u32string decode_html_entities(std::u32string_view text);

}  // namespace lancet::security
