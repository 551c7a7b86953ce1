#pragma once
#include <string>
#include <string_view>

namespace mn {

inline constexpr std::string_view kNoPlainTextBody = "[No plain-text body found]";

// Plain-text body for display. Multipart messages yield their first
// text/plain part that is not an attachment; single-part messages yield
// their whole body. Transfer encodings are undone and the text converted
// to UTF-8 where the charset allows it.
std::string extract_plain_body(std::string_view message);

}
