#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mn {

// Decode RFC 2047 encoded words ("=?charset?B|Q?...?=") into UTF-8.
// Never fails: when any encoded word is malformed or its charset cannot
// be converted, the raw text comes back unchanged and *fell_back is set.
std::string decode_header(std::string_view raw, bool* fell_back = nullptr);

// Absent header -> empty string.
std::string decode_header(const std::optional<std::string>& raw, bool* fell_back = nullptr);

inline std::string decode_header(const std::string& raw, bool* fell_back = nullptr) {
  return decode_header(std::string_view(raw), fell_back);
}
inline std::string decode_header(const char* raw, bool* fell_back = nullptr) {
  return decode_header(std::string_view(raw), fell_back);
}

// Transfer codecs, shared with body extraction. `strict` base64 rejects
// characters outside the alphabet; lenient mode skips them.
bool decode_base64(std::string_view in, std::string& out, bool strict = true);
bool decode_q_word(std::string_view in, std::string& out);
std::string decode_quoted_printable(std::string_view in);

// Convert bytes in `charset` to UTF-8 via iconv. UTF-8 and ASCII pass
// through untouched.
bool convert_to_utf8(std::string_view charset, std::string_view bytes, std::string& out);

}
