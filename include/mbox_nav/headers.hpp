#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mn {

class MetricsRegistry;

// Decoded text of the headers the navigator and splitter care about.
struct HeaderSet {
  std::string from;
  std::string to;
  std::string cc;
  std::string date;
  std::string subject;
};

// Header block of an RFC 822 message (up to, not including, the first
// empty line).
std::string_view header_block(std::string_view message);

// Body: everything after the first empty line.
std::string_view message_body(std::string_view message);

// First occurrence of `name` (case-insensitive), unfolded, leading
// whitespace trimmed. nullopt if the header is absent.
std::optional<std::string> find_header(std::string_view message, std::string_view name);

// Decodes From/To/Cc/Date/Subject. Fallbacks are counted per field when
// `metrics` is given.
HeaderSet read_headers(std::string_view message, MetricsRegistry* metrics = nullptr);

// Value of a parameter in a structured header such as Content-Type
// ("boundary", "charset"). Quotes are removed.
std::optional<std::string> header_param(std::string_view value, std::string_view param);

}
