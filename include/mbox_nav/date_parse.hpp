#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mn {

// ISO-8601 subset: YYYY-MM-DD[(T| )HH:MM:SS[.fff]][Z|+hh:mm|-hh:mm].
// Returns epoch millis (UTC) on success.
std::optional<std::int64_t> parse_iso8601_ms(std::string_view s);

// Permissive mail date parser used for sorting: RFC 5322/822 dates with
// or without weekday, asctime dates, and the ISO subset above. Returns
// epoch seconds (UTC).
std::optional<std::int64_t> parse_mail_date(std::string_view s);

// "YYYY-MM-DD" of an epoch second value, in UTC.
std::string format_ymd(std::int64_t epoch_seconds);

// Month number 1..12 from an English month name or its 3-letter prefix.
int month_from_name(std::string_view name) noexcept;

}
