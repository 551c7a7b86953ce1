#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace mn {

// Four-digit textual year, e.g. "2022".
using YearLabel = std::string;

// A classification step: date header text in, year label or nothing out.
using YearStrategy = std::optional<YearLabel> (*)(std::string_view);

enum class YearSource { None, Pattern, Layout, BareToken };

// First "20dd" substring, else first "19dd" substring.
std::optional<YearLabel> year_by_pattern(std::string_view text);

// Fixed list of date layouts, each tried on the first 25 and 30
// characters and on the full text.
std::optional<YearLabel> year_by_layout(std::string_view text);

// First whitespace-delimited token made of exactly four digits.
std::optional<YearLabel> year_by_bare_token(std::string_view text);

struct YearMatch {
  std::optional<YearLabel> year;
  YearSource source = YearSource::None;
};

// Runs the strategies left to right and stops at the first hit.
// Empty text, or text no strategy recognizes, yields nullopt; this is an
// ordinary outcome, not an error.
std::optional<YearLabel> classify_year(std::string_view date_text);

// Same as classify_year, also reporting which strategy matched.
YearMatch classify_year_traced(std::string_view date_text);

const char* to_string(YearSource s) noexcept;

}
