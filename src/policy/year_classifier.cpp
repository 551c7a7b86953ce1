#include "mbox_nav/year_classifier.hpp"
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>
#include <time.h>

namespace mn {

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::optional<YearLabel> find_century(std::string_view s, char c0, char c1) {
  for (std::size_t i = 0; i + 4 <= s.size(); ++i) {
    if (s[i] == c0 && s[i + 1] == c1 && is_digit(s[i + 2]) && is_digit(s[i + 3]))
      return YearLabel(s.substr(i, 4));
  }
  return std::nullopt;
}

std::optional<YearLabel> year_by_pattern(std::string_view text) {
  if (auto y = find_century(text, '2', '0')) return y;
  return find_century(text, '1', '9');
}

// strptime() that must consume the whole input.
static bool parses_fully(const std::string& s, const char* layout, std::tm& tm) {
  tm = std::tm{};
  const char* end = ::strptime(s.c_str(), layout, &tm);
  return end && *end == '\0';
}

// %Y in strptime also takes 1-3 digit years; a layout only counts when
// the year was written with exactly four digits.
static bool has_year_token(std::string_view s, std::string_view label) {
  for (std::size_t pos = s.find(label); pos != std::string_view::npos; pos = s.find(label, pos + 1)) {
    const bool left = pos == 0 || !is_digit(s[pos - 1]);
    const bool right = pos + label.size() == s.size() || !is_digit(s[pos + label.size()]);
    if (left && right) return true;
  }
  return false;
}

std::optional<YearLabel> year_by_layout(std::string_view text) {
  static constexpr std::array<const char*, 7> layouts = {
    "%a, %d %b %Y",
    "%d %b %Y",
    "%b %d %Y",
    "%Y-%m-%d",
    "%a, %d %b %Y %H:%M:%S",
    "%a %b %d %H:%M:%S %Y",
    "%d %b %Y %H:%M:%S",
  };
  static constexpr std::array<std::size_t, 3> prefixes = {25, 30, std::string_view::npos};

  for (const char* layout : layouts) {
    for (std::size_t len : prefixes) {
      std::string candidate(text.substr(0, len));
      std::tm tm{};
      if (!parses_fully(candidate, layout, tm)) continue;
      char buf[16];
      std::snprintf(buf, sizeof(buf), "%04d", tm.tm_year + 1900);
      if (!has_year_token(candidate, buf)) continue;
      return YearLabel(buf);
    }
  }
  return std::nullopt;
}

std::optional<YearLabel> year_by_bare_token(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    std::size_t start = i;
    while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    std::string_view tok = text.substr(start, i - start);
    if (tok.size() != 4) continue;
    bool digits = true;
    for (char c : tok) digits = digits && is_digit(c);
    if (digits) return YearLabel(tok);
  }
  return std::nullopt;
}

namespace {

struct Step {
  YearSource source;
  YearStrategy run;
};

// Cheapest and most format-agnostic first.
constexpr std::array<Step, 3> kChain = {{
  {YearSource::Pattern,   &year_by_pattern},
  {YearSource::Layout,    &year_by_layout},
  {YearSource::BareToken, &year_by_bare_token},
}};

}

YearMatch classify_year_traced(std::string_view date_text) {
  YearMatch m;
  if (date_text.empty()) return m;
  for (const Step& step : kChain) {
    if (auto y = step.run(date_text)) {
      m.year = std::move(y);
      m.source = step.source;
      return m;
    }
  }
  return m;
}

std::optional<YearLabel> classify_year(std::string_view date_text) {
  return classify_year_traced(date_text).year;
}

const char* to_string(YearSource s) noexcept {
  switch (s) {
    case YearSource::None:      return "none";
    case YearSource::Pattern:   return "pattern";
    case YearSource::Layout:    return "layout";
    case YearSource::BareToken: return "bare-token";
  }
  return "none";
}

}
