#include "mbox_nav/year_classifier.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct Case {
  const char* text;
  std::optional<std::string> year;
  mn::YearSource source;
};

int main() {
  using mn::YearSource;
  const std::vector<Case> cases = {
    {"Tue, 15 Mar 2022 10:00:00 -0700", std::string("2022"), YearSource::Pattern},
    {"garbled-2019-xx",                 std::string("2019"), YearSource::Pattern},
    {"Mon, 7 Jun 1999 08:00:00 GMT",    std::string("1999"), YearSource::Pattern},
    // 20dd is searched across the whole text before 19dd
    {"1 Jan 1999 (resent 2004)",        std::string("2004"), YearSource::Pattern},
    {"1 Jan 1850",                      std::string("1850"), YearSource::Layout},
    {"Fri, 02 Feb 1877",                std::string("1877"), YearSource::Layout},
    {"Sat Mar 3 10:11:12 1888",         std::string("1888"), YearSource::Layout},
    {"sometime in 1875 perhaps",        std::string("1875"), YearSource::BareToken},
    {"15 Mar 22",                       std::nullopt,        YearSource::None},
    {"no date info here",               std::nullopt,        YearSource::None},
    {"",                                std::nullopt,        YearSource::None},
  };

  int failures = 0;
  for (const auto& c : cases) {
    auto m = mn::classify_year_traced(c.text);
    if (m.year != c.year || m.source != c.source) {
      std::cerr << "[FAIL] '" << c.text << "': got " << (m.year ? *m.year : "none")
                << " via " << mn::to_string(m.source) << ", want " << (c.year ? *c.year : "none")
                << " via " << mn::to_string(c.source) << "\n";
      ++failures;
    }
    if (mn::classify_year(c.text) != c.year) {
      std::cerr << "[FAIL] classify_year disagrees with traced result for '" << c.text << "'\n";
      ++failures;
    }
  }

  // individual strategies
  if (mn::year_by_pattern("x19y") || *mn::year_by_pattern("a1987b2011") != "2011") {
    std::cerr << "[FAIL] year_by_pattern\n"; ++failures;
  }
  if (mn::year_by_bare_token("12345 abcd 99") || *mn::year_by_bare_token("v 0420 x") != "0420") {
    std::cerr << "[FAIL] year_by_bare_token\n"; ++failures;
  }
  if (auto y = mn::year_by_layout("1820-05-06"); !y || *y != "1820") {
    std::cerr << "[FAIL] year_by_layout ISO date\n"; ++failures;
  }

  if (failures) return 1;
  std::cout << "[PASS] year classifier: " << cases.size() << " cases\n";
  return 0;
}
