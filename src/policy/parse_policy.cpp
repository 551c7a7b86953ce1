#include "mbox_nav/parse_policy.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>

namespace mn {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::optional<double> parse_number(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  double out = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::size_t> parse_count(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  for (char c : s) if (c < '0' || c > '9') return std::nullopt;
  auto v = parse_number(s);
  if (!v || !std::isfinite(*v) || *v > static_cast<double>(std::numeric_limits<std::size_t>::max() / 2))
    return std::nullopt;
  return static_cast<std::size_t>(*v);
}

bool is_year_label(std::string_view s) noexcept {
  if (s.size() != 4) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

}
