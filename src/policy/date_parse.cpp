#include "mbox_nav/date_parse.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <ctime>
#include <string_view>
#include <vector>

// Calendar math goes through timegm(); every parser validates its
// fields first so timegm never normalizes an impossible date.

namespace mn {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty() || s.size() > 9) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static bool valid_ymd(int Y, int M, int D) {
  static constexpr int days[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (M < 1 || M > 12 || D < 1) return false;
  int dim = days[M-1] + ((M == 2 && is_leap(Y)) ? 1 : 0);
  return D <= dim;
}

static bool valid_hms(int h, int m, int s) {
  return h >= 0 && h <= 23 && m >= 0 && m <= 59 && s >= 0 && s <= 60;  // 60: leap second
}

static std::optional<std::int64_t> to_epoch(int Y, int M, int D, int h, int m, int s) {
  if (!valid_ymd(Y, M, D) || !valid_hms(h, m, s)) return std::nullopt;
  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = s;
#if defined(_WIN32)
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == (std::time_t)-1 && !(Y == 1969 && M == 12 && D == 31)) return std::nullopt;
  return static_cast<std::int64_t>(t);
}

int month_from_name(std::string_view name) noexcept {
  static constexpr std::array<std::string_view, 12> full = {
    "january","february","march","april","may","june",
    "july","august","september","october","november","december"};
  if (name.size() < 3) return 0;
  for (int i = 0; i < 12; ++i) {
    if (name.size() == 3 && ieq(name, full[i].substr(0, 3))) return i + 1;
    if (ieq(name, full[i])) return i + 1;
  }
  if (ieq(name, "sept")) return 9;
  return 0;
}

static bool is_weekday(std::string_view w) {
  static constexpr std::string_view days[] = {
    "monday","tuesday","wednesday","thursday","friday","saturday","sunday"};
  for (auto d : days) if (ieq(w, d.substr(0, 3)) || ieq(w, d)) return true;
  return false;
}

std::optional<std::int64_t> parse_iso8601_ms(std::string_view s) {
  // Expected forms:
  // YYYY-MM-DD
  // YYYY-MM-DDTHH:MM:SS
  // YYYY-MM-DDTHH:MM:SS.mmm
  // optionally followed by Z or a +hh:mm / -hh:mm / +hhmm offset

  if (s.size() < 10) return std::nullopt;
  int Y,M,D,h=0,m=0,sec=0,ms=0;

  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;

  size_t i = 10;
  if (i < s.size() && (s[i]=='T' || s[i]==' ')) {
    ++i;
    if (i+8 <= s.size()) {
      if (!(parse_int(s.substr(i,2), h) && s[i+2]==':' && parse_int(s.substr(i+3,2), m) && s[i+5]==':' && parse_int(s.substr(i+6,2), sec)))
        return std::nullopt;
      i += 8;
      if (i < s.size() && s[i]=='.') {
        size_t j=i+1, k=j;
        while (k < s.size() && is_digit(s[k])) ++k;
        int frac=0; if (k==j || !parse_int(s.substr(j,std::min<size_t>(k-j,3)), frac)) return std::nullopt;
        if ((k-j)==1) ms = frac*100;
        else if ((k-j)==2) ms = frac*10;
        else ms = frac;
        i = k;
      }
    } else {
      return std::nullopt;
    }
  }

  int offset_min = 0;
  if (i < s.size()) {
    if (s[i]=='Z' || s[i]=='z') {
      ++i;
    } else if (s[i]=='+' || s[i]=='-') {
      const int sign = (s[i]=='-') ? -1 : 1;
      std::string_view off = s.substr(i+1);
      int oh=0, om=0;
      if (off.size() >= 5 && off[2]==':' && parse_int(off.substr(0,2), oh) && parse_int(off.substr(3,2), om)) i += 6;
      else if (off.size() >= 4 && parse_int(off.substr(0,4), oh)) { om = oh % 100; oh /= 100; i += 5; }
      else return std::nullopt;
      offset_min = sign * (oh*60 + om);
    }
    if (i != s.size()) return std::nullopt;
  }

  auto t = to_epoch(Y, M, D, h, m, sec);
  if (!t) return std::nullopt;
  return (*t - offset_min * 60) * 1000 + ms;
}

namespace {

// Whitespace/comma separated tokens with "(...)" comments removed.
std::vector<std::string_view> tokenize(std::string_view s) {
  std::vector<std::string_view> out;
  int depth = 0;
  size_t start = std::string_view::npos;
  for (size_t i = 0; i <= s.size(); ++i) {
    char c = (i < s.size()) ? s[i] : ' ';
    bool sep = std::isspace((unsigned char)c) || c == ',' || c == '(' || c == ')' || depth > 0;
    if (c == '(') ++depth;
    else if (c == ')' && depth > 0) { --depth; sep = true; }
    if (sep) {
      if (start != std::string_view::npos) { out.push_back(s.substr(start, i - start)); start = std::string_view::npos; }
    } else if (start == std::string_view::npos) {
      start = i;
    }
  }
  return out;
}

bool parse_time(std::string_view t, int& h, int& m, int& s) {
  h = m = s = 0;
  auto c1 = t.find(':');
  if (c1 == std::string_view::npos) return false;
  auto c2 = t.find(':', c1 + 1);
  if (!parse_int(t.substr(0, c1), h)) return false;
  if (c2 == std::string_view::npos) return parse_int(t.substr(c1 + 1), m);
  std::string_view sec = t.substr(c2 + 1);
  if (auto dot = sec.find('.'); dot != std::string_view::npos) sec = sec.substr(0, dot);
  return parse_int(t.substr(c1 + 1, c2 - c1 - 1), m) && parse_int(sec, s);
}

// Offset in minutes east of UTC.
std::optional<int> parse_zone(std::string_view z) {
  if (z.size() == 5 && (z[0] == '+' || z[0] == '-')) {
    int v = 0;
    if (!parse_int(z.substr(1), v)) return std::nullopt;
    int mins = (v / 100) * 60 + v % 100;
    return z[0] == '-' ? -mins : mins;
  }
  struct Named { std::string_view name; int offset; };
  static constexpr Named zones[] = {
    {"UT", 0}, {"UTC", 0}, {"GMT", 0}, {"Z", 0},
    {"EST", -300}, {"EDT", -240}, {"CST", -360}, {"CDT", -300},
    {"MST", -420}, {"MDT", -360}, {"PST", -480}, {"PDT", -420}};
  for (auto& n : zones) if (ieq(z, n.name)) return n.offset;
  return std::nullopt;
}

int expand_year(int y, size_t digits) {
  if (digits == 2) return y < 50 ? 2000 + y : 1900 + y;
  if (digits == 3) return 1900 + y;
  return y;
}

std::optional<std::int64_t> parse_rfc_like(std::string_view s) {
  auto toks = tokenize(s);
  size_t i = 0;
  if (i < toks.size() && is_weekday(toks[i])) ++i;

  int month = 0, h = 0, m = 0, sec = 0, zone = 0;
  bool have_time = false, have_zone = false;
  std::vector<std::string_view> numbers;

  for (; i < toks.size(); ++i) {
    std::string_view t = toks[i];
    if (!month) {
      if (int mo = month_from_name(t)) { month = mo; continue; }
      // "15-Mar-2022"
      auto d1 = t.find('-');
      auto d2 = (d1 == std::string_view::npos) ? d1 : t.find('-', d1 + 1);
      if (d2 != std::string_view::npos && d1 > 0) {
        if (int mo = month_from_name(t.substr(d1 + 1, d2 - d1 - 1))) {
          month = mo;
          numbers.push_back(t.substr(0, d1));
          numbers.push_back(t.substr(d2 + 1));
          continue;
        }
      }
    }
    if (!have_time && t.find(':') != std::string_view::npos) {
      if (!parse_time(t, h, m, sec)) return std::nullopt;
      have_time = true;
      continue;
    }
    if ((t[0] == '+' || t[0] == '-') && t.size() == 5) {
      auto z = parse_zone(t);
      if (!z) return std::nullopt;
      if (!have_zone) { zone = *z; have_zone = true; }
      continue;
    }
    if (is_digit(t[0])) {
      if (numbers.size() == 2) return std::nullopt;
      numbers.push_back(t);
      continue;
    }
    // first zone wins: "-0700 GMT" keeps the numeric offset
    if (auto z = parse_zone(t)) {
      if (!have_zone) { zone = *z; have_zone = true; }
      continue;
    }
    // unknown trailing word: tolerated only after the date is complete
    if (month && numbers.size() == 2) continue;
    return std::nullopt;
  }

  if (!month || numbers.size() != 2) return std::nullopt;
  // day is the number closest to the month name in either layout
  // ("15 Mar 2022", "Mar 15 10:00:00 2022", "Mar 15, 2022")
  int day = 0, year = 0;
  if (!parse_int(numbers[0], day) || !parse_int(numbers[1], year)) return std::nullopt;
  if (numbers[0].size() == 4 && numbers[1].size() <= 2) {  // "2022 Mar 15"
    std::swap(day, year);
    year = expand_year(year, numbers[0].size());
  } else {
    year = expand_year(year, numbers[1].size());
  }

  auto t = to_epoch(year, month, day, h, m, sec);
  if (!t) return std::nullopt;
  return *t - static_cast<std::int64_t>(zone) * 60;
}

}

std::optional<std::int64_t> parse_mail_date(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  if (s.size() >= 10 && is_digit(s[0]) && s[4] == '-') {
    if (auto ms = parse_iso8601_ms(s)) return *ms / 1000 - ((*ms % 1000 < 0) ? 1 : 0);
    return std::nullopt;
  }
  return parse_rfc_like(s);
}

std::string format_ymd(std::int64_t epoch_seconds) {
  std::time_t t = static_cast<std::time_t>(epoch_seconds);
  std::tm tm{};
  if (!gmtime_r(&t, &tm)) return std::string();
  char buf[16];
  std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return std::string(buf, n);
}

}
